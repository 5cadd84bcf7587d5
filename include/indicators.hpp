#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace botfarm {

/// Indicator output aligned 1:1 with the input bars. Warm-up entries are nullopt.
using Series = std::vector<std::optional<double>>;

/// Exponential moving average. period <= 1 returns the input unchanged.
/// Seeded with the simple mean of the first `period` values at index period-1.
Series ema(const std::vector<double>& values, int period);

/// Wilder average true range. Seed (mean of first `period` true ranges) at index period-1.
Series atr(const std::vector<double>& high, const std::vector<double>& low,
           const std::vector<double>& close, int period);

/// Wilder RSI. First value at index `period`. A zero average loss uses RS = 100.
Series rsi(const std::vector<double>& close, int period);

/// Wilder ADX. All undefined with fewer than 2*period bars; first value at index 2*period-2.
Series adx(const std::vector<double>& high, const std::vector<double>& low,
           const std::vector<double>& close, int period);

/// Simple mean of the last `window` defined values of `input`.
Series rollingMean(const Series& input, int window);

/// SuperTrend split into the lower band while trending up and the upper band while trending down.
/// From index period-1 on exactly one of the two is defined.
struct SupertrendBands {
    Series up;
    Series down;
};

SupertrendBands supertrend(const std::vector<double>& high, const std::vector<double>& low,
                           const std::vector<double>& close, int period, double multiplier);

/// Named indicator series prepared once per run, plus scalar entry filters
/// (gate thresholds) a strategy needs when only the indicators are passed.
struct IndicatorSet {
    std::map<std::string, Series> series;
    std::map<std::string, double> filters;

    /// Throws std::out_of_range for an unknown name.
    const Series& at(const std::string& name) const { return series.at(name); }

    double filter(const std::string& name, double fallback) const {
        auto it = filters.find(name);
        return it != filters.end() ? it->second : fallback;
    }
};

} // namespace botfarm
