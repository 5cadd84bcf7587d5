#pragma once

#include <string>
#include <vector>

namespace botfarm {

/// Run metrics. Percentages are in percent units (25.0 == 25%).
struct Metrics {
    double total_return_pct{0};
    double sharpe{0};
    double max_drawdown_pct{0};
    double oos_degradation_pct{0};
};

/// Worst-case metrics returned for runs that could not be simulated.
inline Metrics failedMetrics() { return Metrics{-100.0, 0.0, 100.0, 100.0}; }

/// Annualization factor by timeframe code ("1m" .. "1d"); unknown codes use the hourly value.
double barsPerYear(const std::string& timeframe);

/// (final equity - 1) * 100 for a curve starting at 1.0; 0 for an empty curve.
double totalReturnPct(const std::vector<double>& equity_curve);

/// Largest peak-to-trough decline in percent.
double maxDrawdownPct(const std::vector<double>& equity_curve);

/// mean / population stddev * sqrt(bars per year); 0 when the stddev is 0.
double sharpeRatio(const std::vector<double>& returns, const std::string& timeframe);

/// Compounded return falloff from the first 80% of returns to the last 20%.
/// 100 when fewer than 20 returns or the in-sample return is not positive; never below 0.
double oosDegradationPct(const std::vector<double>& returns);

Metrics computeMetrics(const std::vector<double>& equity_curve, const std::vector<double>& returns,
                       const std::string& timeframe);

} // namespace botfarm
