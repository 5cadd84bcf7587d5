#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>

namespace botfarm {

namespace {

std::vector<double> trueRanges(const std::vector<double>& high, const std::vector<double>& low,
                               const std::vector<double>& close) {
    const std::size_t n = close.size();
    std::vector<double> tr(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        if (i == 0) {
            tr[i] = high[i] - low[i];
            continue;
        }
        tr[i] = std::max({high[i] - low[i],
                          std::abs(high[i] - close[i - 1]),
                          std::abs(low[i] - close[i - 1])});
    }
    return tr;
}

double wilder(double prev, double value, int period) {
    return (prev * (period - 1) + value) / period;
}

} // namespace

Series ema(const std::vector<double>& values, int period) {
    if (period <= 1)
        return Series(values.begin(), values.end());

    const std::size_t n = values.size();
    const std::size_t p = static_cast<std::size_t>(period);
    Series out(n);
    if (n < p) return out;

    const double k = 2.0 / (period + 1.0);
    double sum = 0;
    for (std::size_t i = 0; i < p; ++i) sum += values[i];
    double prev = sum / period;
    out[p - 1] = prev;

    for (std::size_t i = p; i < n; ++i) {
        prev = values[i] * k + prev * (1.0 - k);
        out[i] = prev;
    }
    return out;
}

Series atr(const std::vector<double>& high, const std::vector<double>& low,
           const std::vector<double>& close, int period) {
    const std::size_t n = close.size();
    Series out(n);
    if (period < 1 || n < static_cast<std::size_t>(period)) return out;

    const std::size_t p = static_cast<std::size_t>(period);
    std::vector<double> tr = trueRanges(high, low, close);
    double sum = 0;
    for (std::size_t i = 0; i < p; ++i) sum += tr[i];
    double prev = sum / period;
    out[p - 1] = prev;

    for (std::size_t i = p; i < n; ++i) {
        prev = wilder(prev, tr[i], period);
        out[i] = prev;
    }
    return out;
}

Series rsi(const std::vector<double>& close, int period) {
    const std::size_t n = close.size();
    Series out(n);
    if (period < 1 || n < static_cast<std::size_t>(period) + 1) return out;

    const std::size_t p = static_cast<std::size_t>(period);
    auto value = [](double avg_gain, double avg_loss) {
        double rs = (avg_loss == 0) ? 100.0 : avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    double gain_sum = 0;
    double loss_sum = 0;
    for (std::size_t i = 1; i <= p; ++i) {
        double delta = close[i] - close[i - 1];
        if (delta > 0) gain_sum += delta;
        else loss_sum -= delta;
    }
    double avg_gain = gain_sum / period;
    double avg_loss = loss_sum / period;
    out[p] = value(avg_gain, avg_loss);

    for (std::size_t i = p + 1; i < n; ++i) {
        double delta = close[i] - close[i - 1];
        avg_gain = wilder(avg_gain, delta > 0 ? delta : 0.0, period);
        avg_loss = wilder(avg_loss, delta < 0 ? -delta : 0.0, period);
        out[i] = value(avg_gain, avg_loss);
    }
    return out;
}

Series adx(const std::vector<double>& high, const std::vector<double>& low,
           const std::vector<double>& close, int period) {
    const std::size_t n = close.size();
    Series out(n);
    if (period < 1 || n < 2 * static_cast<std::size_t>(period)) return out;

    const std::size_t p = static_cast<std::size_t>(period);
    std::vector<double> tr = trueRanges(high, low, close);
    std::vector<double> plus_dm(n, 0.0);
    std::vector<double> minus_dm(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        double up = high[i] - high[i - 1];
        double down = low[i - 1] - low[i];
        if (up > down && up > 0) plus_dm[i] = up;
        if (down > up && down > 0) minus_dm[i] = down;
    }

    // Wilder-smoothed sums, first available at index p-1.
    double s_tr = 0, s_plus = 0, s_minus = 0;
    for (std::size_t i = 0; i < p; ++i) {
        s_tr += tr[i];
        s_plus += plus_dm[i];
        s_minus += minus_dm[i];
    }

    auto dx = [](double sp, double sm, double st) {
        if (st <= 0) return 0.0;
        double plus_di = 100.0 * sp / st;
        double minus_di = 100.0 * sm / st;
        double di_sum = plus_di + minus_di;
        return di_sum > 0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
    };

    std::vector<double> dx_values(n, 0.0);
    dx_values[p - 1] = dx(s_plus, s_minus, s_tr);
    for (std::size_t i = p; i < n; ++i) {
        s_tr = s_tr - s_tr / period + tr[i];
        s_plus = s_plus - s_plus / period + plus_dm[i];
        s_minus = s_minus - s_minus / period + minus_dm[i];
        dx_values[i] = dx(s_plus, s_minus, s_tr);
    }

    const std::size_t seed_index = 2 * p - 2;
    double sum = 0;
    for (std::size_t i = p - 1; i <= seed_index; ++i) sum += dx_values[i];
    double prev = sum / period;
    out[seed_index] = prev;
    for (std::size_t i = seed_index + 1; i < n; ++i) {
        prev = wilder(prev, dx_values[i], period);
        out[i] = prev;
    }
    return out;
}

Series rollingMean(const Series& input, int window) {
    Series out(input.size());
    if (window < 1) return out;

    std::deque<double> recent;
    double sum = 0;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (!input[i]) continue;
        recent.push_back(*input[i]);
        sum += *input[i];
        if (recent.size() > static_cast<std::size_t>(window)) {
            sum -= recent.front();
            recent.pop_front();
        }
        if (recent.size() == static_cast<std::size_t>(window))
            out[i] = sum / window;
    }
    return out;
}

SupertrendBands supertrend(const std::vector<double>& high, const std::vector<double>& low,
                           const std::vector<double>& close, int period, double multiplier) {
    const std::size_t n = close.size();
    SupertrendBands bands{Series(n), Series(n)};
    Series range = atr(high, low, close, period);
    if (period < 1 || n < static_cast<std::size_t>(period)) return bands;

    const std::size_t start = static_cast<std::size_t>(period) - 1;
    double final_upper = 0;
    double final_lower = 0;
    bool uptrend = true;

    for (std::size_t i = start; i < n; ++i) {
        double mid = (high[i] + low[i]) / 2.0;
        double basic_upper = mid + multiplier * *range[i];
        double basic_lower = mid - multiplier * *range[i];

        if (i == start) {
            final_upper = basic_upper;
            final_lower = basic_lower;
        } else {
            double prev_close = close[i - 1];
            // Bands only tighten unless the previous close broke through them.
            if (basic_upper < final_upper || prev_close > final_upper) final_upper = basic_upper;
            if (basic_lower > final_lower || prev_close < final_lower) final_lower = basic_lower;
        }

        if (uptrend && close[i] < final_lower) uptrend = false;
        else if (!uptrend && close[i] > final_upper) uptrend = true;

        if (uptrend) bands.up[i] = final_lower;
        else bands.down[i] = final_upper;
    }
    return bands;
}

} // namespace botfarm
