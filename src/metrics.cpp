#include "metrics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <map>
#include <numeric>

namespace botfarm {

namespace {
    constexpr std::size_t MIN_OOS_OBSERVATIONS = 20;
    constexpr double IN_SAMPLE_FRACTION = 0.8;
    constexpr double INSUFFICIENT_OOS = 100.0;

    double compounded(std::vector<double>::const_iterator first, std::vector<double>::const_iterator last) {
        double growth = 1.0;
        for (auto it = first; it != last; ++it) growth *= 1.0 + *it;
        return growth - 1.0;
    }
}

double barsPerYear(const std::string& timeframe) {
    static const std::map<std::string, double> table = {
        {"1m", 525600}, {"5m", 105120}, {"15m", 35040}, {"30m", 17520},
        {"1h", 8760}, {"4h", 2190}, {"1d", 365},
    };
    std::string key = timeframe;
    for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    auto it = table.find(key);
    return it != table.end() ? it->second : 8760;
}

double totalReturnPct(const std::vector<double>& equity_curve) {
    if (equity_curve.empty()) return 0;
    return (equity_curve.back() - 1.0) * 100.0;
}

double maxDrawdownPct(const std::vector<double>& equity_curve) {
    if (equity_curve.empty()) return 0;
    double peak = equity_curve[0];
    double max_dd = 0;
    for (double eq : equity_curve) {
        if (eq > peak) peak = eq;
        if (peak <= 0) continue;
        double dd = (peak - eq) / peak * 100.0;
        if (dd > max_dd) max_dd = dd;
    }
    return max_dd;
}

double sharpeRatio(const std::vector<double>& returns, const std::string& timeframe) {
    if (returns.empty()) return 0;
    const double n = static_cast<double>(returns.size());
    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
    double sq_sum = 0;
    for (double r : returns) sq_sum += (r - mean) * (r - mean);
    double stddev = std::sqrt(sq_sum / n);
    return (stddev > 0) ? (mean / stddev) * std::sqrt(barsPerYear(timeframe)) : 0;
}

double oosDegradationPct(const std::vector<double>& returns) {
    const std::size_t n = returns.size();
    if (n < MIN_OOS_OBSERVATIONS) return INSUFFICIENT_OOS;

    const auto split = static_cast<std::ptrdiff_t>(static_cast<double>(n) * IN_SAMPLE_FRACTION);
    double is_total = compounded(returns.begin(), returns.begin() + split);
    double oos_total = compounded(returns.begin() + split, returns.end());
    if (is_total <= 0) return INSUFFICIENT_OOS;

    double degradation = (is_total - oos_total) / std::abs(is_total) * 100.0;
    return std::max(0.0, degradation);
}

Metrics computeMetrics(const std::vector<double>& equity_curve, const std::vector<double>& returns,
                       const std::string& timeframe) {
    Metrics m;
    m.total_return_pct = totalReturnPct(equity_curve);
    m.sharpe = sharpeRatio(returns, timeframe);
    m.max_drawdown_pct = maxDrawdownPct(equity_curve);
    m.oos_degradation_pct = oosDegradationPct(returns);
    return m;
}

} // namespace botfarm
