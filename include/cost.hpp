#pragma once

#include <map>
#include <optional>
#include <string>

namespace botfarm {

class Strategy;

/// Fee and slippage in basis points per side; unset means "not configured here".
struct CostRates {
    std::optional<double> fee_bps_per_side;
    std::optional<double> slippage_bps_per_side;

    bool configured() const { return fee_bps_per_side || slippage_bps_per_side; }
};

/// Default rates plus per-market overrides (keys lower-case, e.g. "forex").
struct CostConfig {
    CostRates defaults;
    std::map<std::string, CostRates> market_costs;
};

/// Resolved per-side cost for one run.
struct CostProfile {
    double fee_bps_per_side{0};
    double slippage_bps_per_side{0};
    double fee_fraction{0};
    double slippage_fraction{0};
    double per_side_cost_fraction{0};
    std::string source;   // "config" or "strategy_default"
};

/// Market entries override the default field by field. With nothing configured for
/// either field, the strategy's default_trade_cost is used as the whole per-side cost.
CostProfile resolveCostProfile(const CostConfig& config, const std::string& market,
                               const std::string& timeframe, const Strategy& strategy);

/// Profile from explicit bps values (fee + slippage) / 10000.
CostProfile costFromBps(double fee_bps, double slippage_bps);

} // namespace botfarm
