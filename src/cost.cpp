#include "cost.hpp"
#include "strategy.hpp"
#include <cctype>

namespace botfarm {

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

CostProfile costFromBps(double fee_bps, double slippage_bps) {
    CostProfile p;
    p.fee_bps_per_side = fee_bps;
    p.slippage_bps_per_side = slippage_bps;
    p.fee_fraction = fee_bps / 10000.0;
    p.slippage_fraction = slippage_bps / 10000.0;
    p.per_side_cost_fraction = p.fee_fraction + p.slippage_fraction;
    p.source = "config";
    return p;
}

CostProfile resolveCostProfile(const CostConfig& config, const std::string& market,
                               const std::string& timeframe, const Strategy& strategy) {
    const std::string key = lower(market);
    CostRates market_rates;
    auto it = config.market_costs.find(key);
    if (it != config.market_costs.end()) market_rates = it->second;

    if (!market_rates.configured() && !config.defaults.configured()) {
        double cost = strategy.defaultTradeCost(key, timeframe);
        CostProfile p = costFromBps(cost * 10000.0, 0.0);
        p.source = "strategy_default";
        return p;
    }

    double fee = market_rates.fee_bps_per_side.value_or(config.defaults.fee_bps_per_side.value_or(0.0));
    double slippage = market_rates.slippage_bps_per_side.value_or(config.defaults.slippage_bps_per_side.value_or(0.0));
    return costFromBps(fee, slippage);
}

} // namespace botfarm
