#pragma once

#include "bar.hpp"
#include "indicators.hpp"
#include "params.hpp"
#include "position.hpp"
#include <string>
#include <vector>

namespace botfarm {

/// SuperTrend reversal confirmed by RSI momentum, EMA bias and ADX trend strength.
/// LONG: SuperTrend turns up, RSI > 50, close > EMA, ADX >= min_adx (all on the completed previous bar).
/// SHORT: the mirror image. Any SuperTrend reversal against the position forces an exit.
class SupertrendRsiStrategy {
public:
    static constexpr const char* kId = "supertrend_rsi";
    static constexpr const char* kDisplayName = "SuperTrend + RSI Momentum";
    static constexpr int kAdxPeriod = 14;

    Candidate sampleParams(int iteration) const;
    Candidate normalizeParams(const Candidate& params, std::size_t bar_count) const;
    IndicatorSet prepareIndicators(const std::vector<Bar>& bars, const Candidate& params) const;
    Signal entrySignal(std::size_t i, const std::vector<Bar>& bars, const IndicatorSet& ind) const;
    bool shouldFlip(std::size_t i, Side side, const std::vector<Bar>& bars, const IndicatorSet& ind) const;
    RiskLevels riskLevels(std::size_t i, Side side, double entry_price, const std::vector<Bar>& bars,
                          const IndicatorSet& ind, const Candidate& params) const;

    /// Per-side cost by market: forex 1bp, crypto 5bp, indices 2bp, commodities 3bp, equities 2.5bp.
    double defaultTradeCost(const std::string& market, const std::string& timeframe) const;
};

} // namespace botfarm
