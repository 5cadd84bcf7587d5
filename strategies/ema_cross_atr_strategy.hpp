#pragma once

#include "bar.hpp"
#include "indicators.hpp"
#include "params.hpp"
#include "position.hpp"
#include <string>
#include <vector>

namespace botfarm {

/// EMA fast/slow crossover with ATR-based stop and take.
/// Long on a bullish cross, short on a bearish cross; the opposite cross forces an exit.
/// Entries are gated on the previous bar: RSI must confirm momentum (>= rsi_gate for longs,
/// <= 100 - rsi_gate for shorts) and ATR / mean ATR must not exceed atr_vol_ratio_max.
class EmaCrossAtrStrategy {
public:
    static constexpr const char* kId = "ema_cross_atr";
    static constexpr const char* kDisplayName = "EMA Cross ATR Bot";

    Candidate sampleParams(int iteration) const;
    Candidate normalizeParams(const Candidate& params, std::size_t bar_count) const;
    IndicatorSet prepareIndicators(const std::vector<Bar>& bars, const Candidate& params) const;
    Signal entrySignal(std::size_t i, const std::vector<Bar>& bars, const IndicatorSet& ind) const;
    bool shouldFlip(std::size_t i, Side side, const std::vector<Bar>& bars, const IndicatorSet& ind) const;
    RiskLevels riskLevels(std::size_t i, Side side, double entry_price, const std::vector<Bar>& bars,
                          const IndicatorSet& ind, const Candidate& params) const;
    double defaultTradeCost(const std::string& market, const std::string& timeframe) const;

private:
    static Signal crossover(std::size_t i, const IndicatorSet& ind);
};

} // namespace botfarm
