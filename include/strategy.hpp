#pragma once

#include "bar.hpp"
#include "indicators.hpp"
#include "params.hpp"
#include "position.hpp"
#include "ema_cross_atr_strategy.hpp"
#include "supertrend_rsi_strategy.hpp"
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace botfarm {

/// A trading strategy, one of a closed set of variants selected by id.
/// Every variant provides the same members; the simulator only talks to this wrapper.
class Strategy {
public:
    using Variant = std::variant<EmaCrossAtrStrategy, SupertrendRsiStrategy>;

    explicit Strategy(Variant impl) : impl_(std::move(impl)) {}

    std::string id() const {
        return std::visit([](const auto& s) { return std::string(std::decay_t<decltype(s)>::kId); }, impl_);
    }
    std::string displayName() const {
        return std::visit([](const auto& s) { return std::string(std::decay_t<decltype(s)>::kDisplayName); }, impl_);
    }

    /// Fallback candidate used when no parameter space is configured.
    Candidate sampleParams(int iteration) const {
        return std::visit([&](const auto& s) { return s.sampleParams(iteration); }, impl_);
    }

    /// Clamp/repair so indicator periods fit `bar_count`; returns a new candidate.
    Candidate normalizeParams(const Candidate& params, std::size_t bar_count) const {
        return std::visit([&](const auto& s) { return s.normalizeParams(params, bar_count); }, impl_);
    }

    IndicatorSet prepareIndicators(const std::vector<Bar>& bars, const Candidate& params) const {
        return std::visit([&](const auto& s) { return s.prepareIndicators(bars, params); }, impl_);
    }

    Signal entrySignal(std::size_t i, const std::vector<Bar>& bars, const IndicatorSet& ind) const {
        return std::visit([&](const auto& s) { return s.entrySignal(i, bars, ind); }, impl_);
    }

    /// Signal-based forced exit for an open position on bar i.
    bool shouldFlip(std::size_t i, Side side, const std::vector<Bar>& bars, const IndicatorSet& ind) const {
        return std::visit([&](const auto& s) { return s.shouldFlip(i, side, bars, ind); }, impl_);
    }

    RiskLevels riskLevels(std::size_t i, Side side, double entry_price, const std::vector<Bar>& bars,
                          const IndicatorSet& ind, const Candidate& params) const {
        return std::visit([&](const auto& s) { return s.riskLevels(i, side, entry_price, bars, ind, params); }, impl_);
    }

    /// Fractional per-side cost used when no fee/slippage is configured.
    double defaultTradeCost(const std::string& market, const std::string& timeframe) const {
        return std::visit([&](const auto& s) { return s.defaultTradeCost(market, timeframe); }, impl_);
    }

private:
    Variant impl_;
};

/// Look up a strategy by id (e.g. "ema_cross_atr"). nullopt if unknown.
std::optional<Strategy> findStrategy(const std::string& id);

/// (id, display name) for every registered strategy, sorted by id.
std::vector<std::pair<std::string, std::string>> listStrategies();

} // namespace botfarm
