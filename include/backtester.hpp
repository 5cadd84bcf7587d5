#pragma once

#include "bar.hpp"
#include "cost.hpp"
#include "data_source.hpp"
#include "metrics.hpp"
#include "params.hpp"
#include "position.hpp"
#include "strategy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace botfarm {

/// Fewer bars than this and a run is reported as failed.
constexpr std::size_t MIN_BARS = 12;

/// Outcome of one simulation. Failures carry status "failed", a reason and failedMetrics().
struct BacktestResult {
    std::string status{"failed"};
    std::string reason;
    std::string strategy_id;
    DatasetInfo dataset;
    std::size_t bars_count{0};
    Candidate params_requested;
    Candidate params_effective;   // after normalizeParams
    CostProfile cost_profile;
    std::vector<Trade> trades;
    std::vector<double> equity_curve;
    std::vector<double> returns;
    std::optional<Position> open_position;   // still open after the last bar
    double win_rate_pct{0};
    Metrics metrics{failedMetrics()};

    bool ok() const { return status == "ok"; }
};

/// Runs one strategy/candidate over a dataset, bar by bar (bar 0 only seeds indicators):
///   1. in a position: stop-loss, then take-profit, then shouldFlip; any of them closes it.
///   2. flat (including right after a close on this bar): entrySignal may open at the close.
///   3. equity *= 1 + bar return.
/// A run never throws for data problems; it returns a failed result instead.
class Backtester {
public:
    Backtester(Strategy strategy, Candidate params, CostConfig costs = CostConfig{});

    /// Simulate on the first dataset under `data_root` that matches `filter`.
    BacktestResult run(const std::string& data_root, const DatasetFilter& filter) const;

    /// Simulate on bars already in memory; `dataset` supplies market/timeframe and provenance.
    BacktestResult runOnBars(const std::vector<Bar>& bars, const DatasetInfo& dataset) const;

    const Strategy& strategy() const { return strategy_; }
    const Candidate& params() const { return params_; }

private:
    Strategy strategy_;
    Candidate params_;
    CostConfig costs_;

    BacktestResult failed(const std::string& reason, const DatasetInfo& dataset) const;
};

} // namespace botfarm
