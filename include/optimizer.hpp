#pragma once

#include "backtester.hpp"
#include "cost.hpp"
#include "data_source.hpp"
#include "metrics.hpp"
#include "param_plan.hpp"
#include "strategy.hpp"
#include <functional>
#include <string>
#include <vector>

namespace botfarm {

/// Promotion thresholds and the patience of the search.
struct RiskLimits {
    double strategy_max_drawdown_pct{20.0};
    double min_sharpe{1.0};
    double max_oos_degradation_pct{35.0};
    int max_retries{3};
};

struct GateResult {
    bool pass_drawdown{false};
    bool pass_sharpe{false};
    bool pass_oos_degradation{false};
    bool promoted{false};
};

GateResult evaluateGates(const Metrics& metrics, const RiskLimits& limits);

/// Ranking used to detect improvement between iterations.
inline double rankScore(const Metrics& m) { return m.total_return_pct - m.max_drawdown_pct; }

struct IterationRecord {
    int iteration{0};
    Candidate params;
    OptimizationMode mode;
    BacktestResult backtest;
    GateResult gates;
    double score{0};
    int retries_without_improvement{0};
};

struct CycleOutcome {
    std::vector<IterationRecord> records;
    std::string stop_reason;   // "promoted", "max_retries", "iterations_exhausted"
};

/// Iterates candidates (from the plan, else the strategy sampler) until one is promoted,
/// `max_retries` iterations pass without a better score, or `iterations` run out.
/// The dataset is loaded once before the first iteration.
class OptimizationCycle {
public:
    using Callback = std::function<void(const IterationRecord&)>;

    OptimizationCycle(Strategy strategy, ParamPlan plan, CostConfig costs, RiskLimits limits);

    CycleOutcome run(int iterations, const std::string& data_root, const DatasetFilter& filter,
                     const Callback& on_iteration = Callback()) const;

private:
    Strategy strategy_;
    ParamPlan plan_;
    CostConfig costs_;
    RiskLimits limits_;
};

/// One manual run: the strategy's iteration-1 sample with `overrides` applied on top.
IterationRecord simulateManual(const Strategy& strategy, const Candidate& overrides,
                               const CostConfig& costs, const RiskLimits& limits,
                               const std::string& data_root, const DatasetFilter& filter);

} // namespace botfarm
