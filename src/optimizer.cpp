#include "optimizer.hpp"
#include <limits>
#include <optional>
#include <utility>

namespace botfarm {

namespace {

/// First matching dataset, loaded; nullopt leaves failure reporting to Backtester::run.
std::optional<std::pair<DatasetInfo, std::vector<Bar>>> loadDataset(const std::string& data_root,
                                                                    const DatasetFilter& filter) {
    std::vector<DatasetInfo> datasets = DataSource::findDatasets(data_root, filter);
    if (datasets.empty()) return std::nullopt;
    DataSource data(datasets.front().path);
    if (!data.load()) return std::nullopt;
    return std::make_pair(datasets.front(), data.bars());
}

} // namespace

GateResult evaluateGates(const Metrics& metrics, const RiskLimits& limits) {
    GateResult g;
    g.pass_drawdown = metrics.max_drawdown_pct <= limits.strategy_max_drawdown_pct;
    g.pass_sharpe = metrics.sharpe >= limits.min_sharpe;
    g.pass_oos_degradation = metrics.oos_degradation_pct <= limits.max_oos_degradation_pct;
    g.promoted = g.pass_drawdown && g.pass_sharpe && g.pass_oos_degradation;
    return g;
}

OptimizationCycle::OptimizationCycle(Strategy strategy, ParamPlan plan, CostConfig costs, RiskLimits limits)
    : strategy_(std::move(strategy))
    , plan_(std::move(plan))
    , costs_(std::move(costs))
    , limits_(limits)
{
}

CycleOutcome OptimizationCycle::run(int iterations, const std::string& data_root, const DatasetFilter& filter,
                                    const Callback& on_iteration) const {
    CycleOutcome outcome;
    outcome.stop_reason = "iterations_exhausted";
    auto dataset = loadDataset(data_root, filter);

    double best_score = -std::numeric_limits<double>::infinity();
    int retries = 0;

    for (int iteration = 1; iteration <= iterations; ++iteration) {
        auto [params, mode] = paramsForIteration(iteration, plan_, strategy_.sampleParams(iteration));

        Backtester bt(strategy_, params, costs_);
        BacktestResult result = dataset
            ? bt.runOnBars(dataset->second, dataset->first)
            : bt.run(data_root, filter);

        IterationRecord rec;
        rec.iteration = iteration;
        rec.params = params;
        rec.mode = mode;
        rec.gates = evaluateGates(result.metrics, limits_);
        rec.score = rankScore(result.metrics);
        rec.backtest = std::move(result);

        if (rec.score > best_score) {
            best_score = rec.score;
            retries = 0;
        } else {
            ++retries;
        }
        rec.retries_without_improvement = retries;

        const bool promoted = rec.gates.promoted;
        outcome.records.push_back(std::move(rec));
        if (on_iteration) on_iteration(outcome.records.back());

        if (promoted) {
            outcome.stop_reason = "promoted";
            break;
        }
        if (retries >= limits_.max_retries) {
            outcome.stop_reason = "max_retries";
            break;
        }
    }
    return outcome;
}

IterationRecord simulateManual(const Strategy& strategy, const Candidate& overrides,
                               const CostConfig& costs, const RiskLimits& limits,
                               const std::string& data_root, const DatasetFilter& filter) {
    IterationRecord rec;
    rec.iteration = 1;
    rec.params = strategy.sampleParams(1).merged(overrides);
    rec.mode.source = "manual_override";
    rec.mode.reason = "manual";
    rec.mode.total_candidates = 1;
    rec.mode.search_mode = "manual";
    rec.mode.raw_total_candidates = 1;

    Backtester bt(strategy, rec.params, costs);
    rec.backtest = bt.run(data_root, filter);
    rec.gates = evaluateGates(rec.backtest.metrics, limits);
    rec.score = rankScore(rec.backtest.metrics);
    return rec;
}

} // namespace botfarm
