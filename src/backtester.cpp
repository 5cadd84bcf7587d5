#include "backtester.hpp"
#include "simulator.hpp"
#include "strategy.hpp"

namespace botfarm {

Backtester::Backtester(Strategy strategy, Candidate params, CostConfig costs)
    : strategy_(std::move(strategy))
    , params_(std::move(params))
    , costs_(std::move(costs))
{
}

BacktestResult Backtester::failed(const std::string& reason, const DatasetInfo& dataset) const {
    BacktestResult r;
    r.status = "failed";
    r.reason = reason;
    r.strategy_id = strategy_.id();
    r.dataset = dataset;
    r.params_requested = params_;
    r.params_effective = params_;
    r.metrics = failedMetrics();
    return r;
}

BacktestResult Backtester::run(const std::string& data_root, const DatasetFilter& filter) const {
    std::vector<DatasetInfo> datasets = DataSource::findDatasets(data_root, filter);
    if (datasets.empty()) {
        DatasetInfo requested;
        if (filter.markets.size() == 1) requested.market = filter.markets[0];
        if (filter.symbols.size() == 1) requested.symbol = filter.symbols[0];
        if (filter.timeframes.size() == 1) requested.timeframe = filter.timeframes[0];
        return failed("no dataset found", requested);
    }

    const DatasetInfo& dataset = datasets.front();
    DataSource data(dataset.path);
    if (!data.load()) return failed("dataset could not be read", dataset);
    return runOnBars(data.bars(), dataset);
}

BacktestResult Backtester::runOnBars(const std::vector<Bar>& bars, const DatasetInfo& dataset) const {
    const std::size_t n = bars.size();
    if (n == 0) return failed("no dataset found", dataset);

    CostProfile cost = resolveCostProfile(costs_, dataset.market, dataset.timeframe, strategy_);
    if (n < MIN_BARS) {
        BacktestResult r = failed("insufficient bars", dataset);
        r.bars_count = n;
        r.cost_profile = cost;
        return r;
    }

    const Candidate params = strategy_.normalizeParams(params_, n);
    const IndicatorSet ind = strategy_.prepareIndicators(bars, params);

    Simulator sim(cost.per_side_cost_fraction);
    sim.begin(bars[0]);

    for (std::size_t i = 1; i < n; ++i) {
        const Bar& bar = bars[i];

        // 1. Exits: stop-loss, take-profit, then signal flip.
        if (!sim.flat()) {
            std::optional<ExitFill> exit = sim.checkStops(bar);
            if (!exit && strategy_.shouldFlip(i, sim.position()->side, bars, ind))
                exit = ExitFill{bar.close, ExitReason::SignalFlip};
            if (exit)
                sim.closePosition(bar, exit->price, exit->reason);
        }

        // 2. Entries, also right after an exit on this bar (second cost unit).
        if (sim.flat()) {
            Signal signal = strategy_.entrySignal(i, bars, ind);
            if (signal != Signal::None) {
                Side side = signal == Signal::Long ? Side::Long : Side::Short;
                RiskLevels levels = strategy_.riskLevels(i, side, bar.close, bars, ind, params);
                sim.openPosition(bar, side, levels);
            }
        }

        // 3. Book the bar.
        sim.endBar(bar);
    }

    BacktestResult r;
    r.status = "ok";
    r.reason = "completed";
    r.strategy_id = strategy_.id();
    r.dataset = dataset;
    r.bars_count = n;
    r.params_requested = params_;
    r.params_effective = params;
    r.cost_profile = cost;
    r.trades = sim.trades();
    r.equity_curve = sim.equityCurve();
    r.returns = sim.returns();
    r.open_position = sim.position();
    r.win_rate_pct = sim.winRatePct();
    r.metrics = computeMetrics(r.equity_curve, r.returns, dataset.timeframe);
    return r;
}

} // namespace botfarm
