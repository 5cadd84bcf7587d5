/**
 * Test suite for the botfarm engine (no external test framework).
 * Run: build/test_runner (or ctest from the build directory).
 */
#include "backtester.hpp"
#include "bar.hpp"
#include "cost.hpp"
#include "data_source.hpp"
#include "indicators.hpp"
#include "metrics.hpp"
#include "optimizer.hpp"
#include "param_plan.hpp"
#include "params.hpp"
#include "simulator.hpp"
#include "strategy.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#define ASSERT_EQ(a, b) do { \
    auto _a = (a); auto _b = (b); \
    if (_a != _b) { \
        std::cerr << "FAIL: " << #a << " == " << #b << " => " << _a << " != " << _b << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    auto _a = (double)(a); auto _b = (double)(b); \
    if (std::abs(_a - _b) > (tol)) { \
        std::cerr << "FAIL: " << #a << " ~= " << #b << " => " << _a << " vs " << _b << " (tol " << (tol) << ") at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

namespace {

using namespace botfarm;
namespace fs = std::filesystem;

std::vector<Bar> risingBars(std::size_t n) {
    std::vector<Bar> bars;
    for (std::size_t i = 0; i < n; ++i) {
        Bar b;
        b.timestamp = 1700000000 + static_cast<std::int64_t>(i) * 3600;
        b.close = 100.0 + static_cast<double>(i);
        b.open = b.close - 0.5;
        b.high = b.close + 1.0;
        b.low = b.close - 1.0;
        bars.push_back(b);
    }
    return bars;
}

/// Deterministic wave so both strategies see crossovers and trend flips.
std::vector<Bar> waveBars(std::size_t n) {
    std::vector<Bar> bars;
    for (std::size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i);
        Bar b;
        b.timestamp = 1700000000 + static_cast<std::int64_t>(i) * 3600;
        b.close = 100.0 + 10.0 * std::sin(t / 9.0) + 0.05 * t;
        b.open = 100.0 + 10.0 * std::sin((t - 1.0) / 9.0) + 0.05 * (t - 1.0);
        b.high = std::max(b.open, b.close) + 0.8;
        b.low = std::min(b.open, b.close) - 0.8;
        bars.push_back(b);
    }
    return bars;
}

Bar makeBar(std::int64_t ts, double open, double high, double low, double close) {
    Bar b;
    b.timestamp = ts;
    b.open = open;
    b.high = high;
    b.low = low;
    b.close = close;
    return b;
}

CostConfig zeroCost() {
    CostConfig c;
    c.defaults.fee_bps_per_side = 0.0;
    c.defaults.slippage_bps_per_side = 0.0;
    return c;
}

std::size_t firstDefined(const Series& s) {
    for (std::size_t i = 0; i < s.size(); ++i)
        if (s[i]) return i;
    return s.size();
}

//--- Indicators: EMA seed and period <= 1 passthrough
void run_ema_seed_and_passthrough() {
    std::vector<double> v = {1, 2, 3, 4};
    Series raw = ema(v, 1);
    ASSERT_EQ(raw.size(), 4u);
    ASSERT_NEAR(*raw[2], 3.0, 1e-12);

    Series e = ema(v, 3);
    ASSERT_TRUE(!e[0] && !e[1]);
    ASSERT_NEAR(*e[2], 2.0, 1e-12);        // mean of 1,2,3
    ASSERT_NEAR(*e[3], 3.0, 1e-12);        // 4*0.5 + 2*0.5
    ASSERT_TRUE(!ema(v, 5)[3]);            // shorter than the period
}

//--- Indicators: warm-up boundaries on a 30-bar series
void run_indicator_warmups() {
    PriceColumns c = columns(waveBars(30));
    ASSERT_EQ(firstDefined(atr(c.high, c.low, c.close, 14)), 13u);
    ASSERT_EQ(firstDefined(rsi(c.close, 14)), 14u);
    ASSERT_EQ(firstDefined(adx(c.high, c.low, c.close, 14)), 26u);

    PriceColumns shorter = columns(waveBars(27));
    ASSERT_EQ(firstDefined(adx(shorter.high, shorter.low, shorter.close, 14)), 27u);  // needs 2*period bars
}

//--- Indicators: seed and first smoothed values by hand
void run_indicator_seed_values() {
    std::vector<double> high = {10, 12, 13, 12};
    std::vector<double> low = {9, 10, 11, 9};
    std::vector<double> close = {9.5, 11, 12.5, 10};

    // true ranges 1, 2.5, 2, 3.5
    Series a = atr(high, low, close, 2);
    ASSERT_TRUE(!a[0]);
    ASSERT_NEAR(*a[1], 1.75, 1e-12);
    ASSERT_NEAR(*a[2], 1.875, 1e-12);
    ASSERT_NEAR(*a[3], 2.6875, 1e-12);

    // DX 100, 100, then 33.33 once -DM appears; seed is their mean at index 2
    Series d = adx(high, low, close, 2);
    ASSERT_TRUE(!d[0] && !d[1]);
    ASSERT_NEAR(*d[2], 100.0, 1e-9);
    ASSERT_NEAR(*d[3], (100.0 + 100.0 / 3.0) / 2.0, 1e-9);

    // gains 1 and 2, loss 1 over 3 deltas: RS 3
    Series r = rsi({1, 2, 1, 3}, 3);
    ASSERT_TRUE(!r[2]);
    ASSERT_NEAR(*r[3], 75.0, 1e-9);
}

//--- Indicators: SuperTrend bands only tighten while the trend holds
void run_supertrend_ratchet() {
    PriceColumns c = columns(waveBars(200));
    SupertrendBands st = supertrend(c.high, c.low, c.close, 10, 3.0);
    ASSERT_EQ(std::min(firstDefined(st.up), firstDefined(st.down)), 9u);
    int holds = 0;
    for (std::size_t i = 10; i < c.close.size(); ++i) {
        if (st.up[i - 1] && st.up[i]) {
            ASSERT_TRUE(*st.up[i] >= *st.up[i - 1]);
            ++holds;
        }
        if (st.down[i - 1] && st.down[i]) {
            ASSERT_TRUE(*st.down[i] <= *st.down[i - 1]);
            ++holds;
        }
    }
    ASSERT_TRUE(holds > 100);
}

//--- Indicators: RSI with no losses
void run_rsi_without_losses() {
    std::vector<double> close;
    for (int i = 0; i < 20; ++i) close.push_back(10.0 + i);
    Series r = rsi(close, 14);
    ASSERT_NEAR(*r[14], 100.0 - 100.0 / 101.0, 1e-9);
    ASSERT_NEAR(*r[19], 100.0 - 100.0 / 101.0, 1e-9);
}

//--- Indicators: SuperTrend has exactly one side defined after warm-up
void run_supertrend_one_side() {
    PriceColumns c = columns(waveBars(120));
    SupertrendBands st = supertrend(c.high, c.low, c.close, 10, 3.0);
    bool saw_up = false, saw_down = false;
    for (std::size_t i = 0; i < c.close.size(); ++i) {
        if (i < 9) {
            ASSERT_TRUE(!st.up[i] && !st.down[i]);
            continue;
        }
        ASSERT_TRUE(st.up[i].has_value() != st.down[i].has_value());
        saw_up = saw_up || st.up[i].has_value();
        saw_down = saw_down || st.down[i].has_value();
        if (st.up[i]) ASSERT_TRUE(*st.up[i] < c.close[i] + 1e-9);
    }
    ASSERT_TRUE(saw_up && saw_down);
}

//--- Indicators: rolling mean skips undefined inputs
void run_rolling_mean() {
    Series in = {std::nullopt, 1.0, 2.0, 3.0, 4.0};
    Series out = rollingMean(in, 2);
    ASSERT_TRUE(!out[0] && !out[1]);
    ASSERT_NEAR(*out[2], 1.5, 1e-12);
    ASSERT_NEAR(*out[4], 3.5, 1e-12);
}

//--- Params: candidate with/merged keep order and replace in place
void run_candidate_merge() {
    Candidate base({{"a", ParamValue::integer(1)}, {"b", ParamValue::real(2.5)}});
    Candidate merged = base.merged(Candidate({{"b", ParamValue::real(3.0)}, {"c", ParamValue::integer(7)}}));
    ASSERT_EQ(merged.describe(), std::string("a=1 b=3 c=7"));
    ASSERT_EQ(base.describe(), std::string("a=1 b=2.5"));
    ASSERT_EQ(merged.getInt("c", 0), 7);
    ASSERT_NEAR(merged.getDouble("missing", 4.5), 4.5, 1e-12);

    // Oversized values saturate instead of overflowing int.
    Candidate big({{"huge", ParamValue::integer(99999999999L)}, {"tiny", ParamValue::real(-1e11)}});
    ASSERT_EQ(big.getInt("huge", 0), std::numeric_limits<int>::max());
    ASSERT_EQ(big.getInt("tiny", 0), std::numeric_limits<int>::min());
    ASSERT_EQ(big.describe(), std::string("huge=99999999999 tiny=-100000000000"));
}

ParamSpec rangeSpec(double min, double max, double step, ValueType type) {
    ParamSpec s;
    s.type = type;
    s.min = min;
    s.max = max;
    s.step = step;
    return s;
}

//--- Planner: grid order, raw total and truncation
void run_grid_truncation() {
    ParameterSpace space;
    space.max_combinations = 2;
    space.parameters = {{"a", rangeSpec(5, 7, 1, ValueType::Integer)},
                        {"b", rangeSpec(1, 3, 1, ValueType::Integer)}};
    ParameterSpaces spaces{{"ema_cross_atr", space}};

    ParamPlan plan;
    std::string err;
    ASSERT_TRUE(buildParamPlan("ema_cross_atr", spaces, plan, err));
    ASSERT_EQ(plan.source, std::string("parameter_space"));
    ASSERT_EQ(plan.raw_total_candidates, 9u);
    ASSERT_EQ(plan.total_candidates, 2u);
    ASSERT_TRUE(plan.truncated);
    ASSERT_EQ(plan.candidates[0].describe(), std::string("a=5 b=1"));
    ASSERT_EQ(plan.candidates[1].describe(), std::string("a=5 b=2"));
    ASSERT_EQ(plan.space[0].count, 3u);

    std::vector<ParamValue> values;
    ASSERT_TRUE(valuesFromSpec("a", rangeSpec(5, 7, 1, ValueType::Integer), values, err));
    ASSERT_EQ(values.size(), 3u);
    ASSERT_EQ(values[2].asInt(), 7);
}

//--- Planner: float steps land on rounded values, including the max
void run_float_range() {
    std::vector<ParamValue> values;
    std::string err;
    ASSERT_TRUE(valuesFromSpec("m", rangeSpec(0.1, 0.3, 0.1, ValueType::Real), values, err));
    ASSERT_EQ(values.size(), 3u);
    ASSERT_TRUE(values[2].asDouble() == 0.3);
    ASSERT_EQ(stepDecimals(0.25), 2);
    ASSERT_EQ(stepDecimals(5.0), 0);
}

//--- Planner: configuration errors
void run_param_spec_errors() {
    std::vector<ParamValue> values;
    std::string err;

    ParamSpec disabled;
    disabled.enabled = false;
    ASSERT_TRUE(!valuesFromSpec("x", disabled, values, err));
    ASSERT_TRUE(err.find("no fixed 'value'") != std::string::npos);

    ASSERT_TRUE(!valuesFromSpec("x", rangeSpec(1, 5, 0, ValueType::Real), values, err));
    ASSERT_TRUE(err.find("non-positive step") != std::string::npos);

    ASSERT_TRUE(!valuesFromSpec("x", rangeSpec(5, 1, 1, ValueType::Real), values, err));
    ASSERT_TRUE(err.find("min > max") != std::string::npos);

    ParamSpec no_min;
    no_min.max = 3;
    no_min.step = 1;
    ASSERT_TRUE(!valuesFromSpec("x", no_min, values, err));
    ASSERT_TRUE(err.find("missing 'min'") != std::string::npos);

    disabled.value = 4;
    disabled.type = ValueType::Integer;
    ASSERT_TRUE(valuesFromSpec("x", disabled, values, err));
    ASSERT_EQ(values.size(), 1u);
    ASSERT_EQ(values[0].asInt(), 4);

    ASSERT_TRUE(!valuesFromSpec("x", rangeSpec(1e17, 1e17 + 1000, 1, ValueType::Real), values, err));
    ASSERT_TRUE(err.find("step too small") != std::string::npos);
    ASSERT_TRUE(!valuesFromSpec("x", rangeSpec(std::nan(""), 5, 1, ValueType::Real), values, err));
    ASSERT_TRUE(err.find("non-finite") != std::string::npos);

    ParameterSpace space;
    space.parameters = {{"x", rangeSpec(5, 1, 1, ValueType::Real)}};
    ParamPlan plan;
    ASSERT_TRUE(!buildParamPlan("supertrend_rsi", ParameterSpaces{{"supertrend_rsi", space}}, plan, err));
}

//--- Planner: seeded shuffle is reproducible and keeps every candidate
void run_shuffle_determinism() {
    ParameterSpace space;
    space.shuffle = true;
    space.seed = 7;
    space.parameters = {{"a", rangeSpec(1, 10, 1, ValueType::Integer)},
                        {"b", rangeSpec(1, 4, 1, ValueType::Integer)}};
    ParameterSpaces spaces{{"ema_cross_atr", space}};

    ParamPlan first, second;
    std::string err;
    ASSERT_TRUE(buildParamPlan("ema_cross_atr", spaces, first, err));
    ASSERT_TRUE(buildParamPlan("ema_cross_atr", spaces, second, err));
    ASSERT_EQ(first.candidates.size(), 40u);
    ASSERT_TRUE(first.candidates == second.candidates);

    spaces["ema_cross_atr"].shuffle = false;
    ParamPlan ordered;
    ASSERT_TRUE(buildParamPlan("ema_cross_atr", spaces, ordered, err));
    ASSERT_TRUE(!(first.candidates == ordered.candidates));
}

//--- Planner: iteration index wraps around the candidate list
void run_iteration_wraparound() {
    ParameterSpace space;
    space.parameters = {{"a", rangeSpec(5, 7, 1, ValueType::Integer)}};
    ParamPlan plan;
    std::string err;
    ASSERT_TRUE(buildParamPlan("ema_cross_atr", ParameterSpaces{{"ema_cross_atr", space}}, plan, err));

    Candidate fallback({{"a", ParamValue::integer(99)}});
    auto [c1, m1] = paramsForIteration(1, plan, fallback);
    ASSERT_EQ(c1.getInt("a", 0), 5);
    ASSERT_EQ(*m1.candidate_index, 0u);
    auto [c4, m4] = paramsForIteration(4, plan, fallback);
    ASSERT_EQ(c4.getInt("a", 0), 5);
    auto [c0, m0] = paramsForIteration(0, plan, fallback);
    ASSERT_EQ(c0.getInt("a", 0), 7);
    ASSERT_EQ(m0.total_candidates, 3u);

    ParamPlan empty;
    ASSERT_TRUE(buildParamPlan("ema_cross_atr", ParameterSpaces{}, empty, err));
    ASSERT_EQ(empty.source, std::string("strategy_sample"));
    auto [cf, mf] = paramsForIteration(3, empty, fallback);
    ASSERT_EQ(cf.getInt("a", 0), 99);
    ASSERT_EQ(mf.source, std::string("strategy_sample"));
    ASSERT_TRUE(!mf.candidate_index);
}

//--- Metrics
void run_metrics() {
    ASSERT_NEAR(maxDrawdownPct({1.0, 1.2, 0.9, 1.1}), 25.0, 1e-9);
    ASSERT_NEAR(totalReturnPct({1.0, 1.1}), 10.0, 1e-9);
    ASSERT_NEAR(sharpeRatio(std::vector<double>(10, 0.25), "1h"), 0.0, 1e-12);
    ASSERT_NEAR(oosDegradationPct(std::vector<double>(19, 0.01)), 100.0, 1e-12);
    ASSERT_NEAR(oosDegradationPct(std::vector<double>(20, -0.01)), 100.0, 1e-12);
    const double in_sample = std::pow(1.01, 16) - 1.0;
    const double out_sample = std::pow(1.01, 4) - 1.0;
    ASSERT_NEAR(oosDegradationPct(std::vector<double>(20, 0.01)), (in_sample - out_sample) / in_sample * 100.0, 1e-9);
    ASSERT_NEAR(barsPerYear("4H"), 2190.0, 1e-12);
    ASSERT_NEAR(barsPerYear("weekly"), 8760.0, 1e-12);
}

//--- Simulator: stop-loss wins when both levels are inside the bar
void run_simulator_stop_precedence() {
    Simulator sim(0.0);
    sim.begin(makeBar(0, 100, 100, 100, 100));
    Bar entry = makeBar(1, 100, 100.5, 99.5, 100);
    sim.openPosition(entry, Side::Long, bracket(Side::Long, 100, 5, 5));
    sim.endBar(entry);

    Bar wide = makeBar(2, 100, 106, 94, 100);
    auto fill = sim.checkStops(wide);
    ASSERT_TRUE(fill.has_value());
    ASSERT_TRUE(fill->reason == ExitReason::StopLoss);
    ASSERT_NEAR(fill->price, 95.0, 1e-12);

    sim.closePosition(wide, fill->price, fill->reason);
    sim.endBar(wide);
    ASSERT_TRUE(sim.flat());
    ASSERT_EQ(sim.trades().size(), 1u);
    ASSERT_NEAR(sim.trades()[0].gross_return_pct, -5.0, 1e-9);
    ASSERT_NEAR(sim.equity(), 0.95, 1e-12);
    ASSERT_NEAR(sim.winRatePct(), 0.0, 1e-12);
}

//--- Simulator: take-profit exits for both sides
void run_simulator_take_profit() {
    Simulator sim(0.0);
    sim.begin(makeBar(0, 100, 100, 100, 100));
    Bar entry = makeBar(1, 100, 100, 100, 100);
    sim.openPosition(entry, Side::Long, bracket(Side::Long, 100, 5, 5));
    sim.endBar(entry);

    Bar up = makeBar(2, 100, 106, 99, 104);
    auto fill = sim.checkStops(up);
    ASSERT_TRUE(fill.has_value());
    ASSERT_TRUE(fill->reason == ExitReason::TakeProfit);
    ASSERT_NEAR(fill->price, 105.0, 1e-12);
    sim.closePosition(up, fill->price, fill->reason);
    sim.openPosition(up, Side::Short, bracket(Side::Short, up.close, 5, 5));
    sim.endBar(up);

    Bar down = makeBar(3, 104, 105, 98, 100);
    fill = sim.checkStops(down);
    ASSERT_TRUE(fill.has_value());
    ASSERT_TRUE(fill->reason == ExitReason::TakeProfit);
    ASSERT_NEAR(fill->price, 99.0, 1e-12);
    sim.closePosition(down, fill->price, fill->reason);
    sim.endBar(down);

    ASSERT_EQ(sim.trades().size(), 2u);
    ASSERT_NEAR(sim.trades()[0].gross_return_pct, 5.0, 1e-9);
    ASSERT_NEAR(sim.trades()[1].gross_return_pct, 100.0 * 5.0 / 104.0, 1e-9);
    ASSERT_NEAR(sim.winRatePct(), 100.0, 1e-12);
    ASSERT_TRUE(!sim.checkStops(makeBar(4, 100, 200, 1, 100)));   // flat
}

//--- Simulator: close and re-entry on one bar pays two cost units
void run_simulator_flip_cost() {
    Simulator sim(0.001);
    sim.begin(makeBar(0, 100, 100, 100, 100));
    Bar b1 = makeBar(1, 100, 100, 100, 100);
    sim.openPosition(b1, Side::Long, bracket(Side::Long, 100, 10, 10));
    sim.endBar(b1);

    Bar b2 = makeBar(2, 100, 100, 100, 100);
    sim.closePosition(b2, b2.close, ExitReason::SignalFlip);
    sim.openPosition(b2, Side::Short, bracket(Side::Short, 100, 10, 10));
    sim.endBar(b2);

    ASSERT_EQ(sim.returns().size(), 2u);
    ASSERT_NEAR(sim.returns()[0], -0.001, 1e-12);
    ASSERT_NEAR(sim.returns()[1], -0.002, 1e-12);
    ASSERT_NEAR(sim.trades()[0].net_return_pct, -0.2, 1e-9);
    ASSERT_TRUE(sim.position()->side == Side::Short);
    ASSERT_EQ(sim.equityCurve().size(), 3u);
}

//--- Backtester: too few bars is a failed result with sentinel metrics
void run_backtest_insufficient_bars() {
    Backtester bt(*findStrategy("ema_cross_atr"), Candidate(), zeroCost());
    BacktestResult r = bt.runOnBars(risingBars(5), DatasetInfo{"mem", "crypto", "BTCUSD", "1h"});
    ASSERT_TRUE(!r.ok());
    ASSERT_EQ(r.reason, std::string("insufficient bars"));
    ASSERT_NEAR(r.metrics.total_return_pct, -100.0, 1e-12);
    ASSERT_NEAR(r.metrics.max_drawdown_pct, 100.0, 1e-12);
    ASSERT_NEAR(r.metrics.oos_degradation_pct, 100.0, 1e-12);

    BacktestResult none = bt.run("does_not_exist_root", DatasetFilter{});
    ASSERT_EQ(none.reason, std::string("no dataset found"));
}

//--- Backtester: a steady uptrend never crosses, so nothing trades
void run_backtest_rising_no_trades() {
    Strategy s = *findStrategy("ema_cross_atr");
    Backtester bt(s, s.sampleParams(1), zeroCost());
    BacktestResult r = bt.runOnBars(risingBars(100), DatasetInfo{"mem", "crypto", "BTCUSD", "1h"});
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.bars_count, 100u);
    ASSERT_EQ(r.trades.size(), 0u);
    ASSERT_TRUE(!r.open_position);
    ASSERT_NEAR(r.metrics.total_return_pct, 0.0, 1e-12);
    ASSERT_NEAR(r.win_rate_pct, 0.0, 1e-12);
    ASSERT_EQ(r.equity_curve.size(), 100u);
    ASSERT_EQ(r.params_effective.getInt("ema_slow", 0), 50);   // 51 clamped to bars/2
    ASSERT_EQ(r.cost_profile.source, std::string("config"));
}

//--- Backtester: identical inputs give identical results
void run_backtest_deterministic() {
    for (const char* id : {"ema_cross_atr", "supertrend_rsi"}) {
        Strategy s = *findStrategy(id);
        std::vector<Bar> bars = waveBars(400);
        DatasetInfo info{"mem", "forex", "EURUSD", "1h"};
        BacktestResult a = Backtester(s, s.sampleParams(3)).runOnBars(bars, info);
        BacktestResult b = Backtester(s, s.sampleParams(3)).runOnBars(bars, info);
        ASSERT_TRUE(a.ok());
        ASSERT_EQ(a.trades.size(), b.trades.size());
        ASSERT_TRUE(a.equity_curve == b.equity_curve);
        ASSERT_EQ(a.equity_curve.size(), bars.size());
        ASSERT_EQ(a.returns.size(), bars.size() - 1);
    }
}

/// Triangle wave: 20 bars up by 1, 20 bars down by 1, starting at 100.
std::vector<Bar> triangleBars(std::size_t n) {
    std::vector<Bar> bars;
    double price = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        Bar b;
        b.timestamp = 1700000000 + static_cast<std::int64_t>(i) * 3600;
        b.open = b.close = price;
        b.high = price + 0.5;
        b.low = price - 0.5;
        bars.push_back(b);
        price += ((i / 20) % 2 == 0) ? 1.0 : -1.0;
    }
    return bars;
}

//--- Backtester: every crossover after the first closes and reopens on the same bar
void run_backtest_same_bar_reentry() {
    Strategy s = *findStrategy("ema_cross_atr");
    Candidate params({{"ema_fast", ParamValue::integer(3)}, {"ema_slow", ParamValue::integer(8)},
                      {"rsi_period", ParamValue::integer(5)}, {"rsi_gate", ParamValue::real(40)},
                      {"atr_period", ParamValue::integer(5)}, {"atr_vol_window", ParamValue::integer(5)},
                      {"atr_vol_ratio_max", ParamValue::real(100)},
                      {"atr_mult_stop", ParamValue::real(1000)}, {"atr_mult_take", ParamValue::real(1000)}});
    CostConfig costs;
    costs.defaults.fee_bps_per_side = 10.0;
    std::vector<Bar> bars = triangleBars(200);
    BacktestResult r = Backtester(s, params, costs).runOnBars(bars, DatasetInfo{"mem", "crypto", "X", "1h"});
    ASSERT_TRUE(r.ok());

    // Crossovers land on bars 24, 44, ..., 184; the first opens a short.
    ASSERT_EQ(r.trades.size(), 8u);
    ASSERT_TRUE(r.trades[0].side == Side::Short);
    ASSERT_EQ(r.trades[0].entry_time, bars[24].timestamp);
    ASSERT_TRUE(r.open_position.has_value());
    ASSERT_EQ(r.open_position->entry_time, bars[184].timestamp);
    ASSERT_NEAR(r.returns[23], -0.001, 1e-12);

    for (std::size_t k = 0; k < r.trades.size(); ++k) {
        const Trade& t = r.trades[k];
        ASSERT_TRUE(t.exit_reason == ExitReason::SignalFlip);
        std::int64_t next_entry = k + 1 < r.trades.size() ? r.trades[k + 1].entry_time : r.open_position->entry_time;
        ASSERT_EQ(next_entry, t.exit_time);

        std::size_t i = static_cast<std::size_t>((t.exit_time - bars[0].timestamp) / 3600);
        double move = direction(t.side) * (bars[i].close - bars[i - 1].close) / bars[i - 1].close;
        ASSERT_NEAR(r.returns[i - 1], move - 0.002, 1e-12);
    }
}

//--- Strategies: SuperTrend switch gated by RSI, EMA and ADX; flips on the opposing band
void run_supertrend_signals() {
    Strategy s = *findStrategy("supertrend_rsi");
    std::vector<Bar> bars = {makeBar(0, 100, 101, 99, 100), makeBar(1, 100, 101, 99, 100)};
    IndicatorSet ind;
    ind.series["st_up"] = {std::nullopt, 95.0};
    ind.series["st_down"] = {105.0, std::nullopt};
    ind.series["rsi"] = {55.0, 55.0};
    ind.series["adx"] = {25.0, 25.0};
    ind.series["ema"] = {90.0, 90.0};
    ind.filters["min_adx"] = 20;
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::Long);
    ASSERT_TRUE(s.entrySignal(0, bars, ind) == Signal::None);

    ind.series["adx"] = {15.0, 15.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::None);
    ind.series["adx"] = {25.0, 25.0};
    ind.series["rsi"] = {45.0, 45.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::None);
    ind.series["rsi"] = {55.0, 55.0};
    ind.series["ema"] = {110.0, 110.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::None);

    // Switch to downtrend with confirming momentum and bias.
    ind.series["st_up"] = {95.0, std::nullopt};
    ind.series["st_down"] = {std::nullopt, 105.0};
    ind.series["rsi"] = {45.0, 45.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::Short);
    ind.series["ema"] = {90.0, 90.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::None);

    ASSERT_TRUE(s.shouldFlip(1, Side::Long, bars, ind));
    ASSERT_TRUE(!s.shouldFlip(1, Side::Short, bars, ind));
    ASSERT_TRUE(s.shouldFlip(0, Side::Short, bars, ind));
    ASSERT_TRUE(!s.shouldFlip(0, Side::Long, bars, ind));
}

//--- Strategies: samplers are reproducible per iteration
void run_sampler_determinism() {
    Strategy s = *findStrategy("supertrend_rsi");
    ASSERT_TRUE(s.sampleParams(4) == s.sampleParams(4));
    ASSERT_EQ(s.sampleParams(4).getInt("st_period", 0), 12);
    Strategy e = *findStrategy("ema_cross_atr");
    ASSERT_EQ(e.sampleParams(2).getInt("ema_fast", 0), 22);
    double stop = e.sampleParams(2).getDouble("atr_mult_stop", 0);
    ASSERT_TRUE(stop >= 1.2 && stop <= 1.3);
}

//--- Strategies: EMA normalization clamps periods to the bar count
void run_ema_normalize() {
    Strategy s = *findStrategy("ema_cross_atr");
    Candidate raw({{"ema_fast", ParamValue::integer(20)}, {"ema_slow", ParamValue::integer(50)},
                   {"atr_period", ParamValue::integer(14)}, {"rsi_gate", ParamValue::real(70)},
                   {"atr_mult_stop", ParamValue::real(0.1)}});
    Candidate n = s.normalizeParams(raw, 20);
    ASSERT_EQ(n.getInt("ema_slow", 0), 10);
    ASSERT_EQ(n.getInt("ema_fast", 0), 9);
    ASSERT_EQ(n.getInt("atr_period", 0), 10);
    ASSERT_NEAR(n.getDouble("rsi_gate", 0), 60.0, 1e-12);
    ASSERT_NEAR(n.getDouble("atr_mult_stop", 0), 0.5, 1e-12);
    ASSERT_NEAR(n.getDouble("atr_vol_ratio_max", 0), 2.0, 1e-12);

    Strategy st = *findStrategy("supertrend_rsi");
    Candidate m = st.normalizeParams(st.sampleParams(1), 60);
    ASSERT_EQ(m.getInt("ema_period", 0), 20);
    ASSERT_TRUE(m.getDouble("st_mult", 0) >= 1.0 && m.getDouble("st_mult", 0) <= 5.0);
}

//--- Strategies: EMA crossover entry is gated by momentum and volatility
void run_ema_entry_gates() {
    Strategy s = *findStrategy("ema_cross_atr");
    std::vector<Bar> bars(2);
    IndicatorSet ind;
    ind.series["ema_fast"] = {1.0, 3.0};
    ind.series["ema_slow"] = {2.0, 2.0};
    ind.series["atr"] = {1.0, 1.0};
    ind.series["atr_avg"] = {1.0, 1.0};
    ind.series["rsi"] = {55.0, 55.0};
    ind.filters["rsi_gate"] = 50;
    ind.filters["atr_vol_ratio_max"] = 2.0;
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::Long);

    ind.series["rsi"] = {45.0, 45.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::None);
    ASSERT_TRUE(s.shouldFlip(1, Side::Short, bars, ind));   // exits ignore the gates

    ind.series["rsi"] = {55.0, 55.0};
    ind.series["atr"] = {3.0, 3.0};
    ASSERT_TRUE(s.entrySignal(1, bars, ind) == Signal::None);
    ASSERT_TRUE(s.entrySignal(0, bars, ind) == Signal::None);

    RiskLevels lv = s.riskLevels(1, Side::Short, 100.0, bars, ind,
                                 Candidate({{"atr_mult_stop", ParamValue::real(1.5)},
                                            {"atr_mult_take", ParamValue::real(2.0)}}));
    ASSERT_NEAR(lv.stop_price, 104.5, 1e-12);
    ASSERT_NEAR(lv.take_price, 94.0, 1e-12);
}

//--- Registry
void run_strategy_registry() {
    ASSERT_TRUE(!findStrategy("nope"));
    auto all = listStrategies();
    ASSERT_EQ(all.size(), 2u);
    ASSERT_EQ(all[0].first, std::string("ema_cross_atr"));
    ASSERT_EQ(findStrategy("supertrend_rsi")->id(), std::string("supertrend_rsi"));
}

//--- Cost resolution
void run_cost_resolution() {
    Strategy st = *findStrategy("supertrend_rsi");
    CostProfile fallback = resolveCostProfile(CostConfig{}, "Crypto", "1h", st);
    ASSERT_EQ(fallback.source, std::string("strategy_default"));
    ASSERT_NEAR(fallback.per_side_cost_fraction, 0.0005, 1e-12);

    CostConfig cfg;
    cfg.defaults.fee_bps_per_side = 5.0;
    CostRates forex;
    forex.slippage_bps_per_side = 2.0;
    cfg.market_costs["forex"] = forex;
    CostProfile p = resolveCostProfile(cfg, "FOREX", "1h", st);
    ASSERT_EQ(p.source, std::string("config"));
    ASSERT_NEAR(p.fee_bps_per_side, 5.0, 1e-12);
    ASSERT_NEAR(p.slippage_bps_per_side, 2.0, 1e-12);
    ASSERT_NEAR(p.per_side_cost_fraction, 0.0007, 1e-12);

    CostProfile other = resolveCostProfile(cfg, "crypto", "1h", st);
    ASSERT_NEAR(other.per_side_cost_fraction, 0.0005, 1e-12);   // default 5 bps fee only
}

//--- Promotion gates
void run_gates() {
    RiskLimits limits;
    Metrics good{10.0, 1.5, 10.0, 20.0};
    ASSERT_TRUE(evaluateGates(good, limits).promoted);
    Metrics weak = good;
    weak.sharpe = 0.5;
    GateResult g = evaluateGates(weak, limits);
    ASSERT_TRUE(!g.promoted && !g.pass_sharpe && g.pass_drawdown && g.pass_oos_degradation);
    ASSERT_TRUE(!evaluateGates(failedMetrics(), limits).promoted);
}

//--- Optimization cycle: no improvement stops after max_retries
void run_cycle_max_retries() {
    Strategy s = *findStrategy("ema_cross_atr");
    RiskLimits limits;
    limits.max_retries = 3;
    OptimizationCycle cycle(s, ParamPlan{}, CostConfig{}, limits);
    int seen = 0;
    CycleOutcome out = cycle.run(10, "does_not_exist_root", DatasetFilter{},
                                 [&seen](const IterationRecord&) { ++seen; });
    ASSERT_EQ(out.records.size(), 4u);
    ASSERT_EQ(seen, 4);
    ASSERT_EQ(out.stop_reason, std::string("max_retries"));
    ASSERT_EQ(out.records[0].retries_without_improvement, 0);
    ASSERT_EQ(out.records[3].retries_without_improvement, 3);
    ASSERT_NEAR(out.records[0].score, -200.0, 1e-12);
    ASSERT_EQ(out.records[1].mode.source, std::string("strategy_sample"));
}

//--- Manual run merges overrides over the iteration-1 sample
void run_manual_override() {
    Strategy s = *findStrategy("ema_cross_atr");
    IterationRecord rec = simulateManual(s, Candidate({{"ema_fast", ParamValue::integer(8)}}), CostConfig{},
                                         RiskLimits{}, "does_not_exist_root", DatasetFilter{});
    ASSERT_EQ(rec.params.getInt("ema_fast", 0), 8);
    ASSERT_EQ(rec.params.getInt("ema_slow", 0), 51);
    ASSERT_EQ(rec.mode.source, std::string("manual_override"));
    ASSERT_TRUE(!rec.backtest.ok());
}

//--- DataSource: CSV load skips malformed rows and converts millisecond timestamps
void run_data_source_csv_load() {
    std::string path = "test_sample_ohlc.csv";
    {
        std::ofstream f(path);
        f << "Timestamp,Open,High,Low,Close\n"
          << "1700000000000,100,101,99,100.5\n"
          << "1700003600,abc,102,100,101\n"
          << "1700007200,100.5,102\n"
          << "nan,nan,nan,nan,nan\n"
          << "inf,100,101,99,100\n"
          << "1e300,100,101,99,100\n"
          << "1700009000,100,inf,99,100\n"
          << "1700009900,100,101,99,nan\n"
          << "1700010800,100.5,102,100,101\n";
    }
    DataSource ds(path);
    ASSERT_EQ(ds.load(), true);
    ASSERT_EQ(ds.size(), 2u);
    ASSERT_EQ(ds.at(0).timestamp, static_cast<std::int64_t>(1700000000));
    ASSERT_EQ(ds.at(1).timestamp, static_cast<std::int64_t>(1700010800));
    ASSERT_NEAR(ds.at(1).close, 101, 1e-6);
    for (const Bar& b : ds.bars()) ASSERT_TRUE(std::isfinite(b.close) && std::isfinite(b.high));
    std::remove(path.c_str());

    DataSource missing("no_such_file.csv");
    ASSERT_EQ(missing.load(), false);
}

//--- DataSource: discovery under <root>/<market>/<symbol>/<timeframe>/
void run_data_source_discovery() {
    fs::path root = fs::temp_directory_path() / "botfarm_test_datasets";
    fs::remove_all(root);
    fs::create_directories(root / "crypto" / "BTC-USD" / "1h");
    fs::create_directories(root / "forex" / "EURUSD" / "4h");
    std::ofstream(root / "crypto" / "BTC-USD" / "1h" / "a.csv") << "timestamp,open,high,low,close\n";
    std::ofstream(root / "forex" / "EURUSD" / "4h" / "b.csv") << "timestamp,open,high,low,close\n";
    std::ofstream(root / "forex" / "EURUSD" / "4h" / "notes.txt") << "x\n";

    auto all = DataSource::findDatasets(root.string(), DatasetFilter{});
    ASSERT_EQ(all.size(), 2u);

    DatasetFilter f;
    f.symbols = {"btc/usd"};
    auto btc = DataSource::findDatasets(root.string(), f);
    ASSERT_EQ(btc.size(), 1u);
    ASSERT_EQ(btc[0].market, std::string("crypto"));
    ASSERT_EQ(btc[0].timeframe, std::string("1h"));

    f = DatasetFilter{};
    f.markets = {"FOREX"};
    f.timeframes = {"1h"};
    ASSERT_EQ(DataSource::findDatasets(root.string(), f).size(), 0u);
    fs::remove_all(root);
}

void run_all_tests() {
    std::cerr << "  ema_seed_and_passthrough ... "; run_ema_seed_and_passthrough(); std::cerr << "ok\n";
    std::cerr << "  indicator_warmups ... "; run_indicator_warmups(); std::cerr << "ok\n";
    std::cerr << "  indicator_seed_values ... "; run_indicator_seed_values(); std::cerr << "ok\n";
    std::cerr << "  supertrend_ratchet ... "; run_supertrend_ratchet(); std::cerr << "ok\n";
    std::cerr << "  rsi_without_losses ... "; run_rsi_without_losses(); std::cerr << "ok\n";
    std::cerr << "  supertrend_one_side ... "; run_supertrend_one_side(); std::cerr << "ok\n";
    std::cerr << "  rolling_mean ... "; run_rolling_mean(); std::cerr << "ok\n";
    std::cerr << "  candidate_merge ... "; run_candidate_merge(); std::cerr << "ok\n";
    std::cerr << "  grid_truncation ... "; run_grid_truncation(); std::cerr << "ok\n";
    std::cerr << "  float_range ... "; run_float_range(); std::cerr << "ok\n";
    std::cerr << "  param_spec_errors ... "; run_param_spec_errors(); std::cerr << "ok\n";
    std::cerr << "  shuffle_determinism ... "; run_shuffle_determinism(); std::cerr << "ok\n";
    std::cerr << "  iteration_wraparound ... "; run_iteration_wraparound(); std::cerr << "ok\n";
    std::cerr << "  metrics ... "; run_metrics(); std::cerr << "ok\n";
    std::cerr << "  simulator_stop_precedence ... "; run_simulator_stop_precedence(); std::cerr << "ok\n";
    std::cerr << "  simulator_take_profit ... "; run_simulator_take_profit(); std::cerr << "ok\n";
    std::cerr << "  simulator_flip_cost ... "; run_simulator_flip_cost(); std::cerr << "ok\n";
    std::cerr << "  backtest_insufficient_bars ... "; run_backtest_insufficient_bars(); std::cerr << "ok\n";
    std::cerr << "  backtest_rising_no_trades ... "; run_backtest_rising_no_trades(); std::cerr << "ok\n";
    std::cerr << "  backtest_deterministic ... "; run_backtest_deterministic(); std::cerr << "ok\n";
    std::cerr << "  backtest_same_bar_reentry ... "; run_backtest_same_bar_reentry(); std::cerr << "ok\n";
    std::cerr << "  supertrend_signals ... "; run_supertrend_signals(); std::cerr << "ok\n";
    std::cerr << "  sampler_determinism ... "; run_sampler_determinism(); std::cerr << "ok\n";
    std::cerr << "  ema_normalize ... "; run_ema_normalize(); std::cerr << "ok\n";
    std::cerr << "  ema_entry_gates ... "; run_ema_entry_gates(); std::cerr << "ok\n";
    std::cerr << "  strategy_registry ... "; run_strategy_registry(); std::cerr << "ok\n";
    std::cerr << "  cost_resolution ... "; run_cost_resolution(); std::cerr << "ok\n";
    std::cerr << "  gates ... "; run_gates(); std::cerr << "ok\n";
    std::cerr << "  cycle_max_retries ... "; run_cycle_max_retries(); std::cerr << "ok\n";
    std::cerr << "  manual_override ... "; run_manual_override(); std::cerr << "ok\n";
    std::cerr << "  data_source_csv_load ... "; run_data_source_csv_load(); std::cerr << "ok\n";
    std::cerr << "  data_source_discovery ... "; run_data_source_discovery(); std::cerr << "ok\n";
}

} // namespace

int main() {
    std::cerr << "Running tests...\n";
    run_all_tests();
    std::cerr << "All tests passed.\n";
    return 0;
}
