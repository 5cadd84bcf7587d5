#include "ema_cross_atr_strategy.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace botfarm {

namespace {

constexpr int DEFAULT_EMA_FAST = 20;
constexpr int DEFAULT_EMA_SLOW = 50;
constexpr int DEFAULT_ATR_PERIOD = 14;
constexpr int DEFAULT_RSI_PERIOD = 14;
constexpr int DEFAULT_ATR_VOL_WINDOW = 20;
constexpr double DEFAULT_RSI_GATE = 50.0;
constexpr double DEFAULT_ATR_VOL_RATIO_MAX = 2.0;
constexpr double DEFAULT_ATR_MULT_STOP = 1.5;
constexpr double DEFAULT_ATR_MULT_TAKE = 2.0;
constexpr double ATR_FALLBACK_FRACTION = 0.005;

double round2(double v) { return std::round(v * 100.0) / 100.0; }

} // namespace

Candidate EmaCrossAtrStrategy::sampleParams(int iteration) const {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(iteration));
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double stop_jitter = unit(rng);
    double take_jitter = unit(rng);

    return Candidate({
        {"ema_fast", ParamValue::integer(DEFAULT_EMA_FAST + iteration)},
        {"ema_slow", ParamValue::integer(DEFAULT_EMA_SLOW + iteration)},
        {"atr_mult_stop", ParamValue::real(round2(1.2 + 0.1 * stop_jitter))},
        {"atr_mult_take", ParamValue::real(round2(1.8 + 0.2 * take_jitter))},
        {"atr_period", ParamValue::integer(DEFAULT_ATR_PERIOD)},
    });
}

Candidate EmaCrossAtrStrategy::normalizeParams(const Candidate& params, std::size_t bar_count) const {
    const int half = static_cast<int>(bar_count / 2);

    int max_slow = std::max(6, std::min(params.getInt("ema_slow", DEFAULT_EMA_SLOW), half));
    int ema_slow = std::max(5, max_slow);
    int ema_fast = std::max(3, std::min(params.getInt("ema_fast", DEFAULT_EMA_FAST), ema_slow - 1));
    int atr_period = std::max(5, std::min(params.getInt("atr_period", DEFAULT_ATR_PERIOD), half));
    int rsi_period = std::max(2, std::min(params.getInt("rsi_period", DEFAULT_RSI_PERIOD), half));
    int vol_window = std::max(5, std::min(params.getInt("atr_vol_window", DEFAULT_ATR_VOL_WINDOW), half));
    double rsi_gate = std::max(40.0, std::min(params.getDouble("rsi_gate", DEFAULT_RSI_GATE), 60.0));

    return params
        .with("ema_fast", ParamValue::integer(ema_fast))
        .with("ema_slow", ParamValue::integer(ema_slow))
        .with("atr_period", ParamValue::integer(atr_period))
        .with("atr_mult_stop", ParamValue::real(std::max(0.5, params.getDouble("atr_mult_stop", DEFAULT_ATR_MULT_STOP))))
        .with("atr_mult_take", ParamValue::real(std::max(0.5, params.getDouble("atr_mult_take", DEFAULT_ATR_MULT_TAKE))))
        .with("rsi_period", ParamValue::integer(rsi_period))
        .with("rsi_gate", ParamValue::real(rsi_gate))
        .with("atr_vol_window", ParamValue::integer(vol_window))
        .with("atr_vol_ratio_max", ParamValue::real(std::max(1.0, params.getDouble("atr_vol_ratio_max", DEFAULT_ATR_VOL_RATIO_MAX))));
}

IndicatorSet EmaCrossAtrStrategy::prepareIndicators(const std::vector<Bar>& bars, const Candidate& params) const {
    PriceColumns c = columns(bars);
    IndicatorSet ind;
    ind.series["ema_fast"] = ema(c.close, params.getInt("ema_fast", DEFAULT_EMA_FAST));
    ind.series["ema_slow"] = ema(c.close, params.getInt("ema_slow", DEFAULT_EMA_SLOW));
    ind.series["atr"] = atr(c.high, c.low, c.close, params.getInt("atr_period", DEFAULT_ATR_PERIOD));
    ind.series["rsi"] = rsi(c.close, params.getInt("rsi_period", DEFAULT_RSI_PERIOD));
    ind.series["atr_avg"] = rollingMean(ind.series["atr"], params.getInt("atr_vol_window", DEFAULT_ATR_VOL_WINDOW));
    ind.filters["rsi_gate"] = params.getDouble("rsi_gate", DEFAULT_RSI_GATE);
    ind.filters["atr_vol_ratio_max"] = params.getDouble("atr_vol_ratio_max", DEFAULT_ATR_VOL_RATIO_MAX);
    return ind;
}

Signal EmaCrossAtrStrategy::crossover(std::size_t i, const IndicatorSet& ind) {
    if (i < 1) return Signal::None;
    const Series& fast = ind.at("ema_fast");
    const Series& slow = ind.at("ema_slow");
    if (!fast[i - 1] || !slow[i - 1] || !fast[i] || !slow[i]) return Signal::None;

    double prev_fast = *fast[i - 1], prev_slow = *slow[i - 1];
    double curr_fast = *fast[i], curr_slow = *slow[i];
    if (prev_fast <= prev_slow && curr_fast > curr_slow) return Signal::Long;
    if (prev_fast >= prev_slow && curr_fast < curr_slow) return Signal::Short;
    return Signal::None;
}

Signal EmaCrossAtrStrategy::entrySignal(std::size_t i, const std::vector<Bar>& /*bars*/,
                                        const IndicatorSet& ind) const {
    Signal cross = crossover(i, ind);
    if (cross == Signal::None) return Signal::None;

    // Gates read the completed previous bar.
    const auto& momentum = ind.at("rsi")[i - 1];
    const auto& vol = ind.at("atr")[i - 1];
    const auto& vol_avg = ind.at("atr_avg")[i - 1];
    if (!momentum || !vol || !vol_avg || *vol_avg <= 0) return Signal::None;

    double gate = ind.filter("rsi_gate", DEFAULT_RSI_GATE);
    if (cross == Signal::Long && *momentum < gate) return Signal::None;
    if (cross == Signal::Short && *momentum > 100.0 - gate) return Signal::None;

    if (*vol / *vol_avg > ind.filter("atr_vol_ratio_max", DEFAULT_ATR_VOL_RATIO_MAX)) return Signal::None;
    return cross;
}

bool EmaCrossAtrStrategy::shouldFlip(std::size_t i, Side side, const std::vector<Bar>& /*bars*/,
                                     const IndicatorSet& ind) const {
    Signal cross = crossover(i, ind);
    return (side == Side::Long && cross == Signal::Short) || (side == Side::Short && cross == Signal::Long);
}

RiskLevels EmaCrossAtrStrategy::riskLevels(std::size_t i, Side side, double entry_price,
                                           const std::vector<Bar>& /*bars*/, const IndicatorSet& ind,
                                           const Candidate& params) const {
    const auto& range = ind.at("atr")[i];
    double atr_value = range ? *range : std::max(entry_price * ATR_FALLBACK_FRACTION, 1e-8);
    return bracket(side, entry_price,
                   atr_value * params.getDouble("atr_mult_stop", DEFAULT_ATR_MULT_STOP),
                   atr_value * params.getDouble("atr_mult_take", DEFAULT_ATR_MULT_TAKE));
}

double EmaCrossAtrStrategy::defaultTradeCost(const std::string& /*market*/, const std::string& /*timeframe*/) const {
    return 0.0002;
}

} // namespace botfarm
