#include "supertrend_rsi_strategy.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace botfarm {

namespace {

constexpr double ATR_FALLBACK_FRACTION = 0.01;

double round1(double v) { return std::round(v * 10.0) / 10.0; }

/// Clamp a look-back to [floor, limit]; the bar-derived limit wins on short datasets.
int clampPeriod(int value, int floor, int limit) {
    return std::min(std::max(value, floor), std::max(limit, 1));
}

} // namespace

Candidate SupertrendRsiStrategy::sampleParams(int iteration) const {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(iteration));
    auto uniform = [&rng](double lo, double hi) {
        return std::uniform_real_distribution<double>(lo, hi)(rng);
    };
    double st_mult = round1(2.0 + uniform(0.0, 2.0));
    double stop = round1(1.5 + uniform(0.0, 1.5));
    double take = round1(2.0 + uniform(0.0, 3.0));

    return Candidate({
        {"st_period", ParamValue::integer(8 + iteration % 7)},
        {"st_mult", ParamValue::real(st_mult)},
        {"rsi_period", ParamValue::integer(14)},
        {"ema_period", ParamValue::integer(150 + (iteration % 3) * 50)},
        {"min_adx", ParamValue::integer(15 + (iteration % 3) * 5)},
        {"atr_period", ParamValue::integer(14)},
        {"atr_mult_stop", ParamValue::real(stop)},
        {"atr_mult_take", ParamValue::real(take)},
    });
}

Candidate SupertrendRsiStrategy::normalizeParams(const Candidate& params, std::size_t bar_count) const {
    const int max_period = static_cast<int>(bar_count / 3);

    return params
        .with("st_period", ParamValue::integer(clampPeriod(params.getInt("st_period", 10), 5, max_period)))
        .with("st_mult", ParamValue::real(std::max(1.0, std::min(params.getDouble("st_mult", 3.0), 5.0))))
        .with("rsi_period", ParamValue::integer(clampPeriod(params.getInt("rsi_period", 14), 2, max_period)))
        .with("ema_period", ParamValue::integer(clampPeriod(params.getInt("ema_period", 200), 20, max_period)))
        .with("min_adx", ParamValue::integer(std::max(0, std::min(params.getInt("min_adx", 20), 50))))
        .with("atr_period", ParamValue::integer(clampPeriod(params.getInt("atr_period", 14), 5, max_period)))
        .with("atr_mult_stop", ParamValue::real(std::max(0.5, params.getDouble("atr_mult_stop", 2.0))))
        .with("atr_mult_take", ParamValue::real(std::max(0.5, params.getDouble("atr_mult_take", 3.0))));
}

IndicatorSet SupertrendRsiStrategy::prepareIndicators(const std::vector<Bar>& bars, const Candidate& params) const {
    PriceColumns c = columns(bars);
    SupertrendBands bands = supertrend(c.high, c.low, c.close,
                                       params.getInt("st_period", 10), params.getDouble("st_mult", 3.0));
    IndicatorSet ind;
    ind.series["st_up"] = std::move(bands.up);
    ind.series["st_down"] = std::move(bands.down);
    ind.series["rsi"] = rsi(c.close, params.getInt("rsi_period", 14));
    ind.series["adx"] = adx(c.high, c.low, c.close, kAdxPeriod);
    ind.series["ema"] = ema(c.close, params.getInt("ema_period", 200));
    ind.series["atr"] = atr(c.high, c.low, c.close, params.getInt("atr_period", 14));
    ind.filters["min_adx"] = params.getInt("min_adx", 20);
    return ind;
}

Signal SupertrendRsiStrategy::entrySignal(std::size_t i, const std::vector<Bar>& bars,
                                          const IndicatorSet& ind) const {
    if (i < 1) return Signal::None;

    const Series& up = ind.at("st_up");
    const Series& down = ind.at("st_down");
    const auto& momentum = ind.at("rsi")[i - 1];
    const auto& strength = ind.at("adx")[i - 1];
    const auto& bias = ind.at("ema")[i - 1];
    double prev_close = bars[i - 1].close;

    if ((!up[i] && !down[i]) || (!up[i - 1] && !down[i - 1]) || !momentum || !strength || !bias)
        return Signal::None;

    if (*strength < ind.filter("min_adx", 20)) return Signal::None;

    if (down[i - 1] && up[i] && *momentum > 50 && prev_close > *bias) return Signal::Long;
    if (up[i - 1] && down[i] && *momentum < 50 && prev_close < *bias) return Signal::Short;
    return Signal::None;
}

bool SupertrendRsiStrategy::shouldFlip(std::size_t i, Side side, const std::vector<Bar>& /*bars*/,
                                       const IndicatorSet& ind) const {
    const auto& up = ind.at("st_up")[i];
    const auto& down = ind.at("st_down")[i];
    if (side == Side::Long) return down.has_value();
    return up.has_value();
}

RiskLevels SupertrendRsiStrategy::riskLevels(std::size_t i, Side side, double entry_price,
                                             const std::vector<Bar>& /*bars*/, const IndicatorSet& ind,
                                             const Candidate& params) const {
    const auto& range = ind.at("atr")[i];
    double atr_value = range ? *range : std::max(entry_price * ATR_FALLBACK_FRACTION, 1e-8);
    return bracket(side, entry_price,
                   atr_value * params.getDouble("atr_mult_stop", 2.0),
                   atr_value * params.getDouble("atr_mult_take", 3.0));
}

double SupertrendRsiStrategy::defaultTradeCost(const std::string& market, const std::string& /*timeframe*/) const {
    if (market == "forex") return 0.0001;
    if (market == "crypto") return 0.0005;
    if (market == "indices") return 0.0002;
    if (market == "commodities") return 0.0003;
    if (market == "equities") return 0.00025;
    return 0.0002;
}

} // namespace botfarm
