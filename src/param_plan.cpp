#include "param_plan.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace botfarm {

namespace {

double roundTo(double v, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

std::vector<double> frange(double min_v, double max_v, double step) {
    std::vector<double> values;
    const int decimals = stepDecimals(step);
    const double epsilon = step / 1000.0;
    for (double current = min_v; current <= max_v + epsilon; current += step)
        values.push_back(roundTo(current, decimals));
    return values;
}

ParamValue cast(double v, ValueType type) {
    if (type == ValueType::Integer)
        return ParamValue{ValueType::Integer, std::nearbyint(v)};  // round half to even
    return ParamValue::real(v);
}

std::size_t saturatingMultiply(std::size_t a, std::size_t b) {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a)
        return std::numeric_limits<std::size_t>::max();
    return a * b;
}

} // namespace

int stepDecimals(double step) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.12f", step);
    std::string text(buf);
    auto last = text.find_last_not_of('0');
    text.erase(last + 1);
    auto dot = text.find('.');
    if (dot == std::string::npos) return 0;
    return static_cast<int>(text.size() - dot - 1);
}

bool valuesFromSpec(const std::string& name, const ParamSpec& spec,
                    std::vector<ParamValue>& out, std::string& error_msg) {
    out.clear();
    if (!spec.enabled) {
        if (!spec.value) {
            error_msg = "Parameter '" + name + "' is disabled but has no fixed 'value'";
            return false;
        }
        if (!std::isfinite(*spec.value)) {
            error_msg = "Parameter '" + name + "' has a non-finite 'value'";
            return false;
        }
        out.push_back(cast(*spec.value, spec.type));
        return true;
    }

    if (!spec.min) { error_msg = "Parameter '" + name + "' missing 'min'"; return false; }
    if (!spec.max) { error_msg = "Parameter '" + name + "' missing 'max'"; return false; }
    if (!spec.step) { error_msg = "Parameter '" + name + "' missing 'step'"; return false; }
    if (*spec.step <= 0) { error_msg = "Parameter '" + name + "' has non-positive step"; return false; }
    if (!std::isfinite(*spec.min) || !std::isfinite(*spec.max) || !std::isfinite(*spec.step)) {
        error_msg = "Parameter '" + name + "' has a non-finite min, max or step";
        return false;
    }
    if (*spec.min > *spec.max) { error_msg = "Parameter '" + name + "' has min > max"; return false; }
    // Float spacing is widest at the larger-magnitude end; a step lost there would never advance.
    if (*spec.min + *spec.step == *spec.min || *spec.max + *spec.step == *spec.max) {
        error_msg = "Parameter '" + name + "' has a step too small for its range";
        return false;
    }

    for (double v : frange(*spec.min, *spec.max, *spec.step))
        out.push_back(cast(v, spec.type));
    return true;
}

void shuffleCandidates(std::vector<Candidate>& candidates, std::mt19937& rng) {
    std::shuffle(candidates.begin(), candidates.end(), rng);
}

bool buildParamPlan(const std::string& strategy_id, const ParameterSpaces& spaces,
                    ParamPlan& plan, std::string& error_msg) {
    plan = ParamPlan{};
    auto it = spaces.find(strategy_id);
    if (it == spaces.end()) {
        plan.reason = "no parameter_space config for strategy";
        return true;
    }
    const ParameterSpace& space = it->second;
    if (space.parameters.empty()) {
        plan.reason = "empty parameter_space.parameters";
        return true;
    }

    std::vector<std::string> names;
    std::vector<std::vector<ParamValue>> values_by_param;
    std::size_t raw_total = 1;
    for (const auto& [name, spec] : space.parameters) {
        std::vector<ParamValue> values;
        if (!valuesFromSpec(name, spec, values, error_msg)) return false;

        ParamSummary summary;
        summary.name = name;
        summary.enabled = spec.enabled;
        summary.type = spec.type;
        summary.count = values.size();
        summary.min = spec.min;
        summary.max = spec.max;
        summary.step = spec.step;
        summary.value = spec.value;
        plan.space.push_back(summary);

        raw_total = saturatingMultiply(raw_total, values.size());
        names.push_back(name);
        values_by_param.push_back(std::move(values));
    }

    // Cartesian product in declaration order, last parameter varying fastest.
    // First-N truncation at max_combinations; the first combination is always kept.
    const std::size_t limit = space.max_combinations > 0 ? static_cast<std::size_t>(space.max_combinations) : 1;
    std::vector<std::size_t> odometer(names.size(), 0);
    bool exhausted = false;
    while (!exhausted) {
        std::vector<Candidate::Entry> entries;
        entries.reserve(names.size());
        for (std::size_t p = 0; p < names.size(); ++p)
            entries.emplace_back(names[p], values_by_param[p][odometer[p]]);
        plan.candidates.emplace_back(std::move(entries));
        if (plan.candidates.size() >= limit) break;

        exhausted = true;
        for (std::size_t p = names.size(); p-- > 0;) {
            if (++odometer[p] < values_by_param[p].size()) {
                exhausted = false;
                break;
            }
            odometer[p] = 0;
        }
    }

    if (space.shuffle) {
        std::mt19937 rng(space.seed);
        shuffleCandidates(plan.candidates, rng);
    }

    // "random" is currently grid enumeration with the shuffle above, drawn sequentially by iteration.
    plan.source = "parameter_space";
    plan.reason = "configured";
    plan.search_mode = space.search_mode;
    plan.total_candidates = plan.candidates.size();
    plan.raw_total_candidates = raw_total;
    plan.truncated = raw_total > plan.total_candidates;
    return true;
}

std::pair<Candidate, OptimizationMode> paramsForIteration(int iteration, const ParamPlan& plan,
                                                          const Candidate& fallback) {
    OptimizationMode mode;
    if (!plan.usesParameterSpace()) {
        mode.source = "strategy_sample";
        mode.reason = plan.reason.empty() ? "fallback" : plan.reason;
        return {fallback, mode};
    }

    const long total = static_cast<long>(plan.candidates.size());
    long idx = (static_cast<long>(iteration) - 1) % total;
    if (idx < 0) idx += total;

    mode.source = "parameter_space";
    mode.reason = plan.reason;
    mode.candidate_index = static_cast<std::size_t>(idx);
    mode.total_candidates = plan.candidates.size();
    mode.search_mode = plan.search_mode;
    mode.truncated = plan.truncated;
    mode.raw_total_candidates = plan.raw_total_candidates;
    return {plan.candidates[static_cast<std::size_t>(idx)], mode};
}

} // namespace botfarm
