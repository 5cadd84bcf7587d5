#pragma once

#include "params.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace botfarm {

/// Declared range for one parameter. Enabled: min <= max and step > 0. Disabled: `value` required.
struct ParamSpec {
    bool enabled{true};
    ValueType type{ValueType::Real};
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> step;
    std::optional<double> value;
};

/// Search space for one strategy. Parameters are enumerated in declaration order.
struct ParameterSpace {
    std::string search_mode{"grid"};   // "grid" or "random" (random == grid + shuffle)
    long max_combinations{5000};
    bool shuffle{false};
    std::uint32_t seed{42};
    std::vector<std::pair<std::string, ParamSpec>> parameters;
};

/// strategy id -> parameter space
using ParameterSpaces = std::map<std::string, ParameterSpace>;

struct ParamSummary {
    std::string name;
    bool enabled{true};
    ValueType type{ValueType::Real};
    std::size_t count{0};
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> step;
    std::optional<double> value;
};

/// Ordered candidate list for a strategy, or a note that the strategy sampler must be used.
struct ParamPlan {
    std::string source{"strategy_sample"};   // "parameter_space" or "strategy_sample"
    std::string reason;
    std::string search_mode{"grid"};
    std::vector<ParamSummary> space;
    std::size_t total_candidates{0};
    std::size_t raw_total_candidates{0};
    bool truncated{false};
    std::vector<Candidate> candidates;

    bool usesParameterSpace() const { return source == "parameter_space" && !candidates.empty(); }
};

/// How the parameters of one iteration were chosen.
struct OptimizationMode {
    std::string source;
    std::string reason;
    std::optional<std::size_t> candidate_index;
    std::size_t total_candidates{0};
    std::string search_mode{"grid"};
    bool truncated{false};
    std::size_t raw_total_candidates{0};
};

/// Decimal places of `step` as printed with 12 fractional digits, trailing zeros dropped.
int stepDecimals(double step);

/// Values for a single parameter. Returns false and sets error_msg on a configuration error.
bool valuesFromSpec(const std::string& name, const ParamSpec& spec,
                    std::vector<ParamValue>& out, std::string& error_msg);

/// Reorder in place with the given generator; identical seeds give identical orders.
void shuffleCandidates(std::vector<Candidate>& candidates, std::mt19937& rng);

/// Expand the configured space for `strategy_id`. A missing or empty space yields a
/// "strategy_sample" plan. Returns false and sets error_msg on a configuration error.
bool buildParamPlan(const std::string& strategy_id, const ParameterSpaces& spaces,
                    ParamPlan& plan, std::string& error_msg);

/// Candidate for a 1-based iteration: index (iteration - 1) mod total, wrapping around.
/// Falls back to `fallback` when the plan has no candidates.
std::pair<Candidate, OptimizationMode> paramsForIteration(int iteration, const ParamPlan& plan,
                                                          const Candidate& fallback);

} // namespace botfarm
