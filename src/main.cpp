#include "backtester.hpp"
#include "cost.hpp"
#include "data_source.hpp"
#include "optimizer.hpp"
#include "param_plan.hpp"
#include "report.hpp"
#include "strategy.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace botfarm;

constexpr int DEFAULT_ITERATIONS = 10;
constexpr std::size_t PREVIEW_CANDIDATES = 10;

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_root = "data";
    std::string strategy_id = "ema_cross_atr";
    std::string reports_dir = "reports";
    DatasetFilter filter;
    int iterations = DEFAULT_ITERATIONS;
    bool preview = false;
    bool list_strategies = false;

    ParameterSpace space;
    CostConfig costs;
    RiskLimits limits;
    Candidate overrides;   // --set; non-empty means a single manual run
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const std::string& s, double& out, std::string& error_msg, const std::string& flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return true;
    } catch (const std::exception&) {
        error_msg = "Invalid value for " + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseLong(const std::string& s, long& out, std::string& error_msg, const std::string& flag) {
    try {
        std::size_t pos = 0;
        out = std::stol(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return true;
    } catch (const std::exception&) {
        error_msg = "Invalid value for " + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}
bool parseInt(const std::string& s, int& out, std::string& error_msg, const std::string& flag) {
    long v = 0;
    if (!parseLong(s, v, error_msg, flag)) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        error_msg = "Invalid value for " + flag + ": \"" + s + "\" (out of range)";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool looksIntegral(const std::string& s) {
    return !s.empty() && s.find_first_of(".eE") == std::string::npos;
}

std::vector<std::string> splitOn(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        std::size_t at = s.find(delim, start);
        parts.push_back(s.substr(start, at == std::string::npos ? std::string::npos : at - start));
        if (at == std::string::npos) break;
        start = at + 1;
    }
    return parts;
}

/// "name=rest" -> (name, rest). Both sides must be non-empty.
bool splitAssignment(const std::string& arg, std::string& name, std::string& rest,
                     std::string& error_msg, const std::string& flag) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
        error_msg = "Invalid value for " + flag + ": \"" + arg + "\" (expected name=value)";
        return false;
    }
    name = arg.substr(0, eq);
    rest = arg.substr(eq + 1);
    return true;
}

/// ":int" / ":float" suffix, or inferred from the literal(s) when absent.
bool parseTypeSuffix(const std::string& suffix, ValueType& type, std::string& error_msg, const std::string& flag) {
    if (suffix == "int" || suffix == "integer") { type = ValueType::Integer; return true; }
    if (suffix == "float" || suffix == "real") { type = ValueType::Real; return true; }
    error_msg = "Invalid type for " + flag + ": \"" + suffix + "\" (expected int or float)";
    return false;
}

void setParameter(ParameterSpace& space, const std::string& name, const ParamSpec& spec) {
    auto it = std::find_if(space.parameters.begin(), space.parameters.end(),
                           [&](const auto& p) { return p.first == name; });
    if (it != space.parameters.end())
        it->second = spec;
    else
        space.parameters.emplace_back(name, spec);
}

// --param name=min:max:step[:int|:float]
bool parseParamFlag(const std::string& arg, ParameterSpace& space, std::string& error_msg) {
    std::string name, rest;
    if (!splitAssignment(arg, name, rest, error_msg, "--param")) return false;
    std::vector<std::string> parts = splitOn(rest, ':');
    if (parts.size() != 3 && parts.size() != 4) {
        error_msg = "Invalid value for --param: \"" + arg + "\" (expected name=min:max:step[:int|:float])";
        return false;
    }
    ParamSpec spec;
    double min = 0, max = 0, step = 0;
    if (!parseDouble(parts[0], min, error_msg, "--param " + name)) return false;
    if (!parseDouble(parts[1], max, error_msg, "--param " + name)) return false;
    if (!parseDouble(parts[2], step, error_msg, "--param " + name)) return false;
    spec.min = min;
    spec.max = max;
    spec.step = step;
    if (parts.size() == 4) {
        if (!parseTypeSuffix(parts[3], spec.type, error_msg, "--param " + name)) return false;
    } else {
        bool integral = looksIntegral(parts[0]) && looksIntegral(parts[1]) && looksIntegral(parts[2]);
        spec.type = integral ? ValueType::Integer : ValueType::Real;
    }
    setParameter(space, name, spec);
    return true;
}

// --fixed name=value[:int|:float]
bool parseFixedFlag(const std::string& arg, ParameterSpace& space, std::string& error_msg) {
    std::string name, rest;
    if (!splitAssignment(arg, name, rest, error_msg, "--fixed")) return false;
    std::vector<std::string> parts = splitOn(rest, ':');
    if (parts.size() > 2) {
        error_msg = "Invalid value for --fixed: \"" + arg + "\" (expected name=value[:int|:float])";
        return false;
    }
    ParamSpec spec;
    spec.enabled = false;
    double value = 0;
    if (!parseDouble(parts[0], value, error_msg, "--fixed " + name)) return false;
    spec.value = value;
    if (parts.size() == 2) {
        if (!parseTypeSuffix(parts[1], spec.type, error_msg, "--fixed " + name)) return false;
    } else {
        spec.type = looksIntegral(parts[0]) ? ValueType::Integer : ValueType::Real;
    }
    setParameter(space, name, spec);
    return true;
}

// --market-cost market=fee_bps:slippage_bps (either side may be empty)
bool parseMarketCostFlag(const std::string& arg, CostConfig& costs, std::string& error_msg) {
    std::string market, rest;
    if (!splitAssignment(arg, market, rest, error_msg, "--market-cost")) return false;
    std::vector<std::string> parts = splitOn(rest, ':');
    if (parts.size() != 2) {
        error_msg = "Invalid value for --market-cost: \"" + arg + "\" (expected market=fee_bps:slippage_bps)";
        return false;
    }
    CostRates rates;
    double v = 0;
    if (!parts[0].empty()) {
        if (!parseDouble(parts[0], v, error_msg, "--market-cost " + market)) return false;
        rates.fee_bps_per_side = v;
    }
    if (!parts[1].empty()) {
        if (!parseDouble(parts[1], v, error_msg, "--market-cost " + market)) return false;
        rates.slippage_bps_per_side = v;
    }
    std::string key = market;
    for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    costs.market_costs[key] = rates;
    return true;
}

// --set name=value
bool parseOverrideFlag(const std::string& arg, Candidate& overrides, std::string& error_msg) {
    std::string name, rest;
    if (!splitAssignment(arg, name, rest, error_msg, "--set")) return false;
    if (looksIntegral(rest)) {
        int v = 0;
        if (!parseInt(rest, v, error_msg, "--set " + name)) return false;
        overrides = overrides.with(name, ParamValue::integer(v));
    } else {
        double v = 0;
        if (!parseDouble(rest, v, error_msg, "--set " + name)) return false;
        overrides = overrides.with(name, ParamValue::real(v));
    }
    return true;
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> bool {
            if (i + 1 < argc) { ++i; return true; }
            error_msg = "Missing value for " + arg;
            return false;
        };
        double d = 0;
        long l = 0;

        if (arg == "--data-root") { if (!next()) return false; cfg.data_root = argv[i]; }
        else if (arg == "--strategy") { if (!next()) return false; cfg.strategy_id = argv[i]; }
        else if (arg == "--reports-dir") { if (!next()) return false; cfg.reports_dir = argv[i]; }
        else if (arg == "--market") { if (!next()) return false; cfg.filter.markets.push_back(argv[i]); }
        else if (arg == "--symbol") { if (!next()) return false; cfg.filter.symbols.push_back(argv[i]); }
        else if (arg == "--timeframe") { if (!next()) return false; cfg.filter.timeframes.push_back(argv[i]); }
        else if (arg == "--iterations") { if (!next() || !parseInt(argv[i], cfg.iterations, error_msg, arg)) return false; }
        else if (arg == "--preview") { cfg.preview = true; }
        else if (arg == "--list-strategies") { cfg.list_strategies = true; }
        else if (arg == "--param") { if (!next() || !parseParamFlag(argv[i], cfg.space, error_msg)) return false; }
        else if (arg == "--fixed") { if (!next() || !parseFixedFlag(argv[i], cfg.space, error_msg)) return false; }
        else if (arg == "--max-combinations") { if (!next() || !parseLong(argv[i], cfg.space.max_combinations, error_msg, arg)) return false; }
        else if (arg == "--shuffle") { cfg.space.shuffle = true; }
        else if (arg == "--search-mode") { if (!next()) return false; cfg.space.search_mode = argv[i]; }
        else if (arg == "--seed") {
            if (!next() || !parseLong(argv[i], l, error_msg, arg)) return false;
            if (l < 0 || l > static_cast<long>(UINT32_MAX)) { error_msg = "--seed must be between 0 and 4294967295"; return false; }
            cfg.space.seed = static_cast<std::uint32_t>(l);
        }
        else if (arg == "--fee-bps") { if (!next() || !parseDouble(argv[i], d, error_msg, arg)) return false; cfg.costs.defaults.fee_bps_per_side = d; }
        else if (arg == "--slippage-bps") { if (!next() || !parseDouble(argv[i], d, error_msg, arg)) return false; cfg.costs.defaults.slippage_bps_per_side = d; }
        else if (arg == "--market-cost") { if (!next() || !parseMarketCostFlag(argv[i], cfg.costs, error_msg)) return false; }
        else if (arg == "--set") { if (!next() || !parseOverrideFlag(argv[i], cfg.overrides, error_msg)) return false; }
        else if (arg == "--min-sharpe") { if (!next() || !parseDouble(argv[i], cfg.limits.min_sharpe, error_msg, arg)) return false; }
        else if (arg == "--max-drawdown") { if (!next() || !parseDouble(argv[i], cfg.limits.strategy_max_drawdown_pct, error_msg, arg)) return false; }
        else if (arg == "--max-oos") { if (!next() || !parseDouble(argv[i], cfg.limits.max_oos_degradation_pct, error_msg, arg)) return false; }
        else if (arg == "--max-retries") { if (!next() || !parseInt(argv[i], cfg.limits.max_retries, error_msg, arg)) return false; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

bool negativeRate(const CostRates& r) {
    return (r.fee_bps_per_side && *r.fee_bps_per_side < 0) ||
           (r.slippage_bps_per_side && *r.slippage_bps_per_side < 0);
}

/// Returns false and sets error_msg if config is invalid.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (cfg.iterations < 1) { error_msg = "--iterations must be >= 1"; return false; }
    if (cfg.limits.max_retries < 1) { error_msg = "--max-retries must be >= 1"; return false; }
    if (cfg.limits.strategy_max_drawdown_pct < 0) { error_msg = "--max-drawdown must be >= 0"; return false; }
    if (cfg.limits.max_oos_degradation_pct < 0) { error_msg = "--max-oos must be >= 0"; return false; }
    if (cfg.space.max_combinations < 1) { error_msg = "--max-combinations must be >= 1"; return false; }
    if (cfg.space.search_mode != "grid" && cfg.space.search_mode != "random") {
        error_msg = "--search-mode must be grid or random"; return false;
    }
    if (negativeRate(cfg.costs.defaults)) { error_msg = "--fee-bps and --slippage-bps must be >= 0"; return false; }
    for (const auto& [market, rates] : cfg.costs.market_costs)
        if (negativeRate(rates)) { error_msg = "--market-cost " + market + ": rates must be >= 0"; return false; }
    return true;
}

void printStrategies(std::ostream& out) {
    for (const auto& [id, name] : listStrategies())
        out << "  " << std::left << std::setw(18) << id << name << "\n";
    out << std::right;
}

void printPlan(const ParamPlan& plan, const std::string& strategy_id, std::ostream& out) {
    out << "\n========== Parameter Plan ==========\n";
    out << "Strategy:   " << strategy_id << "\n";
    out << "Source:     " << plan.source << " (" << plan.reason << ")\n";
    if (!plan.usesParameterSpace()) {
        out << "====================================\n\n";
        return;
    }
    out << "Mode:       " << plan.search_mode << "\n";
    out << "Candidates: " << plan.total_candidates << " of " << plan.raw_total_candidates
        << (plan.truncated ? " (truncated)" : "") << "\n\n";
    for (const auto& p : plan.space) {
        out << "  " << std::left << std::setw(18) << p.name << std::right;
        if (p.enabled && p.min && p.max && p.step)
            out << *p.min << " .. " << *p.max << " step " << *p.step;
        else if (p.value)
            out << "fixed " << *p.value;
        out << "  [" << (p.type == ValueType::Integer ? "int" : "float") << ", " << p.count << " value"
            << (p.count == 1 ? "" : "s") << "]\n";
    }
    out << "\n";
    std::size_t shown = std::min(PREVIEW_CANDIDATES, plan.candidates.size());
    for (std::size_t i = 0; i < shown; ++i)
        out << "  #" << (i + 1) << "  " << plan.candidates[i].describe() << "\n";
    if (plan.candidates.size() > shown)
        out << "  ... " << (plan.candidates.size() - shown) << " more\n";
    out << "====================================\n\n";
}

void printIteration(const IterationRecord& rec, std::ostream& out) {
    const auto& m = rec.backtest.metrics;
    out << "[iteration " << rec.iteration << "] ";
    if (!rec.backtest.ok()) out << "failed (" << rec.backtest.reason << ") ";
    out << std::fixed << std::setprecision(2)
        << "return=" << m.total_return_pct << "% dd=" << m.max_drawdown_pct << "% sharpe=" << m.sharpe
        << " oos=" << m.oos_degradation_pct << "% trades=" << rec.backtest.trades.size()
        << (rec.gates.promoted ? " PROMOTED" : "") << "  " << rec.params.describe() << "\n";
    out.unsetf(std::ios::floatfield);
}

//-----------------------------------------------------------------------------
// Print and write the reports of one result
//-----------------------------------------------------------------------------
int emitResult(const Config& cfg, const Strategy& strategy, const IterationRecord& rec) {
    Report report(rec.backtest, strategy.displayName());
    report.printSummary(std::cout);
    std::cout << "Gates: drawdown " << (rec.gates.pass_drawdown ? "pass" : "fail")
              << ", sharpe " << (rec.gates.pass_sharpe ? "pass" : "fail")
              << ", oos " << (rec.gates.pass_oos_degradation ? "pass" : "fail")
              << (rec.gates.promoted ? " -> promoted" : "") << "\n";

    if (!rec.backtest.ok()) {
        std::cerr << "Backtest failed: " << rec.backtest.reason
                  << " (check --data-root, --market, --symbol, --timeframe: " << cfg.data_root << ")\n";
        return 1;
    }

    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Failed to create reports directory " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    bool written = report.writeTradeLog((fs::path(cfg.reports_dir) / "trades.csv").string());
    written = report.writeEquityCurve((fs::path(cfg.reports_dir) / "equity_curve.csv").string()) && written;
    written = report.writeReport((fs::path(cfg.reports_dir) / "report.txt").string()) && written;
    if (!written) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return 0;
}

/// Promoted record if any, otherwise the best score; earliest wins ties.
const IterationRecord& pickBest(const CycleOutcome& outcome) {
    const IterationRecord* best = &outcome.records.front();
    for (const auto& rec : outcome.records) {
        if (rec.gates.promoted) return rec;
        if (rec.score > best->score) best = &rec;
    }
    return *best;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    if (cfg.list_strategies) {
        printStrategies(std::cout);
        return 0;
    }

    // Resolve default data root when running from build/
    if (!fs::is_directory(cfg.data_root) && fs::is_directory(fs::path("..") / cfg.data_root))
        cfg.data_root = (fs::path("..") / cfg.data_root).string();

    std::optional<Strategy> strategy = findStrategy(cfg.strategy_id);
    if (!strategy) {
        std::cerr << "Unknown strategy: " << cfg.strategy_id << "\n";
        std::cerr << "Available:\n";
        printStrategies(std::cerr);
        return 1;
    }

    ParameterSpaces spaces;
    if (!cfg.space.parameters.empty()) spaces[cfg.strategy_id] = cfg.space;
    ParamPlan plan;
    if (!buildParamPlan(cfg.strategy_id, spaces, plan, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    if (cfg.preview) {
        printPlan(plan, cfg.strategy_id, std::cout);
        return 0;
    }

    if (!cfg.overrides.empty()) {
        IterationRecord rec = simulateManual(*strategy, cfg.overrides, cfg.costs, cfg.limits,
                                             cfg.data_root, cfg.filter);
        printIteration(rec, std::cout);
        return emitResult(cfg, *strategy, rec);
    }

    OptimizationCycle cycle(*strategy, plan, cfg.costs, cfg.limits);
    CycleOutcome outcome = cycle.run(cfg.iterations, cfg.data_root, cfg.filter,
                                     [](const IterationRecord& rec) { printIteration(rec, std::cout); });
    std::cout << "Stopped after " << outcome.records.size() << " iteration(s): " << outcome.stop_reason << "\n";
    return emitResult(cfg, *strategy, pickBest(outcome));
}
