#include "strategy.hpp"
#include <functional>
#include <map>

namespace botfarm {

namespace {

const std::map<std::string, std::function<Strategy()>>& registry() {
    static const std::map<std::string, std::function<Strategy()>> table = {
        {EmaCrossAtrStrategy::kId, [] { return Strategy(EmaCrossAtrStrategy{}); }},
        {SupertrendRsiStrategy::kId, [] { return Strategy(SupertrendRsiStrategy{}); }},
    };
    return table;
}

} // namespace

std::optional<Strategy> findStrategy(const std::string& id) {
    const auto& table = registry();
    auto it = table.find(id);
    if (it == table.end()) return std::nullopt;
    return it->second();
}

std::vector<std::pair<std::string, std::string>> listStrategies() {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& entry : registry()) {
        Strategy s = entry.second();
        out.emplace_back(s.id(), s.displayName());
    }
    return out;
}

} // namespace botfarm
