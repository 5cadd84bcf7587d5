#include "params.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace botfarm {

int ParamValue::asInt() const {
    if (std::isnan(number)) return 0;
    if (number >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    if (number <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
    return static_cast<int>(number);
}

std::string ParamValue::toString() const {
    std::ostringstream out;
    if (type == ValueType::Integer) {
        out << std::fixed << std::setprecision(0) << number;
    } else {
        out.precision(12);
        out << number;
    }
    return out.str();
}

Candidate::Candidate(std::vector<Entry> entries) : entries_(std::move(entries)) {}

Candidate Candidate::with(const std::string& name, ParamValue value) const {
    Candidate copy(*this);
    auto it = std::find_if(copy.entries_.begin(), copy.entries_.end(),
                           [&](const Entry& e) { return e.first == name; });
    if (it != copy.entries_.end())
        it->second = value;
    else
        copy.entries_.emplace_back(name, value);
    return copy;
}

Candidate Candidate::merged(const Candidate& overrides) const {
    Candidate out(*this);
    for (const auto& [name, value] : overrides.entries_)
        out = out.with(name, value);
    return out;
}

bool Candidate::has(const std::string& name) const {
    return find(name) != nullptr;
}

const ParamValue* Candidate::find(const std::string& name) const {
    for (const auto& e : entries_)
        if (e.first == name) return &e.second;
    return nullptr;
}

int Candidate::getInt(const std::string& name, int fallback) const {
    const ParamValue* v = find(name);
    return v ? v->asInt() : fallback;
}

double Candidate::getDouble(const std::string& name, double fallback) const {
    const ParamValue* v = find(name);
    return v ? v->asDouble() : fallback;
}

std::string Candidate::describe() const {
    std::string out;
    for (const auto& [name, value] : entries_) {
        if (!out.empty()) out += ' ';
        out += name + "=" + value.toString();
    }
    return out;
}

} // namespace botfarm
