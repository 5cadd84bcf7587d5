#pragma once

#include <string>
#include <utility>
#include <vector>

namespace botfarm {

enum class ValueType { Integer, Real };

/// Typed parameter value. Integers are stored exactly in `number`.
struct ParamValue {
    ValueType type{ValueType::Real};
    double number{0};

    static ParamValue integer(long v) { return {ValueType::Integer, static_cast<double>(v)}; }
    static ParamValue real(double v) { return {ValueType::Real, v}; }

    /// Truncated toward zero and saturated to the int range; NaN reads as 0.
    int asInt() const;
    double asDouble() const { return number; }
    std::string toString() const;

    bool operator==(const ParamValue& o) const { return type == o.type && number == o.number; }
    bool operator!=(const ParamValue& o) const { return !(*this == o); }
};

/// Immutable assignment of parameter name -> value, in insertion order.
/// Modifiers return a new Candidate.
class Candidate {
public:
    using Entry = std::pair<std::string, ParamValue>;

    Candidate() = default;
    explicit Candidate(std::vector<Entry> entries);

    /// Copy with `name` set to `value` (replaced in place if present, appended otherwise).
    Candidate with(const std::string& name, ParamValue value) const;

    /// Copy with every entry of `overrides` applied on top.
    Candidate merged(const Candidate& overrides) const;

    bool has(const std::string& name) const;
    const ParamValue* find(const std::string& name) const;

    /// Integer view of `name`; non-integer values are truncated like int(). `fallback` if missing.
    int getInt(const std::string& name, int fallback) const;
    double getDouble(const std::string& name, double fallback) const;

    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// "name=value name=value" for reports.
    std::string describe() const;

    bool operator==(const Candidate& o) const { return entries_ == o.entries_; }
    bool operator!=(const Candidate& o) const { return !(*this == o); }

private:
    std::vector<Entry> entries_;
};

} // namespace botfarm
