// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Options Specification                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/option.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cqlgen::keyspace {

/// Top-level option value: flag (no value), rendered scalar, or nested map
using OptionValue = std::variant<std::monostate, std::string, cql::OptionMap>;

/// Insertion-ordered `WITH` clause options of a keyspace or table
class OptionsSpecification {
public:
    using Entry = std::pair<std::string, OptionValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    /// Scalar or flag option; the value is validated and rendered with the
    /// option's escape and quote flags
    OptionsSpecification& with(const cql::Option& option, cql::Scalar value = {});

    /// Nested map option; only legal for options of type Map, never empty
    OptionsSpecification& with(const cql::Option& option, cql::OptionMap value);

    /// Option not in the known catalogue; `name` must be an unquoted identifier
    OptionsSpecification& with(std::string_view name, cql::Scalar value,
                               bool escape, bool quote);

    [[nodiscard]] const OptionValue* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const OptionsSpecification& other) const { return entries_ == other.entries_; }
    bool operator!=(const OptionsSpecification& other) const { return !(*this == other); }

private:
    void put(std::string name, OptionValue value);

    std::vector<Entry> entries_;
};

/// Fluent `with(...)` overloads shared by the keyspace and table builders
template<typename Derived>
class OptionsBuilder {
public:
    Derived& with(const cql::Option& option, cql::Scalar value = {}) {
        options_.with(option, std::move(value));
        return self();
    }

    Derived& with(const cql::Option& option, cql::OptionMap value) {
        options_.with(option, std::move(value));
        return self();
    }

    Derived& with(std::string_view name, cql::Scalar value, bool escape, bool quote) {
        options_.with(name, std::move(value), escape, quote);
        return self();
    }

    /// Known option enumerator, e.g. `with(cql::TableOption::Comment, ...)`
    template<typename Known, typename = decltype(cql::to_option(std::declval<Known>()))>
    Derived& with(Known option, cql::Scalar value = {}) {
        return with(cql::to_option(option), std::move(value));
    }

    template<typename Known, typename = decltype(cql::to_option(std::declval<Known>()))>
    Derived& with(Known option, cql::OptionMap value) {
        return with(cql::to_option(option), std::move(value));
    }

protected:
    OptionsSpecification options_;

private:
    Derived& self() { return static_cast<Derived&>(*this); }
};

} // namespace cqlgen::keyspace
