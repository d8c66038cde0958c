// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Options Specification Implementation                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/options_specification.hpp"
#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/types.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace cqlgen::keyspace {

OptionsSpecification& OptionsSpecification::with(const cql::Option& option, cql::Scalar value) {
    option.check_value(value);

    if (cql::is_null(value)) {
        put(option.name(), std::monostate{});
    } else {
        put(option.name(), option.to_string(value));
    }
    return *this;
}

OptionsSpecification& OptionsSpecification::with(const cql::Option& option, cql::OptionMap value) {
    if (option.type() != cql::OptionType::Map) {
        throw SpecificationError(ErrorCode::InvalidOptionValue,
            fmt::format("Option [{}] does not take a map value", option.name()));
    }
    if (value.empty()) {
        throw SpecificationError(ErrorCode::InvalidOptionValue,
            fmt::format("Option [{}] requires a non-empty map", option.name()));
    }

    put(option.name(), std::move(value));
    return *this;
}

OptionsSpecification& OptionsSpecification::with(std::string_view name, cql::Scalar value,
                                                 bool escape, bool quote) {
    if (!cql::is_unquoted_identifier(name)) {
        throw SpecificationError(ErrorCode::InvalidArgument,
            fmt::format("Option name [{}] is not a valid unquoted identifier", name));
    }
    const cql::Option option(std::string(name), cql::OptionType::String, false, escape, quote);

    if (cql::is_null(value)) {
        put(option.name(), std::monostate{});
    } else {
        put(option.name(), option.to_string(value));
    }
    return *this;
}

const OptionValue* OptionsSpecification::find(std::string_view name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [name](const Entry& entry) { return entry.first == name; });
    return it != entries_.end() ? &it->second : nullptr;
}

void OptionsSpecification::put(std::string name, OptionValue value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&name](const Entry& entry) { return entry.first == name; });

    if (it != entries_.end()) {
        it->second = std::move(value);
    } else {
        entries_.emplace_back(std::move(name), std::move(value));
    }
}

} // namespace cqlgen::keyspace
