#pragma once

#include "cqlgen/keyspace/specification.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace cqlgen::config {

/// Turns the arguments of one JSON action into specifications.
///
/// Implementations throw SpecificationError or nlohmann::json::exception on
/// bad input; SpecLoader converts both into an Error.
class ISpecHandler {
public:
    virtual ~ISpecHandler() = default;

    /// @param args The action object, including its "action" key
    /// @return Specifications to execute, in order
    virtual std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const = 0;
};

} // namespace cqlgen::config
