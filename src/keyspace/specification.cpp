// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Specification Variant Implementation                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/specification.hpp"

namespace cqlgen::keyspace {

std::string describe(const Specification& spec) {
    if (spec.valueless_by_exception()) {
        return "<valueless specification>";
    }
    return std::visit([](const auto& s) { return s.describe(); }, spec);
}

} // namespace cqlgen::keyspace
