// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Generator Dispatcher                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/generator/generator.hpp"
#include "utils/logger.hpp"

namespace cqlgen::generator {

Result<std::string> to_cql(const keyspace::Specification& spec) {
    if (spec.valueless_by_exception()) {
        Logger::warn("cannot generate CQL for a valueless specification");
        return Err<std::string>(ErrorCode::UnsupportedSpecification, keyspace::describe(spec));
    }

    auto result = std::visit([](const auto& s) { return generate(s); }, spec);

    if (result) {
        Logger::debug("generated: {}", result.value());
    } else {
        Logger::warn("{} rejected: {}", keyspace::describe(spec), result.error().to_string());
    }
    return result;
}

} // namespace cqlgen::generator
