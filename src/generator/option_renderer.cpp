// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Option Rendering Implementation                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/generator/option_renderer.hpp"
#include "utils/overloaded.hpp"

#include <fmt/ranges.h>

namespace cqlgen::generator {

std::string render_option_map(const cql::OptionMap& map) {
    if (map.empty()) {
        return "";
    }

    std::string out = "{ ";
    bool first = true;
    for (const auto& [option, value] : map) {
        if (!first) out += ", ";
        first = false;

        out += cql::single_quote(cql::escape_single(option.name()));
        out += " : ";
        out += option.to_string(value);
    }
    out += " }";
    return out;
}

std::string render_option(const keyspace::OptionsSpecification::Entry& entry) {
    const std::string& name = entry.first;

    return std::visit(overloaded{
        [&name](std::monostate) { return name; },
        [&name](const std::string& rendered) { return name + " = " + rendered; },
        [&name](const cql::OptionMap& map) { return name + " = " + render_option_map(map); },
    }, entry.second);
}

std::string render_with_clause(const keyspace::OptionsSpecification& options,
                               const std::vector<std::string>& leading) {
    std::vector<std::string> clauses = leading;
    clauses.reserve(leading.size() + options.size());
    for (const auto& entry : options) {
        clauses.push_back(render_option(entry));
    }

    if (clauses.empty()) {
        return "";
    }
    return fmt::format(" WITH {}", fmt::join(clauses, " AND "));
}

std::string render_index_options(const std::vector<std::pair<std::string, std::string>>& options) {
    std::vector<std::string> entries;
    entries.reserve(options.size());
    for (const auto& [key, value] : options) {
        entries.push_back(fmt::format("{}: {}",
            cql::single_quote(cql::escape_single(key)),
            cql::single_quote(cql::escape_single(value))));
    }
    return fmt::format("{{{}}}", fmt::join(entries, ", "));
}

} // namespace cqlgen::generator
