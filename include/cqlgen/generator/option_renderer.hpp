// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Option Rendering                                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/option.hpp"
#include "cqlgen/keyspace/options_specification.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cqlgen::generator {

/// `{ 'k1' : v1, 'k2' : v2 }`; an empty map renders as "".
///
/// Keys are always single-quoted. Values honour their option's escape and
/// quote flags, and a null value renders as nothing (`'k' : `).
[[nodiscard]] std::string render_option_map(const cql::OptionMap& map);

/// `k = v`, or just `k` for a flag option
[[nodiscard]] std::string render_option(const keyspace::OptionsSpecification::Entry& entry);

/// ` WITH <clause> AND <clause> ...` over `leading` clauses followed by the
/// options; "" when both are empty
[[nodiscard]] std::string render_with_clause(const keyspace::OptionsSpecification& options,
                                             const std::vector<std::string>& leading = {});

/// `{'k': 'v', ...}` for index options, values escaped and quoted
[[nodiscard]] std::string render_index_options(
    const std::vector<std::pair<std::string, std::string>>& options);

} // namespace cqlgen::generator
