// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Identifier Implementation                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/types.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace cqlgen::cql {

namespace {

// Sorted, upper-case
constexpr std::array<std::string_view, 56> kReservedKeywords = {
    "ADD", "ALLOW", "ALTER", "AND", "APPLY", "ASC", "AUTHORIZE", "BATCH",
    "BEGIN", "BY", "COLUMNFAMILY", "CREATE", "DELETE", "DESC", "DESCRIBE",
    "DROP", "ENTRIES", "EXECUTE", "FROM", "FULL", "GRANT", "IF", "IN", "INDEX",
    "INFINITY", "INSERT", "INTO", "KEYSPACE", "LIMIT", "MODIFY", "NAN",
    "NORECURSIVE", "NOT", "NULL", "OF", "ON", "OR", "ORDER", "PRIMARY",
    "RENAME", "REPLACE", "REVOKE", "SCHEMA", "SELECT", "SET", "TABLE", "TO",
    "TOKEN", "TRUNCATE", "UNLOGGED", "UPDATE", "USE", "USING", "WHERE", "WITH",
    "WRITETIME",
};

constexpr std::size_t kLongestKeyword = 12;

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string escape_double(std::string_view name) {
    std::string escaped;
    escaped.reserve(name.size() + 2);
    for (char c : name) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    return escaped;
}

// `""` -> `"`; caller has validated that every quote is doubled
std::string collapse_double(std::string_view name) {
    std::string collapsed;
    collapsed.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        collapsed += name[i];
        if (name[i] == '"') ++i;
    }
    return collapsed;
}

bool has_only_doubled_quotes(std::string_view name) {
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '"') continue;
        if (i + 1 >= name.size() || name[i + 1] != '"') return false;
        ++i;
    }
    return true;
}

} // anonymous namespace

bool is_reserved_keyword(std::string_view name) noexcept {
    if (name.empty() || name.size() > kLongestKeyword) {
        return false;
    }

    std::array<char, kLongestKeyword> upper{};
    boost::algorithm::to_upper_copy(upper.begin(), name);

    return std::binary_search(kReservedKeywords.begin(), kReservedKeywords.end(),
        std::string_view(upper.data(), name.size()));
}

bool is_unquoted_identifier(std::string_view name) noexcept {
    if (name.empty() || !is_identifier_start(name.front())) {
        return false;
    }
    if (!std::all_of(name.begin() + 1, name.end(), is_identifier_char)) {
        return false;
    }
    return !is_reserved_keyword(name);
}

bool is_quoted_identifier(std::string_view name) noexcept {
    if (name.empty() || !is_identifier_start(name.front())) {
        return false;
    }

    for (std::size_t i = 1; i < name.size(); ++i) {
        if (is_identifier_char(name[i])) continue;
        if (name[i] == '"' && i + 1 < name.size() && name[i + 1] == '"') {
            ++i;
            continue;
        }
        return false;
    }
    return true;
}

Identifier::Identifier(std::string_view name, bool force_quote) {
    if (name.empty()) {
        throw InvalidIdentifierError("identifier must not be empty");
    }

    if (force_quote) {
        unquoted_ = std::string(name);
        rendered_ = "\"" + escape_double(name) + "\"";
        quoted_ = true;
    } else if (is_unquoted_identifier(name)) {
        unquoted_ = rendered_ = std::string(name);
        quoted_ = false;
    } else if (is_quoted_identifier(name)) {
        unquoted_ = collapse_double(name);
        rendered_ = "\"" + std::string(name) + "\"";
        quoted_ = true;
    } else {
        throw InvalidIdentifierError(fmt::format(
            "given string [{}] is not a valid quoted or unquoted identifier", name));
    }
}

Identifier Identifier::quoted(std::string_view name) {
    return Identifier(name, true);
}

Identifier Identifier::from_cql(std::string_view cql) {
    if (cql.size() >= 2 && cql.front() == '"' && cql.back() == '"') {
        auto inner = cql.substr(1, cql.size() - 2);
        if (inner.empty() || !has_only_doubled_quotes(inner)) {
            throw InvalidIdentifierError(fmt::format(
                "given string [{}] is not a valid quoted identifier", cql));
        }
        return Identifier::quoted(collapse_double(inner));
    }
    return Identifier(cql);
}

} // namespace cqlgen::cql
