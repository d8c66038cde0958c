#include "config/spec_handlers.hpp"
#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/cql/option.hpp"
#include "cqlgen/types.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace cqlgen::config {

namespace {

using json = nlohmann::ordered_json;

// ==============================================================================
// Field readers
// ==============================================================================

SpecificationError invalid(const std::string& message) {
    return SpecificationError(ErrorCode::ConfigInvalid, message);
}

const json& require(const json& args, const char* key) {
    if (!args.contains(key)) {
        throw invalid(fmt::format("missing required field '{}'", key));
    }
    return args.at(key);
}

std::string require_string(const json& args, const char* key) {
    const json& value = require(args, key);
    if (!value.is_string()) {
        throw invalid(fmt::format("field '{}' must be a string", key));
    }
    return value.get<std::string>();
}

std::optional<std::string> optional_string(const json& args, const char* key) {
    if (!args.contains(key) || args.at(key).is_null()) {
        return std::nullopt;
    }
    return require_string(args, key);
}

bool flag(const json& args, const char* key, bool default_value = false) {
    if (!args.contains(key)) {
        return default_value;
    }
    const json& value = args.at(key);
    if (!value.is_boolean()) {
        throw invalid(fmt::format("field '{}' must be a boolean", key));
    }
    return value.get<bool>();
}

/// Unsigned JSON numbers above INT64_MAX would wrap on conversion
std::int64_t to_integer(std::string_view key, const json& value) {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw invalid(fmt::format("field '{}' is out of range", key));
    }
    return value.get<std::int64_t>();
}

std::int64_t require_integer(const json& args, const char* key) {
    const json& value = require(args, key);
    if (!value.is_number_integer()) {
        throw invalid(fmt::format("field '{}' must be an integer", key));
    }
    return to_integer(key, value);
}

const json& optional_array(const json& args, const char* key) {
    static const json empty = json::array();
    if (!args.contains(key)) {
        return empty;
    }
    const json& value = args.at(key);
    if (!value.is_array()) {
        throw invalid(fmt::format("field '{}' must be an array", key));
    }
    return value;
}

cql::Identifier identifier(const json& args, const char* key) {
    return cql::Identifier::from_cql(require_string(args, key));
}

/// `name` with an optional `keyspace` sibling
cql::QualifiedName qualified_name(const json& args, const char* key = "name") {
    std::optional<cql::Identifier> keyspace;
    if (auto ks = optional_string(args, "keyspace")) {
        keyspace = cql::Identifier::from_cql(*ks);
    }
    return cql::QualifiedName(identifier(args, key), std::move(keyspace));
}

cql::DataType data_type(const json& args, const char* key = "type") {
    return cql::DataType::parse(require_string(args, key));
}

// ==============================================================================
// Options
// ==============================================================================

cql::Scalar to_scalar(const std::string& key, const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return to_integer(key, value);
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            throw invalid(fmt::format("option '{}' must be a scalar value", key));
    }
}

/// Option inferred from the JSON value: strings are quoted, the rest are not
cql::Option inferred_option(const std::string& key, const json& value) {
    if (value.is_null()) {
        return cql::Option(key, cql::OptionType::String, false, true, true);
    }
    if (value.is_string()) {
        return cql::Option(key, cql::OptionType::String, true, true, true);
    }
    if (value.is_boolean()) {
        return cql::Option(key, cql::OptionType::Boolean);
    }
    if (value.is_number_float()) {
        return cql::Option(key, cql::OptionType::Double);
    }
    return cql::Option(key, cql::OptionType::Long);
}

template<typename Enum, std::size_t Count>
std::optional<cql::Option> find_sub_option(std::string_view key) {
    for (std::size_t i = 0; i < Count; ++i) {
        const auto& option = cql::to_option(static_cast<Enum>(i));
        if (boost::iequals(option.name(), key)) {
            return option;
        }
    }
    return std::nullopt;
}

std::optional<cql::Option> known_sub_option(cql::TableOption parent, std::string_view key) {
    switch (parent) {
        case cql::TableOption::Compaction:
            return find_sub_option<cql::CompactionOption, 9>(key);
        case cql::TableOption::Compression:
            return find_sub_option<cql::CompressionOption, 3>(key);
        case cql::TableOption::Caching:
            return find_sub_option<cql::CachingOption, 2>(key);
        default:
            return std::nullopt;
    }
}

cql::OptionMap to_option_map(const std::string& key, const json& value,
                             std::optional<cql::TableOption> parent) {
    if (!value.is_object()) {
        throw invalid(fmt::format("option '{}' must be an object", key));
    }

    cql::OptionMap map;
    for (const auto& [sub_key, sub_value] : value.items()) {
        std::optional<cql::Option> option;
        if (parent) {
            option = known_sub_option(*parent, sub_key);
        }
        map.put(option ? *option : inferred_option(sub_key, sub_value), to_scalar(sub_key, sub_value));
    }
    return map;
}

/// Applies an "options" object to a table builder
template<typename Builder>
void apply_table_options(Builder& builder, const json& args) {
    if (!args.contains("options")) {
        return;
    }
    const json& options = args.at("options");
    if (!options.is_object()) {
        throw invalid("field 'options' must be an object");
    }

    for (const auto& [key, value] : options.items()) {
        auto known = cql::find_table_option(key);
        if (!known) {
            // Rendered bare, so the name has to lex as a single word
            if (!cql::is_unquoted_identifier(key)) {
                throw invalid(fmt::format("option name '{}' is not a valid unquoted identifier", key));
            }
            const bool quoted = value.is_string();
            builder.with(key, to_scalar(key, value), quoted, quoted);
            continue;
        }

        const cql::Option& option = cql::to_option(*known);
        switch (option.type()) {
            case cql::OptionType::Map:
                builder.with(option, to_option_map(key, value, known));
                break;
            case cql::OptionType::None:
                // `"COMPACT STORAGE": true` enables the flag, false leaves it out
                if (value.is_null() || (value.is_boolean() && value.template get<bool>())) {
                    builder.with(option);
                } else if (!value.is_boolean()) {
                    throw invalid(fmt::format("option '{}' takes no value", key));
                }
                break;
            default:
                builder.with(option, to_scalar(key, value));
                break;
        }
    }
}

// ==============================================================================
// Keyspace replication
// ==============================================================================

/// `{"strategy": "SimpleStrategy", "replication_factor": 3}` or
/// `{"strategy": "NetworkTopologyStrategy", "data_centers": [{"name": ..., "replication_factor": ...}]}`
keyspace::KeyspaceActions keyspace_actions(const json& args) {
    auto builder = keyspace::KeyspaceActions::builder(identifier(args, "name"));
    builder.if_not_exists(flag(args, "if_not_exists"))
           .durable_writes(flag(args, "durable_writes", true));

    if (!args.contains("replication")) {
        return builder.build();
    }

    const json& replication = args.at("replication");
    const std::string strategy = replication.contains("strategy")
        ? require_string(replication, "strategy")
        : cql::replication_strategy_to_string(cql::ReplicationStrategy::SimpleStrategy);

    if (boost::iequals(strategy, "SimpleStrategy")) {
        builder.simple_replication(require_integer(replication, "replication_factor"));
    } else if (boost::iequals(strategy, "NetworkTopologyStrategy")) {
        for (const auto& dc : optional_array(replication, "data_centers")) {
            builder.with_data_center({require_string(dc, "name"), require_integer(dc, "replication_factor")});
        }
    } else {
        throw invalid(fmt::format("unknown replication strategy '{}'", strategy));
    }
    return builder.build();
}

// ==============================================================================
// Column changes
// ==============================================================================

/// `{"op": "ADD"|"DROP"|"ALTER"|"RENAME", "column": ..., "type": ..., "to": ...}`
template<typename Builder>
void apply_change(Builder& builder, const json& change) {
    constexpr bool can_drop = std::is_same_v<Builder, keyspace::AlterTableSpecification::Builder>;
    const std::string op = boost::to_upper_copy(require_string(change, "op"));

    if (op == "ADD") {
        builder.add(identifier(change, "column"), data_type(change));
    } else if (op == "ALTER") {
        builder.alter(identifier(change, "column"), data_type(change));
    } else if (op == "RENAME") {
        builder.rename(identifier(change, "column"), identifier(change, "to"));
    } else if (op == "DROP") {
        if constexpr (can_drop) {
            builder.drop(identifier(change, "column"));
        } else {
            throw invalid("fields cannot be dropped from a user type");
        }
    } else {
        throw invalid(fmt::format("unsupported column change '{}'", op));
    }
}

keyspace::KeyRole key_role(const json& column) {
    const auto key = optional_string(column, "key");
    if (!key || boost::iequals(*key, "none")) {
        return keyspace::KeyRole::None;
    }
    if (boost::iequals(*key, "partition")) {
        return keyspace::KeyRole::Partition;
    }
    if (boost::iequals(*key, "cluster") || boost::iequals(*key, "clustered")) {
        return keyspace::KeyRole::Cluster;
    }
    throw invalid(fmt::format("unknown key role '{}'", *key));
}

std::optional<keyspace::Ordering> ordering(const json& column) {
    const auto text = optional_string(column, "ordering");
    if (!text) {
        return std::nullopt;
    }
    if (boost::iequals(*text, "ASC")) return keyspace::Ordering::Asc;
    if (boost::iequals(*text, "DESC")) return keyspace::Ordering::Desc;
    throw invalid(fmt::format("unknown ordering '{}'", *text));
}

keyspace::ColumnFunction column_function(const json& args) {
    const auto text = optional_string(args, "function");
    if (!text) return keyspace::ColumnFunction::None;

    const std::string upper = boost::to_upper_copy(*text);
    if (upper == "KEYS") return keyspace::ColumnFunction::Keys;
    if (upper == "VALUES") return keyspace::ColumnFunction::Values;
    if (upper == "ENTRIES") return keyspace::ColumnFunction::Entries;
    if (upper == "FULL") return keyspace::ColumnFunction::Full;
    throw invalid(fmt::format("unknown index function '{}'", *text));
}

} // anonymous namespace

// ==============================================================================
// Keyspaces
// ==============================================================================

std::vector<keyspace::Specification> KeyspaceActionHandler::load(const json& args) const {
    return keyspace_actions(args).for_action(action_);
}

std::vector<keyspace::Specification> AlterKeyspaceHandler::load(const json& args) const {
    auto builder = keyspace::AlterKeyspaceSpecification::builder(identifier(args, "name"));

    if (args.contains("replication")) {
        // Reuse the CREATE parsing; durable_writes is taken from the document only
        const auto create = keyspace_actions(args).create();
        if (const auto* replication = create.options().find("replication")) {
            builder.with(cql::KeyspaceOption::Replication, std::get<cql::OptionMap>(*replication));
        }
    }
    if (args.contains("durable_writes")) {
        builder.with_durable_writes(flag(args, "durable_writes"));
    }
    return {builder.build()};
}

std::vector<keyspace::Specification> DropKeyspaceHandler::load(const json& args) const {
    return {keyspace::DropKeyspaceSpecification::builder(identifier(args, "name"))
                .if_exists(flag(args, "if_exists"))
                .build()};
}

// ==============================================================================
// Tables
// ==============================================================================

std::vector<keyspace::Specification> CreateTableHandler::load(const json& args) const {
    auto builder = keyspace::CreateTableSpecification::builder(qualified_name(args));
    builder.if_not_exists(flag(args, "if_not_exists"));

    for (const auto& column : optional_array(args, "columns")) {
        switch (key_role(column)) {
            case keyspace::KeyRole::Partition:
                builder.partition_key_column(identifier(column, "name"), data_type(column));
                break;
            case keyspace::KeyRole::Cluster:
                builder.clustered_key_column(identifier(column, "name"), data_type(column), ordering(column));
                break;
            case keyspace::KeyRole::None:
                builder.column(identifier(column, "name"), data_type(column));
                break;
        }
    }

    apply_table_options(builder, args);
    return {builder.build()};
}

std::vector<keyspace::Specification> AlterTableHandler::load(const json& args) const {
    auto builder = keyspace::AlterTableSpecification::builder(qualified_name(args));

    for (const auto& change : optional_array(args, "changes")) {
        apply_change(builder, change);
    }

    apply_table_options(builder, args);
    return {builder.build()};
}

std::vector<keyspace::Specification> DropTableHandler::load(const json& args) const {
    return {keyspace::DropTableSpecification::builder(qualified_name(args))
                .if_exists(flag(args, "if_exists"))
                .build()};
}

// ==============================================================================
// Indexes
// ==============================================================================

std::vector<keyspace::Specification> CreateIndexHandler::load(const json& args) const {
    auto builder = keyspace::CreateIndexSpecification::builder();

    if (auto name = optional_string(args, "name")) {
        builder.name(cql::Identifier::from_cql(*name));
    }
    builder.table(qualified_name(args, "table"))
           .column(identifier(args, "column"), column_function(args))
           .if_not_exists(flag(args, "if_not_exists"));

    if (auto using_class = optional_string(args, "using")) {
        builder.using_class(*using_class);
    }

    if (args.contains("options")) {
        const json& options = args.at("options");
        if (!options.is_object()) {
            throw invalid("field 'options' must be an object");
        }
        for (const auto& [key, value] : options.items()) {
            if (!value.is_string()) {
                throw invalid(fmt::format("index option '{}' must be a string", key));
            }
            builder.option(key, value.get<std::string>());
        }
    }
    return {builder.build()};
}

std::vector<keyspace::Specification> DropIndexHandler::load(const json& args) const {
    return {keyspace::DropIndexSpecification::builder(qualified_name(args))
                .if_exists(flag(args, "if_exists"))
                .build()};
}

// ==============================================================================
// User types
// ==============================================================================

std::vector<keyspace::Specification> CreateUserTypeHandler::load(const json& args) const {
    auto builder = keyspace::CreateUserTypeSpecification::builder(qualified_name(args));
    builder.if_not_exists(flag(args, "if_not_exists"));

    for (const auto& field : optional_array(args, "fields")) {
        builder.field(identifier(field, "name"), data_type(field));
    }
    return {builder.build()};
}

std::vector<keyspace::Specification> AlterUserTypeHandler::load(const json& args) const {
    auto builder = keyspace::AlterUserTypeSpecification::builder(qualified_name(args));

    for (const auto& change : optional_array(args, "changes")) {
        apply_change(builder, change);
    }
    return {builder.build()};
}

std::vector<keyspace::Specification> DropUserTypeHandler::load(const json& args) const {
    return {keyspace::DropUserTypeSpecification::builder(qualified_name(args))
                .if_exists(flag(args, "if_exists"))
                .build()};
}

} // namespace cqlgen::config
