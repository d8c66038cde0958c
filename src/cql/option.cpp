// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Options Implementation                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/cql/option.hpp"
#include "cqlgen/types.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <type_traits>

namespace cqlgen::cql {

namespace {

bool parses_as_long(std::string_view text) {
    std::int64_t parsed = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    return !text.empty() && ec == std::errc() && ptr == end;
}

bool parses_as_double(std::string_view text) {
    double parsed = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    return !text.empty() && ec == std::errc() && ptr == end;
}

template<typename Enum, std::size_t N>
std::optional<Enum> find_by_name(const std::array<Option, N>& table, std::string_view name) {
    for (std::size_t i = 0; i < N; ++i) {
        if (boost::iequals(table[i].name(), name)) {
            return static_cast<Enum>(i);
        }
    }
    return std::nullopt;
}

// Tables are indexed by enumerator value

const std::array<Option, 2>& keyspace_options() {
    static const std::array<Option, 2> options = {
        Option("replication", OptionType::Map),
        Option("durable_writes", OptionType::Boolean),
    };
    return options;
}

const std::array<Option, 17>& table_options() {
    static const std::array<Option, 17> options = {
        Option("comment", OptionType::String, true, true, true),
        Option("COMPACT STORAGE", OptionType::None, false),
        Option("compaction", OptionType::Map),
        Option("compression", OptionType::Map),
        Option("caching", OptionType::Map),
        Option("bloom_filter_fp_chance", OptionType::Double),
        Option("read_repair_chance", OptionType::Double),
        Option("dclocal_read_repair_chance", OptionType::Double),
        Option("gc_grace_seconds", OptionType::Long),
        Option("default_time_to_live", OptionType::Long),
        Option("cdc", OptionType::Boolean),
        Option("speculative_retry", OptionType::String, true, true, true),
        Option("memtable_flush_period_in_ms", OptionType::Long),
        Option("crc_check_chance", OptionType::Double),
        Option("min_index_interval", OptionType::Long),
        Option("max_index_interval", OptionType::Long),
        Option("read_repair", OptionType::String, true, true, true),
    };
    return options;
}

const std::array<Option, 9>& compaction_options() {
    static const std::array<Option, 9> options = {
        Option("class", OptionType::String, true, true, true),
        Option("tombstone_threshold", OptionType::Double),
        Option("tombstone_compaction_interval", OptionType::Double),
        Option("min_sstable_size", OptionType::Long),
        Option("min_threshold", OptionType::Long),
        Option("max_threshold", OptionType::Long),
        Option("bucket_low", OptionType::Double),
        Option("bucket_high", OptionType::Double),
        Option("sstable_size_in_mb", OptionType::Long),
    };
    return options;
}

const std::array<Option, 3>& compression_options() {
    static const std::array<Option, 3> options = {
        Option("sstable_compression", OptionType::String, true, true, true),
        Option("chunk_length_kb", OptionType::Long),
        Option("crc_check_chance", OptionType::Double),
    };
    return options;
}

const std::array<Option, 2>& caching_options() {
    static const std::array<Option, 2> options = {
        Option("keys", OptionType::String, true, true, true),
        Option("rows_per_partition", OptionType::String, true, true, true),
    };
    return options;
}

const Option& replication_class_option() {
    static const Option option("class", OptionType::String, true, true, true);
    return option;
}

} // anonymous namespace

// ==============================================================================
// Scalars
// ==============================================================================

std::string scalar_to_string(const Scalar& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

std::string escape_single(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '\'') escaped += '\'';
        escaped += c;
    }
    return escaped;
}

// ==============================================================================
// Option
// ==============================================================================

Option::Option(std::string name, OptionType type, bool requires_value,
               bool escapes_value, bool quotes_value)
    : name_(std::move(name))
    , type_(type)
    , requires_value_(requires_value)
    , escapes_value_(escapes_value)
    , quotes_value_(quotes_value) {
    if (name_.empty()) {
        throw SpecificationError(ErrorCode::InvalidArgument, "option name must not be empty");
    }
}

bool Option::is_coerceable(const Scalar& value) const {
    switch (type_) {
        case OptionType::None:
            return true;
        case OptionType::String:
            return !is_null(value);
        case OptionType::Boolean:
            if (std::holds_alternative<bool>(value)) return true;
            if (const auto* text = std::get_if<std::string>(&value)) {
                return boost::iequals(*text, "true") || boost::iequals(*text, "false");
            }
            return false;
        case OptionType::Long:
            if (std::holds_alternative<std::int64_t>(value)) return true;
            if (const auto* text = std::get_if<std::string>(&value)) {
                return parses_as_long(*text);
            }
            return false;
        case OptionType::Double:
            if (std::holds_alternative<double>(value) ||
                std::holds_alternative<std::int64_t>(value)) {
                return true;
            }
            if (const auto* text = std::get_if<std::string>(&value)) {
                return parses_as_double(*text);
            }
            return false;
        case OptionType::Map:
            return false;
    }
    return false;
}

void Option::check_value(const Scalar& value) const {
    if (!takes_value()) {
        if (!is_null(value)) {
            throw SpecificationError(ErrorCode::InvalidOptionValue,
                fmt::format("Option [{}] takes no value", name_));
        }
        return;
    }

    if (is_null(value)) {
        if (requires_value_) {
            throw SpecificationError(ErrorCode::InvalidOptionValue,
                fmt::format("Option [{}] requires a value", name_));
        }
        return;
    }

    if (!is_coerceable(value)) {
        throw SpecificationError(ErrorCode::InvalidOptionValue,
            fmt::format("Option [{}] takes value coerceable to type [{}]",
                name_, option_type_to_string(type_)));
    }
}

std::string Option::to_string(const Scalar& value) const {
    if (is_null(value)) {
        return "";
    }

    check_value(value);

    std::string rendered = scalar_to_string(value);
    if (escapes_value_) {
        rendered = escape_single(rendered);
    }
    if (quotes_value_) {
        rendered = single_quote(rendered);
    }
    return rendered;
}

std::string Option::describe() const {
    return fmt::format("[name={}, type={}, requires_value={}, escapes_value={}, quotes_value={}]",
        name_, option_type_to_string(type_), requires_value_, escapes_value_, quotes_value_);
}

// ==============================================================================
// OptionMap
// ==============================================================================

OptionMap::OptionMap(std::initializer_list<Entry> entries) {
    for (const auto& [option, value] : entries) {
        put(option, value);
    }
}

OptionMap& OptionMap::put(const Option& option, Scalar value) {
    option.check_value(value);

    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&option](const Entry& entry) { return entry.first == option; });

    if (it != entries_.end()) {
        it->second = std::move(value);
    } else {
        entries_.emplace_back(option, std::move(value));
    }
    return *this;
}

const Scalar* OptionMap::find(std::string_view name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [name](const Entry& entry) { return entry.first.name() == name; });
    return it != entries_.end() ? &it->second : nullptr;
}

// ==============================================================================
// Known options
// ==============================================================================

const Option& to_option(KeyspaceOption option) {
    return keyspace_options().at(static_cast<std::size_t>(option));
}

const Option& to_option(TableOption option) {
    return table_options().at(static_cast<std::size_t>(option));
}

const Option& to_option(CompactionOption option) {
    return compaction_options().at(static_cast<std::size_t>(option));
}

const Option& to_option(CompressionOption option) {
    return compression_options().at(static_cast<std::size_t>(option));
}

const Option& to_option(CachingOption option) {
    return caching_options().at(static_cast<std::size_t>(option));
}

std::optional<TableOption> find_table_option(std::string_view name) {
    return find_by_name<TableOption>(table_options(), name);
}

std::optional<KeyspaceOption> find_keyspace_option(std::string_view name) {
    return find_by_name<KeyspaceOption>(keyspace_options(), name);
}

OptionMap simple_replication(std::int64_t replication_factor) {
    OptionMap replication;
    replication.put(replication_class_option(),
        std::string(replication_strategy_to_string(ReplicationStrategy::SimpleStrategy)));
    replication.put(Option("replication_factor", OptionType::Long), replication_factor);
    return replication;
}

OptionMap network_replication(
    const std::vector<std::pair<std::string, std::int64_t>>& data_centers) {
    OptionMap replication;
    replication.put(replication_class_option(),
        std::string(replication_strategy_to_string(ReplicationStrategy::NetworkTopologyStrategy)));
    for (const auto& [data_center, factor] : data_centers) {
        replication.put(Option(data_center, OptionType::Long), factor);
    }
    return replication;
}

} // namespace cqlgen::cql
