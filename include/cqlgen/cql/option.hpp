// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Options                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cqlgen::cql {

// ==============================================================================
// Scalar values
// ==============================================================================

/// Value of an option or of an option-map entry; monostate is null
using Scalar = std::variant<std::monostate, std::string, bool, std::int64_t, double>;

[[nodiscard]] inline bool is_null(const Scalar& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

/// Strings verbatim, booleans as true/false, numbers in shortest form; null is ""
[[nodiscard]] std::string scalar_to_string(const Scalar& value);

/// Doubles embedded single quotes: `it's` -> `it''s`
[[nodiscard]] std::string escape_single(std::string_view text);

[[nodiscard]] inline std::string single_quote(std::string_view text) {
    return "'" + std::string(text) + "'";
}

// ==============================================================================
// Option
// ==============================================================================

enum class OptionType : std::uint8_t {
    None,       // flag option, takes no value (COMPACT STORAGE)
    String,
    Boolean,
    Long,
    Double,
    Map,
};

[[nodiscard]] constexpr const char* option_type_to_string(OptionType type) noexcept {
    switch (type) {
        case OptionType::None: return "NONE";
        case OptionType::String: return "STRING";
        case OptionType::Boolean: return "BOOLEAN";
        case OptionType::Long: return "LONG";
        case OptionType::Double: return "DOUBLE";
        case OptionType::Map: return "MAP";
        default: return "UNKNOWN";
    }
}

/// Named, typed configuration key.
///
/// The escape and quote flags are rendering hints for values; identity is
/// the name alone.
class Option {
public:
    Option(std::string name, OptionType type, bool requires_value = true,
           bool escapes_value = false, bool quotes_value = false);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] OptionType type() const noexcept { return type_; }
    [[nodiscard]] bool takes_value() const noexcept { return type_ != OptionType::None; }
    [[nodiscard]] bool requires_value() const noexcept { return requires_value_; }
    [[nodiscard]] bool escapes_value() const noexcept { return escapes_value_; }
    [[nodiscard]] bool quotes_value() const noexcept { return quotes_value_; }

    /// True if a non-null `value` can be interpreted as this option's type
    [[nodiscard]] bool is_coerceable(const Scalar& value) const;

    /// Throws SpecificationError(InvalidOptionValue) if `value` is not acceptable
    void check_value(const Scalar& value) const;

    /// Renders a value honouring the escape and quote flags; null renders as ""
    [[nodiscard]] std::string to_string(const Scalar& value) const;

    /// `[name=..., type=..., requires_value=..., ...]`
    [[nodiscard]] std::string describe() const;

    bool operator==(const Option& other) const noexcept { return name_ == other.name_; }
    bool operator!=(const Option& other) const noexcept { return !(*this == other); }

private:
    std::string name_;
    OptionType type_;
    bool requires_value_;
    bool escapes_value_;
    bool quotes_value_;
};

// ==============================================================================
// OptionMap
// ==============================================================================

/// Insertion-ordered Option -> Scalar map
class OptionMap {
public:
    using Entry = std::pair<Option, Scalar>;
    using const_iterator = std::vector<Entry>::const_iterator;

    OptionMap() = default;
    OptionMap(std::initializer_list<Entry> entries);

    /// Adds or replaces in place; validates the value against the option
    OptionMap& put(const Option& option, Scalar value);

    [[nodiscard]] const Scalar* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const OptionMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const OptionMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

// ==============================================================================
// Known options
// ==============================================================================

enum class KeyspaceOption : std::uint8_t {
    Replication,
    DurableWrites,
};

enum class TableOption : std::uint8_t {
    Comment,
    CompactStorage,
    Compaction,
    Compression,
    Caching,
    BloomFilterFpChance,
    ReadRepairChance,
    DclocalReadRepairChance,
    GcGraceSeconds,
    DefaultTimeToLive,
    Cdc,
    SpeculativeRetry,
    MemtableFlushPeriodInMs,
    CrcCheckChance,
    MinIndexInterval,
    MaxIndexInterval,
    ReadRepair,
};

enum class CompactionOption : std::uint8_t {
    Class,
    TombstoneThreshold,
    TombstoneCompactionInterval,
    MinSstableSize,
    MinThreshold,
    MaxThreshold,
    BucketLow,
    BucketHigh,
    SstableSizeInMb,
};

enum class CompressionOption : std::uint8_t {
    SstableCompression,
    ChunkLengthKb,
    CrcCheckChance,
};

enum class CachingOption : std::uint8_t {
    Keys,
    RowsPerPartition,
};

enum class ReplicationStrategy : std::uint8_t {
    SimpleStrategy,
    NetworkTopologyStrategy,
};

[[nodiscard]] const Option& to_option(KeyspaceOption option);
[[nodiscard]] const Option& to_option(TableOption option);
[[nodiscard]] const Option& to_option(CompactionOption option);
[[nodiscard]] const Option& to_option(CompressionOption option);
[[nodiscard]] const Option& to_option(CachingOption option);

/// Case-insensitive lookup by option name
[[nodiscard]] std::optional<TableOption> find_table_option(std::string_view name);
[[nodiscard]] std::optional<KeyspaceOption> find_keyspace_option(std::string_view name);

[[nodiscard]] constexpr const char* replication_strategy_to_string(ReplicationStrategy strategy) noexcept {
    switch (strategy) {
        case ReplicationStrategy::SimpleStrategy: return "SimpleStrategy";
        case ReplicationStrategy::NetworkTopologyStrategy: return "NetworkTopologyStrategy";
        default: return "UnknownStrategy";
    }
}

/// `{ 'class' : 'SimpleStrategy', 'replication_factor' : <factor> }`
[[nodiscard]] OptionMap simple_replication(std::int64_t replication_factor = 1);

/// `{ 'class' : 'NetworkTopologyStrategy', '<dc>' : <factor>, ... }`
[[nodiscard]] OptionMap network_replication(
    const std::vector<std::pair<std::string, std::int64_t>>& data_centers);

} // namespace cqlgen::cql
