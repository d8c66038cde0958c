// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Keyspace Actions                                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/cql/option.hpp"
#include "cqlgen/keyspace/specification.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cqlgen::keyspace {

/// What to do with a keyspace at startup
enum class KeyspaceAction : std::uint8_t {
    None,
    Create,
    CreateDrop,     // drop if exists, then create
    Alter,
};

[[nodiscard]] constexpr const char* keyspace_action_to_string(KeyspaceAction action) noexcept {
    switch (action) {
        case KeyspaceAction::None: return "NONE";
        case KeyspaceAction::Create: return "CREATE";
        case KeyspaceAction::CreateDrop: return "CREATE_DROP";
        case KeyspaceAction::Alter: return "ALTER";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] std::optional<KeyspaceAction> parse_keyspace_action(std::string_view text);

struct DataCenterReplication {
    std::string data_center;
    std::int64_t replication_factor;
};

/// Produces keyspace specifications from replication settings.
///
/// `durable_writes` is always attached; replication only when meaningful
/// (a simple factor above zero, or at least one data centre).
class KeyspaceActions {
public:
    class Builder {
    public:
        explicit Builder(cql::Identifier name) : name_(std::move(name)) {}

        Builder& simple_replication(std::int64_t replication_factor);
        Builder& with_data_center(DataCenterReplication replication);
        Builder& durable_writes(bool value);
        Builder& if_not_exists(bool value = true);

        [[nodiscard]] KeyspaceActions build() const;

    private:
        cql::Identifier name_;
        cql::ReplicationStrategy strategy_{cql::ReplicationStrategy::SimpleStrategy};
        std::int64_t replication_factor_{0};
        std::vector<DataCenterReplication> data_centers_;
        bool durable_writes_{false};
        bool if_not_exists_{false};
    };

    [[nodiscard]] static Builder builder(cql::Identifier name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::Identifier::from_cql(name));
    }

    [[nodiscard]] CreateKeyspaceSpecification create() const;
    [[nodiscard]] AlterKeyspaceSpecification alter() const;
    [[nodiscard]] DropKeyspaceSpecification drop(bool if_exists = false) const;

    /// Specifications to execute, in order, for `action`
    [[nodiscard]] std::vector<Specification> for_action(KeyspaceAction action) const;

    [[nodiscard]] const cql::Identifier& name() const noexcept { return name_; }

private:
    KeyspaceActions(cql::Identifier name, cql::ReplicationStrategy strategy,
                    std::int64_t replication_factor, std::vector<DataCenterReplication> data_centers,
                    bool durable_writes, bool if_not_exists)
        : name_(std::move(name))
        , strategy_(strategy)
        , replication_factor_(replication_factor)
        , data_centers_(std::move(data_centers))
        , durable_writes_(durable_writes)
        , if_not_exists_(if_not_exists) {}

    [[nodiscard]] std::optional<cql::OptionMap> replication() const;

    cql::Identifier name_;
    cql::ReplicationStrategy strategy_;
    std::int64_t replication_factor_;
    std::vector<DataCenterReplication> data_centers_;
    bool durable_writes_;
    bool if_not_exists_;
};

} // namespace cqlgen::keyspace
