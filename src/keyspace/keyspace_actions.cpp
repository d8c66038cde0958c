// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Keyspace Actions Implementation                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/keyspace_actions.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <array>

namespace cqlgen::keyspace {

std::optional<KeyspaceAction> parse_keyspace_action(std::string_view text) {
    constexpr std::array<KeyspaceAction, 4> actions = {
        KeyspaceAction::None, KeyspaceAction::Create,
        KeyspaceAction::CreateDrop, KeyspaceAction::Alter,
    };
    for (auto action : actions) {
        if (boost::iequals(text, keyspace_action_to_string(action))) {
            return action;
        }
    }
    return std::nullopt;
}

// ==============================================================================
// Builder
// ==============================================================================

KeyspaceActions::Builder& KeyspaceActions::Builder::simple_replication(std::int64_t replication_factor) {
    strategy_ = cql::ReplicationStrategy::SimpleStrategy;
    replication_factor_ = replication_factor;
    return *this;
}

KeyspaceActions::Builder& KeyspaceActions::Builder::with_data_center(DataCenterReplication replication) {
    strategy_ = cql::ReplicationStrategy::NetworkTopologyStrategy;
    data_centers_.push_back(std::move(replication));
    return *this;
}

KeyspaceActions::Builder& KeyspaceActions::Builder::durable_writes(bool value) {
    durable_writes_ = value;
    return *this;
}

KeyspaceActions::Builder& KeyspaceActions::Builder::if_not_exists(bool value) {
    if_not_exists_ = value;
    return *this;
}

KeyspaceActions KeyspaceActions::Builder::build() const {
    return KeyspaceActions(name_, strategy_, replication_factor_, data_centers_,
        durable_writes_, if_not_exists_);
}

// ==============================================================================
// Specification factories
// ==============================================================================

std::optional<cql::OptionMap> KeyspaceActions::replication() const {
    switch (strategy_) {
        case cql::ReplicationStrategy::SimpleStrategy:
            if (replication_factor_ > 0) {
                return cql::simple_replication(replication_factor_);
            }
            return std::nullopt;

        case cql::ReplicationStrategy::NetworkTopologyStrategy: {
            if (data_centers_.empty()) {
                return std::nullopt;
            }
            std::vector<std::pair<std::string, std::int64_t>> factors;
            factors.reserve(data_centers_.size());
            for (const auto& dc : data_centers_) {
                factors.emplace_back(dc.data_center, dc.replication_factor);
            }
            return cql::network_replication(factors);
        }
    }
    return std::nullopt;
}

CreateKeyspaceSpecification KeyspaceActions::create() const {
    auto builder = CreateKeyspaceSpecification::builder(name_);
    builder.if_not_exists(if_not_exists_).with_durable_writes(durable_writes_);

    if (auto map = replication()) {
        builder.with(cql::KeyspaceOption::Replication, std::move(*map));
    }
    return builder.build();
}

AlterKeyspaceSpecification KeyspaceActions::alter() const {
    auto builder = AlterKeyspaceSpecification::builder(name_);
    builder.with_durable_writes(durable_writes_);

    if (auto map = replication()) {
        builder.with(cql::KeyspaceOption::Replication, std::move(*map));
    }
    return builder.build();
}

DropKeyspaceSpecification KeyspaceActions::drop(bool if_exists) const {
    return DropKeyspaceSpecification::builder(name_).if_exists(if_exists).build();
}

std::vector<Specification> KeyspaceActions::for_action(KeyspaceAction action) const {
    std::vector<Specification> specs;

    switch (action) {
        case KeyspaceAction::None:
            break;
        case KeyspaceAction::CreateDrop:
            specs.emplace_back(drop(true));
            specs.emplace_back(create());
            break;
        case KeyspaceAction::Create:
            specs.emplace_back(create());
            break;
        case KeyspaceAction::Alter:
            specs.emplace_back(alter());
            break;
    }
    return specs;
}

} // namespace cqlgen::keyspace
