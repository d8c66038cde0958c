// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Keyspace Specifications                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/keyspace/options_specification.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cqlgen::keyspace {

// ==============================================================================
// CREATE KEYSPACE
// ==============================================================================

class CreateKeyspaceSpecification {
public:
    class Builder : public OptionsBuilder<Builder> {
    public:
        explicit Builder(cql::Identifier name) : name_(std::move(name)) {}

        Builder& if_not_exists(bool value = true) {
            if_not_exists_ = value;
            return *this;
        }

        Builder& with_simple_replication(std::int64_t replication_factor = 1);
        Builder& with_network_replication(
            const std::vector<std::pair<std::string, std::int64_t>>& data_centers);
        Builder& with_durable_writes(bool value);

        [[nodiscard]] CreateKeyspaceSpecification build() const;

    private:
        cql::Identifier name_;
        bool if_not_exists_{false};
    };

    [[nodiscard]] static Builder builder(cql::Identifier name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) { return Builder(cql::Identifier(name)); }

    [[nodiscard]] const cql::Identifier& name() const noexcept { return name_; }
    [[nodiscard]] bool if_not_exists() const noexcept { return if_not_exists_; }
    [[nodiscard]] const OptionsSpecification& options() const noexcept { return options_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const CreateKeyspaceSpecification& other) const {
        return name_ == other.name_ && if_not_exists_ == other.if_not_exists_ &&
               options_ == other.options_;
    }

private:
    CreateKeyspaceSpecification(cql::Identifier name, bool if_not_exists, OptionsSpecification options)
        : name_(std::move(name)), if_not_exists_(if_not_exists), options_(std::move(options)) {}

    cql::Identifier name_;
    bool if_not_exists_;
    OptionsSpecification options_;
};

// ==============================================================================
// ALTER KEYSPACE
// ==============================================================================

class AlterKeyspaceSpecification {
public:
    class Builder : public OptionsBuilder<Builder> {
    public:
        explicit Builder(cql::Identifier name) : name_(std::move(name)) {}

        Builder& with_simple_replication(std::int64_t replication_factor = 1);
        Builder& with_network_replication(
            const std::vector<std::pair<std::string, std::int64_t>>& data_centers);
        Builder& with_durable_writes(bool value);

        [[nodiscard]] AlterKeyspaceSpecification build() const;

    private:
        cql::Identifier name_;
    };

    [[nodiscard]] static Builder builder(cql::Identifier name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) { return Builder(cql::Identifier(name)); }

    [[nodiscard]] const cql::Identifier& name() const noexcept { return name_; }
    [[nodiscard]] const OptionsSpecification& options() const noexcept { return options_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const AlterKeyspaceSpecification& other) const {
        return name_ == other.name_ && options_ == other.options_;
    }

private:
    AlterKeyspaceSpecification(cql::Identifier name, OptionsSpecification options)
        : name_(std::move(name)), options_(std::move(options)) {}

    cql::Identifier name_;
    OptionsSpecification options_;
};

// ==============================================================================
// DROP KEYSPACE
// ==============================================================================

class DropKeyspaceSpecification {
public:
    class Builder {
    public:
        explicit Builder(cql::Identifier name) : name_(std::move(name)) {}

        Builder& if_exists(bool value = true) {
            if_exists_ = value;
            return *this;
        }

        [[nodiscard]] DropKeyspaceSpecification build() const {
            return DropKeyspaceSpecification(name_, if_exists_);
        }

    private:
        cql::Identifier name_;
        bool if_exists_{false};
    };

    [[nodiscard]] static Builder builder(cql::Identifier name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) { return Builder(cql::Identifier(name)); }

    [[nodiscard]] const cql::Identifier& name() const noexcept { return name_; }
    [[nodiscard]] bool if_exists() const noexcept { return if_exists_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const DropKeyspaceSpecification& other) const {
        return name_ == other.name_ && if_exists_ == other.if_exists_;
    }

private:
    DropKeyspaceSpecification(cql::Identifier name, bool if_exists)
        : name_(std::move(name)), if_exists_(if_exists) {}

    cql::Identifier name_;
    bool if_exists_;
};

} // namespace cqlgen::keyspace
