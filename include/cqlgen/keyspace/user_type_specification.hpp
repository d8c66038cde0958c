// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - User Type Specifications                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/keyspace/column_specification.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cqlgen::keyspace {

/// Field of a user-defined type
struct FieldSpecification {
    cql::Identifier name;
    cql::DataType type;

    /// `name type`
    [[nodiscard]] std::string to_cql() const { return name.to_cql() + " " + type.to_cql(); }

    bool operator==(const FieldSpecification& other) const {
        return name == other.name && type == other.type;
    }
};

// ==============================================================================
// CREATE TYPE
// ==============================================================================

class CreateUserTypeSpecification {
public:
    class Builder {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& if_not_exists(bool value = true) {
            if_not_exists_ = value;
            return *this;
        }

        Builder& field(cql::Identifier name, cql::DataType type);
        Builder& field(std::string_view name, cql::DataType type) {
            return field(cql::Identifier(name), std::move(type));
        }

        /// Throws SpecificationError on an empty field list or a repeated field name
        [[nodiscard]] CreateUserTypeSpecification build() const;

    private:
        cql::QualifiedName name_;
        bool if_not_exists_{false};
        std::vector<FieldSpecification> fields_;
    };

    [[nodiscard]] static Builder builder(cql::QualifiedName name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::QualifiedName(cql::Identifier(name)));
    }

    [[nodiscard]] const cql::QualifiedName& name() const noexcept { return name_; }
    [[nodiscard]] bool if_not_exists() const noexcept { return if_not_exists_; }
    [[nodiscard]] const std::vector<FieldSpecification>& fields() const noexcept { return fields_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const CreateUserTypeSpecification& other) const {
        return name_ == other.name_ && if_not_exists_ == other.if_not_exists_ &&
               fields_ == other.fields_;
    }

private:
    CreateUserTypeSpecification(cql::QualifiedName name, bool if_not_exists,
                                std::vector<FieldSpecification> fields)
        : name_(std::move(name)), if_not_exists_(if_not_exists), fields_(std::move(fields)) {}

    cql::QualifiedName name_;
    bool if_not_exists_;
    std::vector<FieldSpecification> fields_;
};

// ==============================================================================
// ALTER TYPE
// ==============================================================================

/// Fields cannot be dropped from a user type, so only add, alter and rename exist
class AlterUserTypeSpecification {
public:
    class Builder {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& add(cql::Identifier name, cql::DataType type);
        Builder& add(std::string_view name, cql::DataType type) {
            return add(cql::Identifier(name), std::move(type));
        }

        Builder& alter(cql::Identifier name, cql::DataType type);
        Builder& alter(std::string_view name, cql::DataType type) {
            return alter(cql::Identifier(name), std::move(type));
        }

        Builder& rename(cql::Identifier from, cql::Identifier to);
        Builder& rename(std::string_view from, std::string_view to) {
            return rename(cql::Identifier(from), cql::Identifier(to));
        }

        /// Throws SpecificationError(EmptyChangeList) without changes
        [[nodiscard]] AlterUserTypeSpecification build() const;

    private:
        cql::QualifiedName name_;
        std::vector<ColumnChange> changes_;
    };

    [[nodiscard]] static Builder builder(cql::QualifiedName name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::QualifiedName(cql::Identifier(name)));
    }

    [[nodiscard]] const cql::QualifiedName& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<ColumnChange>& changes() const noexcept { return changes_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const AlterUserTypeSpecification& other) const {
        return name_ == other.name_ && changes_ == other.changes_;
    }

private:
    AlterUserTypeSpecification(cql::QualifiedName name, std::vector<ColumnChange> changes)
        : name_(std::move(name)), changes_(std::move(changes)) {}

    cql::QualifiedName name_;
    std::vector<ColumnChange> changes_;
};

// ==============================================================================
// DROP TYPE
// ==============================================================================

class DropUserTypeSpecification {
public:
    class Builder {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& if_exists(bool value = true) {
            if_exists_ = value;
            return *this;
        }

        [[nodiscard]] DropUserTypeSpecification build() const {
            return DropUserTypeSpecification(name_, if_exists_);
        }

    private:
        cql::QualifiedName name_;
        bool if_exists_{false};
    };

    [[nodiscard]] static Builder builder(cql::QualifiedName name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::QualifiedName(cql::Identifier(name)));
    }

    [[nodiscard]] const cql::QualifiedName& name() const noexcept { return name_; }
    [[nodiscard]] bool if_exists() const noexcept { return if_exists_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const DropUserTypeSpecification& other) const {
        return name_ == other.name_ && if_exists_ == other.if_exists_;
    }

private:
    DropUserTypeSpecification(cql::QualifiedName name, bool if_exists)
        : name_(std::move(name)), if_exists_(if_exists) {}

    cql::QualifiedName name_;
    bool if_exists_;
};

} // namespace cqlgen::keyspace
