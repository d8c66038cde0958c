// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - User Type Specifications Implementation                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/user_type_specification.hpp"
#include "cqlgen/types.hpp"

#include <fmt/core.h>

#include <set>

namespace cqlgen::keyspace {

// ==============================================================================
// CREATE TYPE
// ==============================================================================

CreateUserTypeSpecification::Builder&
CreateUserTypeSpecification::Builder::field(cql::Identifier name, cql::DataType type) {
    fields_.push_back(FieldSpecification{std::move(name), std::move(type)});
    return *this;
}

CreateUserTypeSpecification CreateUserTypeSpecification::Builder::build() const {
    if (fields_.empty()) {
        throw SpecificationError(ErrorCode::EmptyColumnList,
            fmt::format("user type [{}] must have at least one field", name_.to_cql()));
    }

    std::set<cql::Identifier> seen;
    for (const auto& field : fields_) {
        if (!seen.insert(field.name).second) {
            throw SpecificationError(ErrorCode::DuplicateColumn,
                fmt::format("user type [{}] declares field [{}] more than once",
                    name_.to_cql(), field.name.to_cql()));
        }
    }

    return CreateUserTypeSpecification(name_, if_not_exists_, fields_);
}

std::string CreateUserTypeSpecification::describe() const {
    return fmt::format("CreateUserTypeSpecification[name={}, if_not_exists={}, fields={}]",
        name_.to_cql(), if_not_exists_, fields_.size());
}

// ==============================================================================
// ALTER TYPE
// ==============================================================================

AlterUserTypeSpecification::Builder&
AlterUserTypeSpecification::Builder::add(cql::Identifier name, cql::DataType type) {
    changes_.emplace_back(AddColumn{std::move(name), std::move(type)});
    return *this;
}

AlterUserTypeSpecification::Builder&
AlterUserTypeSpecification::Builder::alter(cql::Identifier name, cql::DataType type) {
    changes_.emplace_back(AlterColumn{std::move(name), std::move(type)});
    return *this;
}

AlterUserTypeSpecification::Builder&
AlterUserTypeSpecification::Builder::rename(cql::Identifier from, cql::Identifier to) {
    changes_.emplace_back(RenameColumn{std::move(from), std::move(to)});
    return *this;
}

AlterUserTypeSpecification AlterUserTypeSpecification::Builder::build() const {
    if (changes_.empty()) {
        throw SpecificationError(ErrorCode::EmptyChangeList,
            fmt::format("alter of user type [{}] has no changes", name_.to_cql()));
    }
    return AlterUserTypeSpecification(name_, changes_);
}

std::string AlterUserTypeSpecification::describe() const {
    return fmt::format("AlterUserTypeSpecification[name={}, changes={}]",
        name_.to_cql(), changes_.size());
}

// ==============================================================================
// DROP TYPE
// ==============================================================================

std::string DropUserTypeSpecification::describe() const {
    return fmt::format("DropUserTypeSpecification[name={}, if_exists={}]", name_.to_cql(), if_exists_);
}

} // namespace cqlgen::keyspace
