#pragma once

#include "cqlgen/config/spec_handler.hpp"
#include "cqlgen/keyspace/keyspace_actions.hpp"

namespace cqlgen::config {

// ==============================================================================
// Keyspaces
// ==============================================================================

/// CREATE_KEYSPACE and CREATE_DROP_KEYSPACE go through KeyspaceActions
class KeyspaceActionHandler : public ISpecHandler {
public:
    explicit KeyspaceActionHandler(keyspace::KeyspaceAction action) : action_(action) {}

    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;

private:
    keyspace::KeyspaceAction action_;
};

/// Only the options present in the document are altered
class AlterKeyspaceHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

class DropKeyspaceHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

// ==============================================================================
// Tables
// ==============================================================================

class CreateTableHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

class AlterTableHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

class DropTableHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

// ==============================================================================
// Indexes
// ==============================================================================

class CreateIndexHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

class DropIndexHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

// ==============================================================================
// User types
// ==============================================================================

class CreateUserTypeHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

class AlterUserTypeHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

class DropUserTypeHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override;
};

} // namespace cqlgen::config
