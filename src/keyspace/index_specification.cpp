// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Index Specifications Implementation                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/index_specification.hpp"
#include "cqlgen/types.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace cqlgen::keyspace {

CreateIndexSpecification::Builder& CreateIndexSpecification::Builder::name(cql::Identifier name) {
    name_ = std::move(name);
    return *this;
}

CreateIndexSpecification::Builder& CreateIndexSpecification::Builder::table(cql::QualifiedName table) {
    table_ = std::move(table);
    return *this;
}

CreateIndexSpecification::Builder&
CreateIndexSpecification::Builder::column(cql::Identifier column, ColumnFunction function) {
    column_ = std::move(column);
    function_ = function;
    return *this;
}

CreateIndexSpecification::Builder& CreateIndexSpecification::Builder::using_class(std::string class_name) {
    if (class_name.empty()) {
        throw SpecificationError(ErrorCode::InvalidArgument, "custom index class must not be empty");
    }
    using_class_ = std::move(class_name);
    return *this;
}

CreateIndexSpecification::Builder&
CreateIndexSpecification::Builder::option(std::string key, std::string value) {
    auto it = std::find_if(options_.begin(), options_.end(),
        [&key](const auto& entry) { return entry.first == key; });

    if (it != options_.end()) {
        it->second = std::move(value);
    } else {
        options_.emplace_back(std::move(key), std::move(value));
    }
    return *this;
}

CreateIndexSpecification CreateIndexSpecification::Builder::build() const {
    if (!table_) {
        throw SpecificationError(ErrorCode::MissingName, "index specification requires a table");
    }
    if (!column_) {
        throw SpecificationError(ErrorCode::MissingName,
            fmt::format("index on [{}] requires a column", table_->to_cql()));
    }
    return CreateIndexSpecification(name_, *table_, *column_, function_, if_not_exists_,
        using_class_, options_);
}

std::string CreateIndexSpecification::describe() const {
    return fmt::format("CreateIndexSpecification[name={}, table={}, column={}, custom={}]",
        name_ ? name_->to_cql() : "<unnamed>", table_.to_cql(), column_.to_cql(), is_custom());
}

std::string DropIndexSpecification::describe() const {
    return fmt::format("DropIndexSpecification[name={}, if_exists={}]", name_.to_cql(), if_exists_);
}

} // namespace cqlgen::keyspace
