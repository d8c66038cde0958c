// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Main Include                                                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

// Core types
#include "cqlgen/types.hpp"

// CQL building blocks
#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/cql/option.hpp"

// Specifications
#include "cqlgen/keyspace/options_specification.hpp"
#include "cqlgen/keyspace/column_specification.hpp"
#include "cqlgen/keyspace/keyspace_specification.hpp"
#include "cqlgen/keyspace/table_specification.hpp"
#include "cqlgen/keyspace/index_specification.hpp"
#include "cqlgen/keyspace/user_type_specification.hpp"
#include "cqlgen/keyspace/specification.hpp"
#include "cqlgen/keyspace/keyspace_actions.hpp"

// Generation
#include "cqlgen/generator/generator.hpp"
#include "cqlgen/generator/option_renderer.hpp"

// Loading
#include "cqlgen/config/spec_loader.hpp"

// Version
#include "cqlgen/version.hpp"
