#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/restql.h — Umbrella header for restql
// ═══════════════════════════════════════════════════════════════════
//
//  #include "restql/restql.h"
//  using namespace restql;
//
//  This single include gives you:
//    • InMemorySchemaMetadata, Resource, Handler
//    • SchemaBuilder, paginated_field::build()
//    • Response (ExecutionContext)
//    • graphql::Schema::execute(), complexity()
//    • console::log(), warn(), setLevel()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "config.h"
#include "errors.h"

// Resources
#include "resource.h"
#include "schema_metadata.h"
#include "execution_context.h"

// GraphQL
#include "graphql.h"
#include "validator.h"
#include "handler_arguments.h"
#include "pagination.h"

// Relation fields
#include "relation_classifier.h"
#include "resolution.h"
#include "paginated_field.h"
#include "resource_field.h"
#include "schema_builder.h"
