#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/schema_builder.h — Root query type over every resource
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto metadata = std::make_shared<InMemorySchemaMetadata>(
//        InMemorySchemaMetadata::fromFile("resources.json"));
//    auto built = SchemaBuilder(metadata).build();
//    for (auto& e : built.errors) console::warn(e);
//    auto result = built.schema->execute(query, response);
//
//  Query {
//    CoursesV1Resource {
//      multiGet(start, limit): CoursesV1Connection
//      byInstructor(instructorId, start, limit): CoursesV1Connection
//    }
//  }
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "errors.h"
#include "graphql.h"
#include "schema_metadata.h"
#include <memory>
#include <vector>

namespace restql {

struct BuiltSchema {
    std::shared_ptr<const graphql::Schema> schema;
    // Fields left out of the schema, one entry each
    std::vector<SchemaError> errors;
};

class SchemaBuilder {
public:
    explicit SchemaBuilder(std::shared_ptr<const SchemaMetadata> metadata, Config config = {})
        : metadata_(std::move(metadata)), config_(config) {}

    BuiltSchema build() const;

    // "courses" v1 -> "CoursesV1Resource"
    static std::string formatRootFieldName(const Resource& resource);

private:
    std::shared_ptr<const SchemaMetadata> metadata_;
    Config config_;
};

} // namespace restql
