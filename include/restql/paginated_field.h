#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/paginated_field.h — Paginated relation fields
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto built = paginated_field::build(metadata, {"instructors", 1}, "instructorIds",
//                                        std::nullopt, ForwardRelation{{"instructors", 1}});
//    if (!built) console::warn(built.error());
//
//  The field's type is a connection,
//
//    InstructorsV1Connection {
//      elements: [InstructorsV1]
//      paging: ResponsePagination
//    }
//
//  and its arguments are the chosen handler's parameters plus `start`
//  and `limit`, minus `ids` and minus anything the relation binds.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "errors.h"
#include "graphql.h"
#include "relation_classifier.h"
#include "resource.h"
#include "schema_metadata.h"
#include <memory>
#include <optional>
#include <string>

namespace restql {

struct FieldDescriptor {
    graphql::Field field;
    Handler handler;
};

namespace paginated_field {

Result<FieldDescriptor> build(std::shared_ptr<const SchemaMetadata> metadata,
                              const ResourceName& resourceName,
                              const std::string& fieldName,
                              const std::optional<Handler>& handlerOverride,
                              const std::optional<FieldRelation>& relation,
                              const Config& config = {});

// Connection type of a resource. Element fields are resolved lazily and
// degrade to no fields at all if the element type cannot be built.
// Throws SchemaGenerationException when the resource or its schema is absent.
graphql::ObjectTypePtr getType(std::shared_ptr<const SchemaMetadata> metadata,
                               const ResourceName& resourceName,
                               const std::string& fieldName,
                               const Config& config = {});

// Resolver of the `elements` member
graphql::Resolver elementsResolver(const ResourceName& resourceName,
                                   const std::string& fieldName,
                                   int defaultLimit);

// max(limit / 10, 1) * relationCost * childScore, integer division
double cost(int limit, double childScore, double relationCost = 10.0);

// "courses" v1 -> "CoursesV1Connection"
std::string formatConnectionName(const Resource& resource);

} // namespace paginated_field

} // namespace restql
