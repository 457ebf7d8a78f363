#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/resource_field.h — Element types of resources
// ═══════════════════════════════════════════════════════════════════
//
//  The element type of "courses.v1" is CoursesV1, with one field per
//  record field. A list field marked `related` becomes a forward
//  relation to that resource, and each reverse relation declared on
//  the resource becomes a relation field of its own. Fields are built
//  on first use, so resources that relate to each other in a cycle
//  are fine.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "errors.h"
#include "graphql.h"
#include "resource.h"
#include "schema_metadata.h"
#include <memory>
#include <string>

namespace restql::resource_field {

Result<graphql::ObjectTypePtr> getType(std::shared_ptr<const SchemaMetadata> metadata,
                                       const ResourceName& resourceName,
                                       const Config& config = {});

// Output type of a record field type: "list<int>" -> [Int], "json" -> Json
graphql::OutputTypePtr outputType(const std::string& recordType);

// "courses" v1 -> "CoursesV1"
std::string formatResourceName(const Resource& resource);

} // namespace restql::resource_field
