#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/relation_classifier.h — Which handler serves a relation field
// ═══════════════════════════════════════════════════════════════════
//
//  A paginated relation field is served by one handler of the target
//  resource, chosen in this order:
//    1. an explicit override, unconditionally;
//    2. ForwardRelation: the MULTI_GET handler;
//    3. ReverseRelation: FINDER picks the finder named by the "q"
//       argument, MULTI_GET picks the MULTI_GET handler, single-element
//       relation types are rejected;
//    4. no relation: the MULTI_GET handler.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "resource.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace restql {

// ── The parent element holds the target identifiers itself ──
struct ForwardRelation {
    ResourceName resourceName;
};

// ── The target resource is queried with bound arguments ──
struct ReverseRelation {
    ReverseRelationAnnotation annotation;
};

using FieldRelation = std::variant<ForwardRelation, ReverseRelation>;

// Argument names a relation binds itself; callers never supply them
std::vector<std::string> boundArgumentNames(const std::optional<FieldRelation>& relation);

Result<Handler> classify(const Resource& resource,
                         const std::string& fieldName,
                         const std::optional<Handler>& handlerOverride,
                         const std::optional<FieldRelation>& relation);

} // namespace restql
