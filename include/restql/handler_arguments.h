#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/handler_arguments.h — GraphQL arguments for REST handlers
// ═══════════════════════════════════════════════════════════════════

#include "graphql.h"
#include "resource.h"
#include <string>
#include <vector>

namespace restql {

// ── Name of the identifier-list parameter of MULTI_GET handlers ──
inline constexpr const char* kIdsArgument = "ids";

// "string" -> "String", "long" -> "Int", "list<double>" -> "[Float]"; unknown -> "String"
std::string inputTypeName(const std::string& parameterType);

// One descriptor per handler parameter, in declaration order. With
// includePagination, `start` and `limit` follow unless already declared.
std::vector<graphql::ArgumentDescriptor> generateHandlerArguments(
    const Handler& handler, bool includePagination, int defaultLimit = 100);

} // namespace restql
