#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/pagination.h — Cursor arguments and the `paging` member
// ═══════════════════════════════════════════════════════════════════

#include "graphql.h"
#include "resource.h"
#include <string>

namespace restql::pagination {

inline constexpr const char* kStart = "start";
inline constexpr const char* kLimit = "limit";

// `start: String` — opaque cursor, the string form of the first id to return
graphql::ArgumentDescriptor startArgument();

// `limit: Int = defaultLimit` — at least 1
graphql::ArgumentDescriptor limitArgument(int defaultLimit);

// ─────────────────────────────────────────────
//  ResponsePagination { next: String, total: Int }
//  One shared type; `next` and `total` read the IdWindow that the
//  `paging` member resolved to.
// ─────────────────────────────────────────────
graphql::ObjectTypePtr pagingType();

// Resolver for the `paging` member of a connection. Selects the window
// once from the relation field's ParentContext: top-level occurrences
// report what the fetch layer recorded, nested ones the id after the
// returned window and the number of ids.
graphql::Resolver pagingResolver(const ResourceName& resource,
                                 const std::string& fieldName,
                                 int defaultLimit);

} // namespace restql::pagination
