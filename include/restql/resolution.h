#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/resolution.h — Resolving one page of a relation field
// ═══════════════════════════════════════════════════════════════════
//
//  The identifiers of a page come from one of two places:
//
//    top level  the field sits directly under a resource root, so the
//               fetch layer recorded a TopLevelResponse for it; its ids
//               are used in recorded order, already windowed upstream.
//
//    nested     the field sits under a fetched element, which lists the
//               target ids under the field's alias (or name). The
//               `start` cursor and `limit` window that list here.
//
//  Ids are then mapped through the fetched objects; ids with nothing
//  fetched are dropped. Nothing here mutates the ExecutionContext, so
//  resolution is safe to run for sibling fields concurrently.
//
// ═══════════════════════════════════════════════════════════════════

#include "execution_context.h"
#include "graphql.h"
#include "json_utils.h"
#include "resource.h"
#include <optional>
#include <string>
#include <vector>

namespace restql {

// ─────────────────────────────────────────────
//  ParentContext
//  The occurrence of a relation field being resolved: the element it
//  hangs off (absent at the top level), its arguments and its AST.
// ─────────────────────────────────────────────
struct ParentContext {
    std::optional<DataMap> value;
    nlohmann::json args = nlohmann::json::object();
    std::vector<graphql::FieldSelection> astFields;

    // A missing, null or empty parent value is a top-level occurrence
    static ParentContext from(const graphql::ResolveContext& context);

    bool isTopLevel() const { return !value || value->is_null() || value->empty(); }

    std::string alias() const {
        return astFields.empty() ? std::string() : astFields.front().alias;
    }

    std::optional<std::string> start() const;
    std::optional<int> limit() const;
};

// ── The ids a page covers, plus what the paging member reports ──
struct IdWindow {
    std::vector<nlohmann::json> ids;
    std::optional<std::string> next;
    std::optional<long long> total;
};

// Top-level record matching this occurrence, or nullptr
const TopLevelResponse* findTopLevelResponse(const ExecutionContext& ctx,
                                             const ParentContext& parent,
                                             const ResourceName& resource);

IdWindow selectIds(const ExecutionContext& ctx,
                   const ParentContext& parent,
                   const ResourceName& resource,
                   const std::string& fieldName,
                   int limit,
                   const std::optional<std::string>& start);

// Ordered elements of one page
std::vector<DataMap> resolvePage(const ExecutionContext& ctx,
                                 const ParentContext& parent,
                                 const ResourceName& resource,
                                 const std::string& fieldName,
                                 int limit,
                                 const std::optional<std::string>& start);

} // namespace restql
