#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/execution_context.h — What the fetch layer hands to resolvers
// ═══════════════════════════════════════════════════════════════════
//
//  Before a query executes, an upstream batched-fetch planner issues
//  the REST requests and records (a) every fetched element, per
//  resource and per identifier, and (b) which top-level requests it
//  made and the identifiers each returned, in order. Resolvers only
//  read this; it is shared by every field of the query.
//
// ═══════════════════════════════════════════════════════════════════

#include "graphql.h"
#include "json_utils.h"
#include "resource.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace restql {

// ── Identifier -> fetched element ──
using ObjectMap = std::map<nlohmann::json, DataMap>;

struct Pagination {
    std::optional<std::string> next;
    std::optional<long long> total;
};

struct TopLevelRequest {
    ResourceName resource;
    graphql::FieldSelection selection;
};

struct TopLevelResponse {
    TopLevelRequest request;
    std::vector<nlohmann::json> ids;
    Pagination pagination;
};

class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;

    // nullptr when nothing of this resource was fetched
    virtual const ObjectMap* objects(const ResourceName& resource) const = 0;

    virtual const std::vector<TopLevelResponse>& topLevelResponses() const = 0;
};

// ═══════════════════════════════════════════
//  Response
//  In-memory ExecutionContext.
//
//  {"data": {"courses.v1": [{"id": "c1", ...}, ...]},
//   "topLevelResponses": [
//     {"resource": "courses.v1",
//      "selection": {"name": "multiGet", "alias": "all"},
//      "ids": ["c1", "c2"],
//      "pagination": {"next": "c3", "total": 3}}]}
// ═══════════════════════════════════════════
class Response : public ExecutionContext {
public:
    Response& addObject(const ResourceName& resource, nlohmann::json id, DataMap element);

    // Keys each element by its idField member; elements without one are rejected
    Response& addObjects(const ResourceName& resource, const std::vector<DataMap>& elements,
                         const std::string& idField = "id");

    Response& addTopLevelResponse(TopLevelResponse response);

    // Data may also be {"courses.v1": {"c1": {...}}}; such elements are keyed by
    // their `id` member when present, else by the string key.
    // Throws std::runtime_error on malformed input
    static Response fromJson(const nlohmann::json& j);

    const ObjectMap* objects(const ResourceName& resource) const override;
    const std::vector<TopLevelResponse>& topLevelResponses() const override;

private:
    std::map<ResourceName, ObjectMap> data_;
    std::vector<TopLevelResponse> topLevel_;
};

} // namespace restql
