#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/resource.h — REST resource descriptors
// ═══════════════════════════════════════════════════════════════════
//
//  A Resource is what the REST layer publishes about itself: its name,
//  version, the handlers it serves, the record schema of its elements
//  and any reverse relations declared on it. Descriptors are loaded
//  once from JSON and never mutated afterwards.
//
//  {
//    "name": "courses", "version": 1,
//    "handlers": [
//      {"name": "multiGet", "kind": "MULTI_GET",
//       "parameters": [{"name": "ids", "type": "list<string>", "required": true}]},
//      {"name": "byInstructor", "kind": "FINDER",
//       "parameters": [{"name": "instructorId", "type": "string", "required": true}]}
//    ],
//    "schema": {"name": "Course", "fields": [
//      {"name": "id", "type": "string"},
//      {"name": "instructorIds", "type": "list<string>", "related": "instructors.v1"}
//    ]},
//    "reverseRelations": {
//      "sessions": {"resourceName": "sessions.v1", "relationType": "FINDER",
//                   "arguments": {"q": "byCourse", "courseId": "$id"}}
//    }
//  }
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <compare>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace restql {

// ── "courses" version 1, written "courses.v1" ──
struct ResourceName {
    std::string name;
    int version = 0;

    std::string identifier() const { return name + ".v" + std::to_string(version); }

    // Throws std::runtime_error unless the text looks like "<name>.v<digits>"
    static ResourceName parse(const std::string& identifier);

    auto operator<=>(const ResourceName&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const ResourceName& r) {
    return os << r.identifier();
}

enum class HandlerKind { Unknown, Get, MultiGet, Finder, SingleElementFinder };

NLOHMANN_JSON_SERIALIZE_ENUM(HandlerKind, {
    {HandlerKind::Unknown, "UNKNOWN"},
    {HandlerKind::Get, "GET"},
    {HandlerKind::MultiGet, "MULTI_GET"},
    {HandlerKind::Finder, "FINDER"},
    {HandlerKind::SingleElementFinder, "SINGLE_ELEMENT_FINDER"},
})

// How a reverse relation recovers the related elements
enum class RelationType { Unknown, Get, MultiGet, Finder, SingleElementFinder };

NLOHMANN_JSON_SERIALIZE_ENUM(RelationType, {
    {RelationType::Unknown, "UNKNOWN"},
    {RelationType::Get, "GET"},
    {RelationType::MultiGet, "MULTI_GET"},
    {RelationType::Finder, "FINDER"},
    {RelationType::SingleElementFinder, "SINGLE_ELEMENT_FINDER"},
})

struct Parameter {
    std::string name;
    std::string type = "string";
    bool required = false;
    std::optional<nlohmann::json> defaultValue;

    bool operator==(const Parameter& other) const = default;
};

struct Handler {
    std::string name;
    HandlerKind kind = HandlerKind::Unknown;
    std::vector<Parameter> parameters;

    bool operator==(const Handler& other) const = default;
};

struct ReverseRelationAnnotation {
    ResourceName resourceName;
    RelationType relationType = RelationType::Unknown;
    // Parameter name -> bound value; the keys are fixed, not caller-controlled
    std::map<std::string, std::string> arguments;
};

struct RecordField {
    std::string name;
    std::string type = "string";
    // Set on list fields holding identifiers of another resource
    std::optional<ResourceName> related;
};

struct RecordSchema {
    std::string name;
    std::vector<RecordField> fields;
};

struct Resource {
    std::string name;
    int version = 0;
    std::string keyType = "string";
    std::vector<Handler> handlers;
    std::optional<RecordSchema> schema;
    std::map<std::string, ReverseRelationAnnotation> reverseRelations;

    ResourceName resourceName() const { return {name, version}; }

    const Handler* findHandler(HandlerKind kind) const;
    const Handler* findHandler(const std::string& handlerName) const;
};

// ── JSON mapping (throws nlohmann::json::exception on malformed input) ──
void to_json(nlohmann::json& j, const ResourceName& r);
void from_json(const nlohmann::json& j, ResourceName& r);
void to_json(nlohmann::json& j, const Parameter& p);
void from_json(const nlohmann::json& j, Parameter& p);
void to_json(nlohmann::json& j, const Handler& h);
void from_json(const nlohmann::json& j, Handler& h);
void from_json(const nlohmann::json& j, ReverseRelationAnnotation& a);
void from_json(const nlohmann::json& j, RecordField& f);
void from_json(const nlohmann::json& j, RecordSchema& s);
void from_json(const nlohmann::json& j, Resource& r);

} // namespace restql
