#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fixtures.h — Resource catalogs shared by the relation-field tests
// ═══════════════════════════════════════════════════════════════════

#include "restql/execution_context.h"
#include "restql/resource.h"
#include "restql/schema_metadata.h"
#include <memory>

namespace restql::testing {

inline Parameter param(const std::string& name, const std::string& type, bool required = false) {
    Parameter p;
    p.name = name;
    p.type = type;
    p.required = required;
    return p;
}

inline Handler multiGet() {
    return {"multiGet", HandlerKind::MultiGet, {param("ids", "list<string>", true)}};
}

inline Handler finder(const std::string& name, std::vector<Parameter> params) {
    return {name, HandlerKind::Finder, std::move(params)};
}

inline RecordSchema schemaOf(const std::string& name, std::vector<RecordField> fields) {
    return {name, std::move(fields)};
}

inline RecordField field(const std::string& name, const std::string& type = "string") {
    RecordField f;
    f.name = name;
    f.type = type;
    return f;
}

inline RecordField related(const std::string& name, const ResourceName& target) {
    RecordField f;
    f.name = name;
    f.type = "list<string>";
    f.related = target;
    return f;
}

// courses.v1    multiGet, byInstructor(instructorId), byCategory(category, language)
//               instructorIds -> instructors.v1, reverse `sessions` -> sessions.v1 byCourse
// instructors.v1 multiGet; courseIds -> courses.v1 (a cycle)
// sessions.v1   byCourse(courseId, includePast = false), no MULTI_GET
// lectures.v1   get only, with a schema
// drafts.v1     multiGet, no schema
inline std::shared_ptr<InMemorySchemaMetadata> catalog() {
    auto metadata = std::make_shared<InMemorySchemaMetadata>();

    Resource courses;
    courses.name = "courses";
    courses.version = 1;
    courses.handlers = {
        multiGet(),
        finder("byInstructor", {param("instructorId", "string", true)}),
        finder("byCategory", {param("ids", "list<string>"), param("category", "string", true),
                              param("language", "string")}),
    };
    courses.schema = schemaOf("Course", {field("id"), field("name"),
                                         related("instructorIds", {"instructors", 1})});
    ReverseRelationAnnotation sessions;
    sessions.resourceName = {"sessions", 1};
    sessions.relationType = RelationType::Finder;
    sessions.arguments = {{"q", "byCourse"}, {"courseId", "$id"}};
    courses.reverseRelations["sessions"] = sessions;
    metadata->add(courses);

    Resource instructors;
    instructors.name = "instructors";
    instructors.version = 1;
    instructors.handlers = {multiGet()};
    instructors.schema = schemaOf("Instructor", {field("id"), field("fullName"),
                                                 related("courseIds", {"courses", 1})});
    metadata->add(instructors);

    Resource sessionsResource;
    sessionsResource.name = "sessions";
    sessionsResource.version = 1;
    Parameter includePast = param("includePast", "boolean");
    includePast.defaultValue = false;
    sessionsResource.handlers = {finder("byCourse", {param("courseId", "string", true), includePast})};
    sessionsResource.schema = schemaOf("Session", {field("id"), field("startsAt", "long")});
    metadata->add(sessionsResource);

    Resource lectures;
    lectures.name = "lectures";
    lectures.version = 1;
    lectures.handlers = {{"get", HandlerKind::Get, {param("id", "string", true)}}};
    lectures.schema = schemaOf("Lecture", {field("id")});
    metadata->add(lectures);

    Resource drafts;
    drafts.name = "drafts";
    drafts.version = 1;
    drafts.handlers = {multiGet()};
    metadata->add(drafts);

    return metadata;
}

inline TopLevelResponse topLevel(const ResourceName& resource, const std::string& name,
                                 std::vector<nlohmann::json> ids, const std::string& alias = "") {
    TopLevelResponse response;
    response.request.resource = resource;
    response.request.selection.name = name;
    response.request.selection.alias = alias;
    response.ids = std::move(ids);
    return response;
}

} // namespace restql::testing
