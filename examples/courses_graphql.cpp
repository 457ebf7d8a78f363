// ═══════════════════════════════════════════════════════════════════
//  courses_graphql.cpp — Relation fields over a small course catalog
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Loading resource metadata from JSON
//    • Building the root schema with SchemaBuilder
//    • Forward (instructorIds) and reverse (sessions) relations
//    • Executing a query against pre-fetched data
//
//  Run:  ./courses_graphql ['{ CoursesV1Resource { ... } }']
//
// ═══════════════════════════════════════════════════════════════════

#include "restql/restql.h"

using namespace restql;

static const char* kResources = R"({"resources": [
  {"name": "courses", "version": 1,
   "handlers": [
     {"name": "multiGet", "kind": "MULTI_GET",
      "parameters": [{"name": "ids", "type": "list<string>", "required": true}]},
     {"name": "byInstructor", "kind": "FINDER",
      "parameters": [{"name": "instructorId", "type": "string", "required": true}]}],
   "schema": {"name": "Course", "fields": [
     {"name": "id", "type": "string"},
     {"name": "name", "type": "string"},
     {"name": "instructorIds", "type": "list<string>", "related": "instructors.v1"}]},
   "reverseRelations": {
     "sessions": {"resourceName": "sessions.v1", "relationType": "FINDER",
                  "arguments": {"q": "byCourse", "courseId": "$id"}}}},
  {"name": "instructors", "version": 1,
   "handlers": [{"name": "multiGet", "kind": "MULTI_GET",
                 "parameters": [{"name": "ids", "type": "list<string>", "required": true}]}],
   "schema": {"name": "Instructor", "fields": [
     {"name": "id", "type": "string"},
     {"name": "fullName", "type": "string"},
     {"name": "courseIds", "type": "list<string>", "related": "courses.v1"}]}},
  {"name": "sessions", "version": 1,
   "handlers": [{"name": "byCourse", "kind": "FINDER",
                 "parameters": [{"name": "courseId", "type": "string", "required": true},
                                {"name": "includePast", "type": "boolean", "default": false}]}],
   "schema": {"name": "Session", "fields": [
     {"name": "id", "type": "string"},
     {"name": "startsAt", "type": "long"}]}}
]})";

static const char* kResponse = R"({
  "data": {
    "courses.v1": [
      {"id": "ml", "name": "Machine Learning", "instructorIds": ["ng", "koller"], "sessions": ["s1", "s2"]},
      {"id": "pgm", "name": "Probabilistic Graphical Models", "instructorIds": ["koller"], "sessions": []}],
    "instructors.v1": [
      {"id": "ng", "fullName": "Andrew Ng", "courseIds": ["ml"]},
      {"id": "koller", "fullName": "Daphne Koller", "courseIds": ["pgm", "ml"]}],
    "sessions.v1": [
      {"id": "s1", "startsAt": 1700000000},
      {"id": "s2", "startsAt": 1710000000}]
  },
  "topLevelResponses": [
    {"resource": "courses.v1", "selection": {"name": "multiGet"},
     "ids": ["ml", "pgm"], "pagination": {"total": 2}}]
})";

static const char* kDefaultQuery = R"({
  CoursesV1Resource {
    multiGet {
      elements {
        name
        instructorIds(limit: 1) {
          elements { fullName }
          paging { next total }
        }
        sessions { elements { id startsAt } }
      }
      paging { total }
    }
  }
})";

int main(int argc, char* argv[]) {
    try {
        auto config = Config::fromEnv();
        config.apply();

        auto metadata = std::make_shared<InMemorySchemaMetadata>(
            InMemorySchemaMetadata::fromJson(nlohmann::json::parse(kResources)));
        auto built = SchemaBuilder(metadata, config).build();
        for (auto& error : built.errors) {
            console::warn(toString(error.code), error.message);
        }

        auto response = Response::fromJson(nlohmann::json::parse(kResponse));
        std::string query = argc > 1 ? argv[1] : kDefaultQuery;

        console::info("Query complexity:", built.schema->complexity(query));
        auto result = built.schema->execute(query, response);
        console::log(result.dump(2));
        return result.contains("errors") ? 1 : 0;
    } catch (const std::exception& e) {
        console::error(e.what());
        return 1;
    }
}
