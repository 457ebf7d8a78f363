// ═══════════════════════════════════════════════════════════════════
//  test_resource.cpp — Resource metadata, fetched data and config loading
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "restql/config.h"
#include "restql/execution_context.h"
#include "restql/schema_metadata.h"
#include <cstdlib>
#include <sstream>

using namespace restql;

// ═══════════════════════════════════════════
//  ResourceName
// ═══════════════════════════════════════════

TEST(ResourceNameTest, ParseIdentifier) {
    auto name = ResourceName::parse("courses.v2");
    EXPECT_EQ(name.name, "courses");
    EXPECT_EQ(name.version, 2);
    EXPECT_EQ(name.identifier(), "courses.v2");
}

TEST(ResourceNameTest, ParseKeepsDotsInName) {
    auto name = ResourceName::parse("on.demand.v10");
    EXPECT_EQ(name.name, "on.demand");
    EXPECT_EQ(name.version, 10);
}

TEST(ResourceNameTest, ParseRejectsMalformed) {
    EXPECT_THROW(ResourceName::parse("courses"), std::runtime_error);
    EXPECT_THROW(ResourceName::parse(".v1"), std::runtime_error);
    EXPECT_THROW(ResourceName::parse("courses.v"), std::runtime_error);
    EXPECT_THROW(ResourceName::parse("courses.vx"), std::runtime_error);
}

TEST(ResourceNameTest, OrderingAndStreaming) {
    EXPECT_LT((ResourceName{"courses", 1}), (ResourceName{"courses", 2}));
    EXPECT_NE((ResourceName{"courses", 1}), (ResourceName{"sessions", 1}));

    std::ostringstream os;
    os << ResourceName{"sessions", 3};
    EXPECT_EQ(os.str(), "sessions.v3");
}

TEST(ResourceNameTest, ParseRejectsOversizedVersion) {
    EXPECT_THROW(ResourceName::parse("courses.v99999999999"), std::runtime_error);
    EXPECT_THROW(Response::fromJson(nlohmann::json::parse(R"({"data": {"courses.v99999999999": []}})")),
                 std::runtime_error);
    EXPECT_THROW(InMemorySchemaMetadata::fromJson(nlohmann::json::parse(
                     R"([{"name": "a", "version": 1, "reverseRelations": {
                          "b": {"resourceName": "b.v4294967296"}}}])")),
                 std::runtime_error);
}

// ═══════════════════════════════════════════
//  Handler
// ═══════════════════════════════════════════

TEST(HandlerTest, EqualityComparesParameters) {
    Handler byName{"byName", HandlerKind::Finder, {{"name", "string", true, std::nullopt}}};
    Handler same = byName;
    Handler optionalName = byName;
    optionalName.parameters[0].required = false;
    Handler defaulted = byName;
    defaulted.parameters[0].defaultValue = "x";

    EXPECT_TRUE(byName == same);
    EXPECT_FALSE(byName == optionalName);
    EXPECT_FALSE(byName == defaulted);
    EXPECT_FALSE(byName == (Handler{"byName", HandlerKind::Finder, {}}));
}

// ═══════════════════════════════════════════
//  InMemorySchemaMetadata
// ═══════════════════════════════════════════

TEST(SchemaMetadataTest, FromJson) {
    auto metadata = InMemorySchemaMetadata::fromJson(nlohmann::json::parse(R"({
      "resources": [{
        "name": "courses", "version": 1,
        "handlers": [
          {"name": "multiGet", "kind": "MULTI_GET",
           "parameters": [{"name": "ids", "type": "list<string>", "required": true}]},
          {"name": "byLanguage", "kind": "FINDER",
           "parameters": [{"name": "language", "default": "en"}]}],
        "schema": {"name": "Course", "fields": [
          {"name": "id"},
          {"name": "instructorIds", "type": "list<string>", "related": "instructors.v1"}]},
        "reverseRelations": {
          "sessions": {"resourceName": "sessions.v1", "relationType": "FINDER",
                       "arguments": {"q": "byCourse", "courseId": "$id"}}}
      }]
    })"));

    auto* courses = metadata.getResource({"courses", 1});
    ASSERT_NE(courses, nullptr);
    EXPECT_EQ(metadata.getResource({"courses", 2}), nullptr);

    ASSERT_EQ(courses->handlers.size(), 2);
    EXPECT_EQ(courses->handlers[0].kind, HandlerKind::MultiGet);
    ASSERT_NE(courses->findHandler("byLanguage"), nullptr);
    auto& language = courses->findHandler("byLanguage")->parameters.at(0);
    EXPECT_EQ(language.type, "string");
    EXPECT_FALSE(language.required);
    ASSERT_TRUE(language.defaultValue.has_value());
    EXPECT_EQ(*language.defaultValue, "en");

    auto* schema = metadata.getSchema(*courses);
    ASSERT_NE(schema, nullptr);
    ASSERT_EQ(schema->fields.size(), 2);
    EXPECT_FALSE(schema->fields[0].related.has_value());
    ASSERT_TRUE(schema->fields[1].related.has_value());
    EXPECT_EQ(*schema->fields[1].related, (ResourceName{"instructors", 1}));

    auto& sessions = courses->reverseRelations.at("sessions");
    EXPECT_EQ(sessions.resourceName, (ResourceName{"sessions", 1}));
    EXPECT_EQ(sessions.relationType, RelationType::Finder);
    EXPECT_EQ(sessions.arguments.at("q"), "byCourse");
}

TEST(SchemaMetadataTest, FromBareArray) {
    auto metadata = InMemorySchemaMetadata::fromJson(nlohmann::json::parse(
        R"([{"name": "a", "version": 1}, {"name": "b", "version": 1}])"));
    EXPECT_EQ(metadata.resources().size(), 2);
    EXPECT_EQ(metadata.getSchema(*metadata.getResource({"a", 1})), nullptr);
}

TEST(SchemaMetadataTest, UnknownHandlerKindIsKept) {
    auto metadata = InMemorySchemaMetadata::fromJson(nlohmann::json::parse(
        R"([{"name": "a", "version": 1, "handlers": [{"name": "x", "kind": "ACTION"}]}])"));
    EXPECT_EQ(metadata.getResource({"a", 1})->handlers.at(0).kind, HandlerKind::Unknown);
}

TEST(SchemaMetadataTest, MalformedMetadataThrows) {
    EXPECT_THROW(InMemorySchemaMetadata::fromJson(nlohmann::json{{"resources", 5}}),
                 std::runtime_error);
    EXPECT_THROW(InMemorySchemaMetadata::fromJson(nlohmann::json::parse(R"([{"version": 1}])")),
                 std::runtime_error);
    EXPECT_THROW(InMemorySchemaMetadata::fromFile("/nonexistent/resources.json"),
                 std::runtime_error);
}

TEST(SchemaMetadataTest, DuplicateReplacesEarlier) {
    Resource first;
    first.name = "a";
    first.version = 1;
    first.keyType = "int";
    Resource second = first;
    second.keyType = "string";

    InMemorySchemaMetadata metadata;
    metadata.add(first).add(second);

    EXPECT_EQ(metadata.resources().size(), 1);
    EXPECT_EQ(metadata.getResource({"a", 1})->keyType, "string");
}

// ═══════════════════════════════════════════
//  Response
// ═══════════════════════════════════════════

TEST(ResponseTest, FromJsonArrayAndObjectData) {
    auto response = Response::fromJson(nlohmann::json::parse(R"({
      "data": {
        "courses.v1": [{"id": 1, "name": "ML"}, {"id": 2, "name": "PGM"}],
        "sessions.v1": {"s1": {"startsAt": 5}}
      },
      "topLevelResponses": [
        {"resource": "courses.v1", "selection": {"name": "multiGet", "alias": "all"},
         "ids": [2, 1], "pagination": {"next": 3, "total": null}}]
    })"));

    auto* courses = response.objects({"courses", 1});
    ASSERT_NE(courses, nullptr);
    EXPECT_EQ(courses->size(), 2);
    EXPECT_EQ(courses->at(1)["name"], "ML");

    auto* sessions = response.objects({"sessions", 1});
    ASSERT_NE(sessions, nullptr);
    EXPECT_EQ(sessions->at("s1")["startsAt"], 5);

    EXPECT_EQ(response.objects({"instructors", 1}), nullptr);

    ASSERT_EQ(response.topLevelResponses().size(), 1);
    auto& top = response.topLevelResponses()[0];
    EXPECT_EQ(top.request.selection.responseKey(), "all");
    EXPECT_EQ(top.ids, (std::vector<nlohmann::json>{2, 1}));
    EXPECT_EQ(top.pagination.next, std::optional<std::string>("3"));
    EXPECT_FALSE(top.pagination.total.has_value());
}

TEST(ResponseTest, KeyedDataUsesElementId) {
    auto response = Response::fromJson(nlohmann::json::parse(R"({
      "data": {"courses.v1": {"1": {"id": 1, "name": "ML"}, "pgm": {"name": "PGM"}}}
    })"));

    auto* courses = response.objects({"courses", 1});
    ASSERT_NE(courses, nullptr);
    EXPECT_EQ(courses->count(nlohmann::json(1)), 1);
    EXPECT_EQ(courses->count(nlohmann::json("1")), 0);
    EXPECT_EQ(courses->at("pgm")["name"], "PGM");
}

TEST(ResponseTest, ElementWithoutIdThrows) {
    Response response;
    EXPECT_THROW(response.addObjects({"courses", 1}, {nlohmann::json{{"name", "ML"}}}),
                 std::runtime_error);
    EXPECT_THROW(Response::fromJson(nlohmann::json::parse(R"({"data": {"courses.v1": 5}})")),
                 std::runtime_error);
    EXPECT_THROW(Response::fromJson(nlohmann::json::parse(
                     R"({"topLevelResponses": [{"selection": {"name": "multiGet"}}]})")),
                 std::runtime_error);
}

TEST(ResponseTest, CustomIdField) {
    Response response;
    response.addObjects({"courses", 1}, {nlohmann::json{{"slug", "ml"}, {"name", "ML"}}}, "slug");
    EXPECT_EQ(response.objects({"courses", 1})->at("ml")["name"], "ML");
}

// ═══════════════════════════════════════════
//  Config
// ═══════════════════════════════════════════

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.defaultLimit, 100);
    EXPECT_DOUBLE_EQ(config.relationComplexityCost, 10.0);
    EXPECT_EQ(config.logLevel, console::Level::Info);
}

TEST(ConfigTest, FromJson) {
    auto config = Config::fromJson(nlohmann::json::parse(
        R"({"defaultLimit": 25, "relationComplexityCost": 2.5, "logLevel": "warn"})"));
    EXPECT_EQ(config.defaultLimit, 25);
    EXPECT_DOUBLE_EQ(config.relationComplexityCost, 2.5);
    EXPECT_EQ(config.logLevel, console::Level::Warn);
}

TEST(ConfigTest, FromJsonRejectsBadValues) {
    EXPECT_THROW(Config::fromJson(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json{{"defaultLimit", 0}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json{{"defaultLimit", "ten"}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json{{"logLevel", "loud"}}), std::runtime_error);
}

TEST(ConfigTest, FromEnv) {
    setenv("RESTQL_DEFAULT_LIMIT", "40", 1);
    setenv("RESTQL_LOG_LEVEL", "debug", 1);
    auto config = Config::fromEnv();
    EXPECT_EQ(config.defaultLimit, 40);
    EXPECT_EQ(config.logLevel, console::Level::Debug);

    setenv("RESTQL_DEFAULT_LIMIT", "many", 1);
    EXPECT_THROW(Config::fromEnv(), std::runtime_error);

    unsetenv("RESTQL_DEFAULT_LIMIT");
    unsetenv("RESTQL_LOG_LEVEL");
    EXPECT_EQ(Config::fromEnv().defaultLimit, 100);
}

TEST(ConfigTest, ApplySetsLogLevel) {
    auto previous = console::level();
    Config config;
    config.logLevel = console::Level::Error;
    config.apply();
    EXPECT_EQ(console::level(), console::Level::Error);
    console::setLevel(previous);
}
