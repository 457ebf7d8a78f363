// ═══════════════════════════════════════════════════════════════════
//  test_resolution.cpp — Page selection for top-level and nested fields
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "restql/resolution.h"
#include "fixtures.h"
#include <limits>

using namespace restql;
using namespace restql::testing;

namespace {

const ResourceName kCourses{"courses", 1};

DataMap element(const nlohmann::json& id) {
    return nlohmann::json{{"id", id}, {"name", "Course " + idToString(id)}};
}

Response fetched(const std::vector<nlohmann::json>& ids) {
    Response response;
    for (auto& id : ids) response.addObject(kCourses, id, element(id));
    return response;
}

ParentContext topLevelOccurrence(const std::string& name, const std::string& alias = "") {
    ParentContext parent;
    graphql::FieldSelection ast;
    ast.name = name;
    ast.alias = alias;
    parent.astFields = {ast};
    return parent;
}

ParentContext nestedOccurrence(const DataMap& parentValue, const std::string& name,
                               const std::string& alias = "") {
    auto parent = topLevelOccurrence(name, alias);
    parent.value = parentValue;
    return parent;
}

std::vector<nlohmann::json> idsOf(const std::vector<DataMap>& elements) {
    std::vector<nlohmann::json> ids;
    for (auto& e : elements) ids.push_back(e.at("id"));
    return ids;
}

} // namespace

// ═══════════════════════════════════════════
//  Top-level mode
// ═══════════════════════════════════════════

TEST(ResolutionTest, TopLevelReturnsRecordedOrder) {
    auto response = fetched({"a", "b", "c"});
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"c", "a", "b"}));

    auto page = resolvePage(response, topLevelOccurrence("multiGet"), kCourses, "multiGet", 100,
                            std::nullopt);

    ASSERT_EQ(page.size(), 3);
    EXPECT_EQ(page[0], element("c"));
    EXPECT_EQ(page[1], element("a"));
    EXPECT_EQ(page[2], element("b"));
}

TEST(ResolutionTest, TopLevelMatchesAlias) {
    auto response = fetched({"a", "b", "c"});
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"a"}, "first"));
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"b", "c"}, "rest"));
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"c"}));

    auto rest = resolvePage(response, topLevelOccurrence("multiGet", "rest"), kCourses, "multiGet",
                            100, std::nullopt);
    auto unaliased = resolvePage(response, topLevelOccurrence("multiGet"), kCourses, "multiGet",
                                 100, std::nullopt);

    EXPECT_EQ(idsOf(rest), (std::vector<nlohmann::json>{"b", "c"}));
    EXPECT_EQ(idsOf(unaliased), (std::vector<nlohmann::json>{"c"}));
}

TEST(ResolutionTest, TopLevelIgnoresOtherResourcesAndNames) {
    auto response = fetched({"a"});
    response.addTopLevelResponse(topLevel({"instructors", 1}, "multiGet", {"a"}));
    response.addTopLevelResponse(topLevel(kCourses, "byInstructor", {"a"}));

    auto page = resolvePage(response, topLevelOccurrence("multiGet"), kCourses, "multiGet", 100,
                            std::nullopt);

    EXPECT_TRUE(page.empty());
}

TEST(ResolutionTest, TopLevelDoesNotWindow) {
    auto response = fetched({1, 2, 3, 4, 5});
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {1, 2, 3, 4, 5}));

    auto page = resolvePage(response, topLevelOccurrence("multiGet"), kCourses, "multiGet", 2,
                            std::string("3"));

    EXPECT_EQ(page.size(), 5);
}

TEST(ResolutionTest, TopLevelWithoutAstIsEmpty) {
    auto response = fetched({"a"});
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"a"}));

    auto page = resolvePage(response, ParentContext{}, kCourses, "multiGet", 100, std::nullopt);
    EXPECT_TRUE(page.empty());
}

TEST(ResolutionTest, EmptyObjectParentIsTopLevel) {
    auto response = fetched({"a"});
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"a"}));

    auto parent = nestedOccurrence(nlohmann::json::object(), "multiGet");
    EXPECT_TRUE(parent.isTopLevel());
    EXPECT_EQ(resolvePage(response, parent, kCourses, "multiGet", 100, std::nullopt).size(), 1);
}

// ═══════════════════════════════════════════
//  Partial data
// ═══════════════════════════════════════════

TEST(ResolutionTest, MissingObjectsAreDropped) {
    auto response = fetched({"a", "c"});
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"a", "b", "c"}));

    auto page = resolvePage(response, topLevelOccurrence("multiGet"), kCourses, "multiGet", 100,
                            std::nullopt);

    ASSERT_EQ(page.size(), 2);
    EXPECT_EQ(page[0], element("a"));
    EXPECT_EQ(page[1], element("c"));
}

TEST(ResolutionTest, UnfetchedResourceIsEmpty) {
    Response response;
    response.addTopLevelResponse(topLevel(kCourses, "multiGet", {"a"}));

    auto page = resolvePage(response, topLevelOccurrence("multiGet"), kCourses, "multiGet", 100,
                            std::nullopt);

    EXPECT_TRUE(page.empty());
}

TEST(ResolutionTest, NestedUnfetchedResourceIsEmpty) {
    Response response;
    response.addObject({"instructors", 1}, "a", element("a"));
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {"a", "b"}}}, "courseIds");

    EXPECT_TRUE(resolvePage(response, parent, kCourses, "courseIds", 100, std::nullopt).empty());
}

TEST(ResolutionTest, ParentWithoutFieldIsEmpty) {
    auto response = fetched({"a"});
    auto parent = nestedOccurrence(nlohmann::json{{"id", "p"}}, "courseIds");

    EXPECT_TRUE(resolvePage(response, parent, kCourses, "courseIds", 100, std::nullopt).empty());
}

TEST(ResolutionTest, NonListParentFieldIsEmpty) {
    auto response = fetched({"a"});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", "a"}}, "courseIds");

    EXPECT_TRUE(resolvePage(response, parent, kCourses, "courseIds", 100, std::nullopt).empty());
}

// ═══════════════════════════════════════════
//  Nested mode
// ═══════════════════════════════════════════

TEST(ResolutionTest, NestedUsesParentOrder) {
    auto response = fetched({"a", "b", "c"});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {"b", "c", "a"}}}, "courseIds");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 100, std::nullopt);

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{"b", "c", "a"}));
}

TEST(ResolutionTest, NestedStartAndLimitWindow) {
    auto response = fetched({1, 2, 3, 4, 5});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2, 3, 4, 5}}}, "courseIds");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 2, std::string("3"));

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{3, 4}));
}

TEST(ResolutionTest, NestedLimitWithoutStart) {
    auto response = fetched({1, 2, 3});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2, 3}}}, "courseIds");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 2, std::nullopt);

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{1, 2}));
}

TEST(ResolutionTest, NestedUnknownCursorStartsFromFirstId) {
    auto response = fetched({1, 2, 3});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2, 3}}}, "courseIds");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 2, std::string("9"));

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{1, 2}));
}

TEST(ResolutionTest, NestedWindowAppliesBeforeDroppingMissing) {
    auto response = fetched({"a", "c", "d"});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {"a", "b", "c", "d"}}}, "courseIds");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 3, std::nullopt);

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{"a", "c"}));
}

TEST(ResolutionTest, NestedReadsAliasedMember) {
    auto response = fetched({"a", "b"});
    auto parent = nestedOccurrence(
        nlohmann::json{{"courseIds", nlohmann::json::array({"a"})},
                       {"firstCourse", nlohmann::json::array({"b"})}}, "courseIds", "firstCourse");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 100, std::nullopt);

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{"b"}));
}

// ═══════════════════════════════════════════
//  Paging values
// ═══════════════════════════════════════════

TEST(ResolutionTest, NestedCursorAtLastIdReturnsOne) {
    auto response = fetched({1, 2, 3});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2, 3}}}, "courseIds");

    auto page = resolvePage(response, parent, kCourses, "courseIds", 2, std::string("3"));
    auto window = selectIds(response, parent, kCourses, "courseIds", 2, std::string("3"));

    EXPECT_EQ(idsOf(page), (std::vector<nlohmann::json>{3}));
    EXPECT_FALSE(window.next.has_value());
    EXPECT_EQ(window.total, std::optional<long long>(3));
}

TEST(ResolutionTest, NestedWindowReportsNextAndTotal) {
    Response response;
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2, 3, 4, 5}}}, "courseIds");

    auto window = selectIds(response, parent, kCourses, "courseIds", 2, std::string("3"));

    EXPECT_EQ(window.ids, (std::vector<nlohmann::json>{3, 4}));
    EXPECT_EQ(window.next, std::optional<std::string>("5"));
    EXPECT_EQ(window.total, std::optional<long long>(5));
}

TEST(ResolutionTest, NestedWindowAtEndHasNoNext) {
    Response response;
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2}}}, "courseIds");

    auto window = selectIds(response, parent, kCourses, "courseIds", 10, std::nullopt);

    EXPECT_FALSE(window.next.has_value());
}

TEST(ResolutionTest, TopLevelWindowReportsRecordedPagination) {
    Response response;
    auto record = topLevel(kCourses, "multiGet", {"a"});
    record.pagination.next = "b";
    record.pagination.total = 7;
    response.addTopLevelResponse(record);

    auto window = selectIds(response, topLevelOccurrence("multiGet"), kCourses, "multiGet", 1,
                            std::nullopt);

    EXPECT_EQ(window.next, std::optional<std::string>("b"));
    EXPECT_EQ(window.total, std::optional<long long>(7));
}

TEST(ResolutionTest, ParentContextReadsPaginationArguments) {
    ParentContext parent;
    parent.args = {{"start", 3}, {"limit", 2}};
    EXPECT_EQ(parent.start(), std::optional<std::string>("3"));
    EXPECT_EQ(parent.limit(), std::optional<int>(2));

    ParentContext none;
    EXPECT_FALSE(none.start().has_value());
    EXPECT_FALSE(none.limit().has_value());
}

TEST(ResolutionTest, OversizedLimitSaturates) {
    auto response = fetched({1, 2, 3});
    auto parent = nestedOccurrence(nlohmann::json{{"courseIds", {1, 2, 3}}}, "courseIds");
    parent.args = {{"limit", 4294967298ULL}};

    ASSERT_TRUE(parent.limit().has_value());
    EXPECT_EQ(*parent.limit(), std::numeric_limits<int>::max());
    EXPECT_EQ(resolvePage(response, parent, kCourses, "courseIds", *parent.limit(),
                          std::nullopt).size(), 3);

    parent.args = {{"limit", -4294967298LL}};
    EXPECT_EQ(*parent.limit(), std::numeric_limits<int>::min());
    EXPECT_TRUE(resolvePage(response, parent, kCourses, "courseIds", *parent.limit(),
                            std::nullopt).empty());
}
