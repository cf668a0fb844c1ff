#include "test_types.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace propsync;

namespace {

constexpr const char* document = R"({
    "user": {"name": "Ada", "tags": ["a", "b"], "address": {"street": "Main St", "city": "Springfield"}},
    "items": [{"price": 9.5}, {"price": 12}],
    "grid": [[1, 2], [3, 4]],
    "empty": null
})";

} // namespace

TEST(JsonFragmentTest, DottedPath) {
    EXPECT_EQ(get_json_fragment(document, "user.name"), std::optional<std::string>{"\"Ada\""});
    EXPECT_EQ(get_json_fragment(document, "user.tags"), std::optional<std::string>{R"(["a","b"])"});
}

TEST(JsonFragmentTest, IndexedPath) {
    EXPECT_EQ(get_json_fragment(document, "items[0].price"), std::optional<std::string>{"9.5"});
    EXPECT_EQ(get_json_fragment(document, "items[1]"), std::optional<std::string>{R"({"price":12})"});
    EXPECT_EQ(get_json_fragment(document, "user.tags[1]"), std::optional<std::string>{"\"b\""});
}

TEST(JsonFragmentTest, ChainedIndices) {
    EXPECT_EQ(get_json_fragment(document, "grid[1][0]"), std::optional<std::string>{"3"});
    EXPECT_EQ(get_json_fragment(R"([[true]])", "[0][0]"), std::optional<std::string>{"true"});
}

TEST(JsonFragmentTest, EmptySegmentsAreSkipped) {
    EXPECT_EQ(get_json_fragment(document, "user..name"), std::optional<std::string>{"\"Ada\""});
    EXPECT_EQ(get_json_fragment(document, ".user.name."), std::optional<std::string>{"\"Ada\""});
}

TEST(JsonFragmentTest, UnresolvedPathsGiveNothing) {
    EXPECT_FALSE(get_json_fragment(document, "user.age").has_value());
    EXPECT_FALSE(get_json_fragment(document, "items[2]").has_value());
    EXPECT_FALSE(get_json_fragment(document, "items[-1]").has_value());
    EXPECT_FALSE(get_json_fragment(document, "items[x]").has_value());
    EXPECT_FALSE(get_json_fragment(document, "items[0").has_value());
    EXPECT_FALSE(get_json_fragment(document, "user[0]").has_value());
    EXPECT_FALSE(get_json_fragment(document, "items.price").has_value());
    EXPECT_FALSE(get_json_fragment(document, "user.name.first").has_value());
}

TEST(JsonFragmentTest, BadInputGivesNothing) {
    EXPECT_FALSE(get_json_fragment("", "user").has_value());
    EXPECT_FALSE(get_json_fragment("   ", "user").has_value());
    EXPECT_FALSE(get_json_fragment(document, "").has_value());
    EXPECT_FALSE(get_json_fragment(document, " ").has_value());
    EXPECT_FALSE(get_json_fragment("{\"user\": ", "user").has_value());
}

TEST(JsonFragmentTest, NullValueIsAFragment) {
    EXPECT_EQ(get_json_fragment(document, "empty"), std::optional<std::string>{"null"});
}

TEST(HasJsonPathTest, ReportsPresence) {
    EXPECT_TRUE(has_json_path(document, "user.address.city"));
    EXPECT_TRUE(has_json_path(document, "empty"));
    EXPECT_TRUE(has_json_path(document, "grid[0][1]"));
    EXPECT_FALSE(has_json_path(document, "grid[0][2]"));
    EXPECT_FALSE(has_json_path(document, "missing"));
    EXPECT_FALSE(has_json_path("not json", "missing"));
}

TEST(GetJsonValueTest, ConvertsScalars) {
    EXPECT_EQ(get_json_value<std::string>(document, "user.name"), std::optional<std::string>{"Ada"});
    EXPECT_EQ(get_json_value<double>(document, "items[0].price"), std::optional<double>{9.5});
    EXPECT_EQ(get_json_value<double>(document, "items[1].price"), std::optional<double>{12.0});
    EXPECT_EQ(get_json_value<int>(document, "grid[1][1]"), std::optional<int>{4});
}

TEST(GetJsonValueTest, ConvertsContainersAndRegisteredTypes) {
    auto tags = get_json_value<std::vector<std::string>>(document, "user.tags");
    ASSERT_TRUE(tags.has_value());
    EXPECT_EQ(*tags, (std::vector<std::string>{"a", "b"}));

    auto address = get_json_value<Address>(document, "user.address");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->street, "Main St");
    EXPECT_EQ(address->city, "Springfield");
}

TEST(GetJsonValueTest, MismatchOrNullGivesNothing) {
    EXPECT_FALSE(get_json_value<int>(document, "user.name").has_value());
    EXPECT_FALSE(get_json_value<Address>(document, "items").has_value());
    EXPECT_FALSE(get_json_value<int>(document, "empty").has_value());
    EXPECT_FALSE(get_json_value<int>(document, "nowhere").has_value());
}
