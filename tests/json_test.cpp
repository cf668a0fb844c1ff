#include "test_types.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace propsync;
using json = nlohmann::json;

namespace {

Customer make_customer() {
    Customer customer;
    customer.id = 7;
    customer.name = "Ada";
    customer.status = Status::Closed;
    customer.scores = {3, 1, 4};
    customer.orders = make_orders({"o-1", "o-2"});
    customer.address = std::make_shared<Address>(Address{"Main St", "Springfield"});
    customer.set_email("ada@example.com");
    customer.set_password("secret");
    return customer;
}

} // namespace

// ==================== Keys ====================

TEST(JsonKeyTest, CamelCaseLowersLeadingCapitals) {
    const JsonOptions camel{JsonNaming::CamelCase, 2};

    EXPECT_EQ(detail::json_key("Name", camel), "name");
    EXPECT_EQ(detail::json_key("ID", camel), "id");
    EXPECT_EQ(detail::json_key("URLValue", camel), "urlValue");
    EXPECT_EQ(detail::json_key("already", camel), "already");
    EXPECT_EQ(detail::json_key("", camel), "");
}

TEST(JsonKeyTest, AsDeclaredKeepsName) {
    const JsonOptions declared{JsonNaming::AsDeclared, 2};
    EXPECT_EQ(detail::json_key("URLValue", declared), "URLValue");
}

// ==================== to_json ====================

TEST(ToJsonTest, WritesReadableMembersWithCamelCaseKeys) {
    const json document = json::parse(to_json(make_customer()));

    EXPECT_EQ(document["id"], 7);
    EXPECT_EQ(document["name"], "Ada");
    EXPECT_EQ(document["status"], 7);
    EXPECT_EQ(document["scores"], json::array({3, 1, 4}));
    EXPECT_EQ(document["orders"], json::array({"o-1", "o-2"}));
    EXPECT_EQ(document["address"]["street"], "Main St");
    EXPECT_EQ(document["email"], "ada@example.com");
    EXPECT_EQ(document["display"], "Ada#7");
    EXPECT_FALSE(document.contains("password"));
}

TEST(ToJsonTest, NullSharedMemberIsJsonNull) {
    Profile profile{"X", 1, nullptr, ""};
    const json document = json::parse(to_json(profile));

    EXPECT_TRUE(document["tags"].is_null());
}

TEST(ToJsonTest, IndentAndNamingFollowOptions) {
    Profile profile{"X", 1, make_tags({"a"}), ""};

    EXPECT_EQ(to_json(profile, JsonOptions{JsonNaming::AsDeclared, -1}),
              R"({"Age":1,"Name":"X","Tags":["a"]})");

    const std::string indented = to_json(profile);
    EXPECT_NE(indented.find("\n  \"age\": 1"), std::string::npos);
}

TEST(ToJsonTest, NonAsciiIsKeptUnescaped) {
    Profile profile{"Zoë", 1, nullptr, ""};
    EXPECT_NE(to_json(profile, JsonOptions{JsonNaming::CamelCase, -1}).find("Zoë"), std::string::npos);
}

TEST(ToJsonTest, NullPointerWritesNull) {
    const Profile* none = nullptr;
    EXPECT_EQ(to_json(none), "null");
}

TEST(ToJsonTest, UnregisteredClassThrows) {
    EXPECT_THROW((void)to_json(Unregistered{}), TypeNotRegisteredError);
}

// ==================== from_json ====================

TEST(FromJsonTest, ReadsWritableMembers) {
    auto profile = from_json<Profile>(R"({"name":"Y","age":2,"tags":["q","r"]})");

    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->name, "Y");
    EXPECT_EQ(profile->age, 2);
    ASSERT_NE(profile->tags, nullptr);
    EXPECT_EQ(profile->tags->items(), (std::vector<std::string>{"q", "r"}));
}

TEST(FromJsonTest, MissingKeysKeepDefaults) {
    auto profile = from_json<Profile>(R"({"name":"Y"})");

    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->age, 0);
    EXPECT_EQ(profile->tags, nullptr);
}

TEST(FromJsonTest, AccessorAndWriteOnlyMembersAreSet) {
    auto customer = from_json<Customer>(R"({"email":"x@example.com","password":"pw","display":"ignored"})");

    ASSERT_TRUE(customer.has_value());
    EXPECT_EQ(customer->email(), "x@example.com");
    EXPECT_EQ(customer->password(), "pw");
}

TEST(FromJsonTest, BlankOrNullGivesNothing) {
    EXPECT_FALSE(from_json<Profile>("").has_value());
    EXPECT_FALSE(from_json<Profile>("  \n\t").has_value());
    EXPECT_FALSE(from_json<Profile>("null").has_value());
}

TEST(FromJsonTest, MalformedTextThrows) {
    EXPECT_THROW((void)from_json<Profile>("{\"name\":"), JsonError);
}

TEST(FromJsonTest, MismatchedShapeThrows) {
    EXPECT_THROW((void)from_json<Profile>(R"({"age":"old"})"), JsonError);
    EXPECT_THROW((void)from_json<Profile>(R"([1, 2])"), JsonError);
    EXPECT_THROW((void)from_json<Profile>(R"({"tags":"a"})"), JsonError);
}

TEST(FromJsonTest, ScalarsAndContainers) {
    EXPECT_EQ(from_json<int>("42"), 42);
    EXPECT_EQ(from_json<std::vector<std::string>>(R"(["a","b"])"),
              (std::vector<std::string>{"a", "b"}));
}

// ==================== try_from_json ====================

TEST(TryFromJsonTest, ReportsSuccess) {
    Profile profile;
    ASSERT_TRUE(try_from_json(R"({"name":"Y","age":5})", profile));
    EXPECT_EQ(profile.name, "Y");
    EXPECT_EQ(profile.age, 5);
}

TEST(TryFromJsonTest, FailureLeavesOutputUntouched) {
    Profile profile{"keep", 9, nullptr, ""};

    EXPECT_FALSE(try_from_json("", profile));
    EXPECT_FALSE(try_from_json("null", profile));
    EXPECT_FALSE(try_from_json("{oops", profile));
    EXPECT_FALSE(try_from_json(R"({"age":[]})", profile));

    EXPECT_EQ(profile.name, "keep");
    EXPECT_EQ(profile.age, 9);
}

TEST(TryFromJsonTest, UnregisteredTypeIsFailure) {
    Unregistered value;
    EXPECT_FALSE(try_from_json(R"({"value":1})", value));
}

// ==================== json_clone ====================

TEST(JsonCloneTest, ProducesIndependentDeepCopy) {
    const Customer original = make_customer();
    const Customer copy = json_clone(original);

    EXPECT_EQ(copy.id, 7);
    EXPECT_EQ(copy.name, "Ada");
    EXPECT_EQ(copy.status, Status::Closed);
    EXPECT_EQ(copy.scores, original.scores);
    EXPECT_EQ(copy.email(), "ada@example.com");

    ASSERT_NE(copy.orders, nullptr);
    EXPECT_NE(copy.orders, original.orders);
    EXPECT_EQ(*copy.orders, *original.orders);

    ASSERT_NE(copy.address, nullptr);
    EXPECT_NE(copy.address, original.address);
    EXPECT_EQ(*copy.address, *original.address);
}

TEST(JsonCloneTest, WriteOnlyMembersAreNotCarried) {
    const Customer copy = json_clone(make_customer());
    EXPECT_EQ(copy.password(), "");
}

TEST(JsonCloneTest, MutatingCloneLeavesOriginalAlone) {
    const Profile original{"X", 1, make_tags({"a"}), ""};
    Profile copy = json_clone(original);

    copy.tags->add("b");

    EXPECT_EQ(original.tags->size(), 1u);
    EXPECT_EQ(copy.tags->size(), 2u);
}

TEST(JsonCloneTest, PointerOverload) {
    const Profile* none = nullptr;
    EXPECT_EQ(json_clone(none), nullptr);

    const Profile original{"X", 3, nullptr, ""};
    auto copy = json_clone(&original);
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->age, 3);
    EXPECT_EQ(copy->tags, nullptr);
}
