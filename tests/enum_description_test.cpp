#include "test_types.hpp"

#include <gtest/gtest.h>

using namespace propsync;

namespace {

enum class Unlisted {
    First = 1
};

enum Plain : unsigned char {
    Low = 1,
    High = 200
};

} // namespace

TEST(EnumDescriptionTest, RegisteredDescription) {
    EXPECT_EQ(enum_description(Status::Active), "Account in good standing");
    EXPECT_EQ(enum_description(Status::Closed), "Closed by request");
}

TEST(EnumDescriptionTest, FallsBackToName) {
    EXPECT_EQ(enum_description(Status::Suspended), "Suspended");
    EXPECT_EQ(enum_name(Status::Closed), "Closed");
}

TEST(EnumDescriptionTest, FallsBackToNumericValue) {
    EXPECT_EQ(enum_description(static_cast<Status>(42)), "42");
    EXPECT_EQ(enum_name(Unlisted::First), "1");
    EXPECT_EQ(enum_description(Unlisted::First), "1");
}

TEST(EnumDescriptionTest, ReregisteringValueReplacesEntry) {
    EnumRegistry<Plain>()
        .value("Low", Low)
        .value("High", High, "upper");
    EnumRegistry<Plain>()
        .value("Lowest", Low, "lower");

    EXPECT_EQ(enum_name(Low), "Lowest");
    EXPECT_EQ(enum_description(Low), "lower");
    EXPECT_EQ(enum_description(High), "upper");
}

TEST(EnumValueTest, LooksUpByName) {
    EXPECT_EQ(enum_value<Status>("Closed"), Status::Closed);
    EXPECT_FALSE(enum_value<Status>("Deleted").has_value());
    EXPECT_FALSE(enum_value<Unlisted>("First").has_value());
}
