#include "PropSync/StringUtil.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

using namespace propsync;

TEST(StringUtilTest, NullOrEmpty) {
    const char* none = nullptr;
    EXPECT_TRUE(is_null_or_empty(none));
    EXPECT_TRUE(is_null_or_empty(""));
    EXPECT_TRUE(is_null_or_empty(std::string{}));
    EXPECT_TRUE(is_null_or_empty(std::string_view{}));
    EXPECT_TRUE(is_null_or_empty(std::optional<std::string>{}));

    EXPECT_FALSE(is_null_or_empty(" "));
    EXPECT_FALSE(is_null_or_empty(std::string{"a"}));
    EXPECT_FALSE(is_null_or_empty(std::optional<std::string>{"a"}));
}

TEST(StringUtilTest, NullOrWhiteSpace) {
    const char* none = nullptr;
    EXPECT_TRUE(is_null_or_white_space(none));
    EXPECT_TRUE(is_null_or_white_space(""));
    EXPECT_TRUE(is_null_or_white_space(" \t\r\n\v\f"));
    EXPECT_TRUE(is_null_or_white_space(std::string{"   "}));
    EXPECT_TRUE(is_null_or_white_space(std::optional<std::string>{}));
    EXPECT_TRUE(is_null_or_white_space(std::optional<std::string>{"\t"}));

    EXPECT_FALSE(is_null_or_white_space(" x "));
    EXPECT_FALSE(is_null_or_white_space(std::string_view{"x"}));
    EXPECT_FALSE(is_null_or_white_space(std::optional<std::string>{"x"}));
}
