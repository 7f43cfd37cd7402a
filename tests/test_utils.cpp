#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, ParseBoolAcceptsPaddedWords) {
    EXPECT_EQ(parse_bool(" Yes\n"), std::optional<bool>(true));
    EXPECT_EQ(parse_bool("\toff "), std::optional<bool>(false));
    EXPECT_EQ(parse_bool("1"), std::optional<bool>(true));
    EXPECT_FALSE(parse_bool("   ").has_value());
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(Utils, ParseIntIsStrict) {
    EXPECT_EQ(parse_int("22"), std::optional<int>(22));
    EXPECT_EQ(parse_int("-1"), std::optional<int>(-1));
    EXPECT_FALSE(parse_int("22abc").has_value());
    EXPECT_FALSE(parse_int(" 22").has_value());
    EXPECT_FALSE(parse_int("+22").has_value());
    EXPECT_FALSE(parse_int("99999999999").has_value());
}
