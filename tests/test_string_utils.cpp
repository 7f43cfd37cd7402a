#include <gtest/gtest.h>
#include <util/string_utils.hpp>

using namespace StringUtils;

TEST(StringUtils, SafeArgumentsPassThrough) {
    EXPECT_EQ(quote_argument("ls"), "ls");
    EXPECT_EQ(quote_argument("-la"), "-la");
    EXPECT_EQ(quote_argument("/var/log/syslog"), "/var/log/syslog");
    EXPECT_EQ(quote_argument("user@host:1,2+3=%x"), "user@host:1,2+3=%x");
}

TEST(StringUtils, EmptyArgumentIsQuoted) {
    EXPECT_EQ(quote_argument(""), "\"\"");
}

TEST(StringUtils, SpacesAreQuoted) {
    EXPECT_EQ(quote_argument("hello world"), "\"hello world\"");
}

TEST(StringUtils, ShellMetacharactersEscaped) {
    EXPECT_EQ(quote_argument("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(quote_argument("$HOME"), "\"\\$HOME\"");
    EXPECT_EQ(quote_argument("`id`"), "\"\\`id\\`\"");
    EXPECT_EQ(quote_argument("a\\b"), "\"a\\\\b\"");
    EXPECT_EQ(quote_argument("a;b"), "\"a;b\"");
}

TEST(StringUtils, ControlCharactersEscaped) {
    EXPECT_EQ(quote_argument("line1\nline2"), "\"line1\\nline2\"");
    EXPECT_EQ(quote_argument("a\tb"), "\"a\\tb\"");
}

TEST(StringUtils, JoinQuotedUsesSingleSpaces) {
    EXPECT_EQ(join_quoted({"echo", "hello world", "x"}), "echo \"hello world\" x");
    EXPECT_EQ(join_quoted({}), "");
}

TEST(StringUtils, TokenizeRecoversQuotedArguments) {
    std::vector<std::string> args = {"grep", "-e", "a b", "", "it's", "$PATH", "tab\there", "q\"uote"};
    EXPECT_EQ(tokenize_quoted(join_quoted(args)), args);
}

TEST(StringUtils, TokenizeSingleQuotesAreLiteral) {
    auto tokens = tokenize_quoted("echo 'a \\n b'  x");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], "a \\n b");
    EXPECT_EQ(tokens[2], "x");
}

TEST(StringUtils, IequalsIgnoresCase) {
    EXPECT_TRUE(iequals("X-SSH-Endpoint", "x-ssh-endpoint"));
    EXPECT_FALSE(iequals("X-SSH-Endpoint", "X-SSH-Endpoints"));
}

TEST(StringUtils, Trim) {
    EXPECT_EQ(trim("  host:22 \r\n"), "host:22");
    EXPECT_EQ(trim("   "), "");
}
