#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/cancel_token.hpp>

TEST(Utils, ParsePort) {
    EXPECT_EQ(parse_port("80"), 80);
    EXPECT_EQ(parse_port(" 8080\r"), 8080);
    EXPECT_EQ(parse_port("1"), 1);
    EXPECT_EQ(parse_port("65535"), 65535);
    EXPECT_FALSE(parse_port("0").has_value());
    EXPECT_FALSE(parse_port("65536").has_value());
    EXPECT_FALSE(parse_port("-80").has_value());
    EXPECT_FALSE(parse_port("80/tcp").has_value());
    EXPECT_FALSE(parse_port("").has_value());
    EXPECT_FALSE(parse_port("99999999999999").has_value());
}

TEST(Utils, MakeUrl) {
    EXPECT_EQ(make_url("host", 8080), "http://host:8080");
}

TEST(Utils, SplitLines) {
    auto lines = split_lines("a\r\n\n  \nb\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(split_lines("a\n\nb", false).size(), 3u);
}

TEST(Utils, DedupeKeepsFirstSeenOrder) {
    std::vector<std::string> v = {"b", "a", "b", "c", "a"};
    dedupe_in_place(v);
    EXPECT_EQ(v, std::vector<std::string>({"b", "a", "c"}));
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("/srv/app"), "'/srv/app'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("~"), "~");
    EXPECT_EQ(shell_quote("~/apps/web"), "~/'apps/web'");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
}

TEST(CancelToken, CopiesShareFlag) {
    CancelToken a;
    CancelToken b = a;
    EXPECT_FALSE(b.cancelled());
    a.cancel();
    EXPECT_TRUE(b.cancelled());
}
