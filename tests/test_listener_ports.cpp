#include <gtest/gtest.h>
#include <discovery/output_parsers.hpp>
#include <core/constants.hpp>

TEST(ListenerPorts, RejectsOutOfRange) {
    auto map = parse_listener_ports("8080\n8443\n70000", "host");
    ASSERT_EQ(map.size(), 1u);
    EXPECT_EQ(map[UNKNOWN_SERVICES_KEY],
              std::vector<std::string>({"http://host:8080", "http://host:8443"}));
}

TEST(ListenerPorts, SortedNumericallyAndDeduped) {
    auto map = parse_listener_ports("9000\n80\n443\n80\n", "h");
    EXPECT_EQ(map[UNKNOWN_SERVICES_KEY],
              std::vector<std::string>({"http://h:80", "http://h:443", "http://h:9000"}));
}

TEST(ListenerPorts, GarbageTokensDropped) {
    auto map = parse_listener_ports("0\n-1\nabc\n 3000 \n80a\n", "h");
    EXPECT_EQ(map[UNKNOWN_SERVICES_KEY], std::vector<std::string>({"http://h:3000"}));
}

TEST(ListenerPorts, NothingValidMeansEmptyMap) {
    EXPECT_TRUE(parse_listener_ports("", "h").empty());
    EXPECT_TRUE(parse_listener_ports("0\n65536\n", "h").empty());
}
