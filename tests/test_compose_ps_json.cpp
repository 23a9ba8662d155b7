#include <gtest/gtest.h>
#include <discovery/output_parsers.hpp>

TEST(ComposePsJson, SinglePublisher) {
    auto map = parse_compose_ps_json(
        R"({"Name":"app-web-1","Publishers":[{"TargetPort":80,"PublishedPort":8080,"Protocol":"tcp"}]})",
        "host");

    ASSERT_EQ(map.size(), 1u);
    EXPECT_EQ(map["app-web-1"], std::vector<std::string>({"http://host:8080"}));
}

TEST(ComposePsJson, MultiplePublishersDeduped) {
    // compose lists IPv4 and IPv6 bindings separately with the same port
    auto map = parse_compose_ps_json(
        R"({"Name":"web","Publishers":[)"
        R"({"URL":"0.0.0.0","TargetPort":80,"PublishedPort":8080,"Protocol":"tcp"},)"
        R"({"URL":"::","TargetPort":80,"PublishedPort":8080,"Protocol":"tcp"},)"
        R"({"URL":"0.0.0.0","TargetPort":443,"PublishedPort":8443,"Protocol":"tcp"}]})",
        "host");

    EXPECT_EQ(map["web"], std::vector<std::string>({"http://host:8080", "http://host:8443"}));
}

TEST(ComposePsJson, MalformedLineSkipped) {
    std::string output =
        "{\"Name\":\"a\",\"Publishers\":[{\"PublishedPort\":3000}]}\n"
        "{not json at all\n"
        "\n"
        "{\"Name\":\"b\",\"Publishers\":[{\"PublishedPort\":4000}]}\n";

    auto map = parse_compose_ps_json(output, "h");
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map["a"], std::vector<std::string>({"http://h:3000"}));
    EXPECT_EQ(map["b"], std::vector<std::string>({"http://h:4000"}));
}

TEST(ComposePsJson, InvalidPortsExcluded) {
    std::string output =
        R"({"Name":"zero","Publishers":[{"TargetPort":80,"PublishedPort":0}]})" "\n"
        R"({"Name":"neg","Publishers":[{"TargetPort":80,"PublishedPort":-5}]})" "\n"
        R"({"Name":"big","Publishers":[{"TargetPort":80,"PublishedPort":70000}]})" "\n"
        R"({"Name":"edge","Publishers":[{"PublishedPort":1},{"PublishedPort":65535}]})";

    auto map = parse_compose_ps_json(output, "h");
    ASSERT_EQ(map.size(), 1u);
    EXPECT_EQ(map["edge"], std::vector<std::string>({"http://h:1", "http://h:65535"}));
}

TEST(ComposePsJson, UnpublishedContainerAbsent) {
    // Internal-only service: compose reports PublishedPort 0
    auto map = parse_compose_ps_json(
        R"({"Name":"db","Publishers":[{"TargetPort":5432,"PublishedPort":0,"Protocol":"tcp"}]})",
        "h");
    EXPECT_TRUE(map.empty());
}

TEST(ComposePsJson, MissingNameOrPublishers) {
    std::string output =
        R"({"Publishers":[{"PublishedPort":8080}]})" "\n"
        R"({"Name":"","Publishers":[{"PublishedPort":8080}]})" "\n"
        R"({"Name":"nopub"})" "\n"
        R"({"Name":"nullpub","Publishers":null})";

    EXPECT_TRUE(parse_compose_ps_json(output, "h").empty());
}

TEST(ComposePsJson, FieldNamesCaseInsensitive) {
    auto map = parse_compose_ps_json(
        R"({"name":"svc","publishers":[{"publishedport":9000}]})", "h");
    EXPECT_EQ(map["svc"], std::vector<std::string>({"http://h:9000"}));
}

TEST(ComposePsJson, ArrayOutputAccepted) {
    auto map = parse_compose_ps_json(
        R"([{"Name":"a","Publishers":[{"PublishedPort":1000}]},)"
        R"({"Name":"b","Publishers":[{"PublishedPort":2000}]}])",
        "h");
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map["b"], std::vector<std::string>({"http://h:2000"}));
}

TEST(ComposePsJson, NonNumericPortIgnored) {
    auto map = parse_compose_ps_json(
        R"({"Name":"a","Publishers":[{"PublishedPort":"8080"},{"PublishedPort":9090}]})", "h");
    EXPECT_EQ(map["a"], std::vector<std::string>({"http://h:9090"}));
}

TEST(ComposePsJson, EmptyInput) {
    EXPECT_TRUE(parse_compose_ps_json("", "h").empty());
    EXPECT_TRUE(parse_compose_ps_json("\n\n  \n", "h").empty());
}
