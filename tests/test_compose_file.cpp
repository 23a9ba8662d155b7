#include <gtest/gtest.h>
#include <discovery/output_parsers.hpp>

TEST(ComposeFile, TwoServices) {
    std::string yml =
        "services:\n"
        "  web:\n"
        "    ports:\n"
        "      - \"8080:80\"\n"
        "  db:\n"
        "    ports:\n"
        "      - 3306:3306\n";

    auto map = parse_compose_file(yml, "host");
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map["web"], std::vector<std::string>({"http://host:8080"}));
    EXPECT_EQ(map["db"], std::vector<std::string>({"http://host:3306"}));
}

TEST(ComposeFile, PortsBlockClosedBySiblingProperty) {
    std::string yml =
        "services:\n"
        "  web:\n"
        "    image: nginx\n"
        "    ports:\n"
        "      - '8080:80'\n"
        "      - \"8443:443\"\n"
        "    environment:\n"
        "      - \"1234:5678\"\n";

    auto map = parse_compose_file(yml, "h");
    EXPECT_EQ(map["web"], std::vector<std::string>({"http://h:8080", "http://h:8443"}));
}

TEST(ComposeFile, EmptyPortsBlockKeepsService) {
    std::string yml =
        "services:\n"
        "  worker:\n"
        "    ports:\n"
        "      - \"0:80\"\n"
        "    restart: always\n";

    auto map = parse_compose_file(yml, "h");
    ASSERT_EQ(map.count("worker"), 1u);
    EXPECT_TRUE(map["worker"].empty());
}

TEST(ComposeFile, ServiceWithoutPortsAbsent) {
    std::string yml =
        "services:\n"
        "  cache:\n"
        "    image: redis\n"
        "  web:\n"
        "    ports:\n"
        "      - 80:80\n";

    auto map = parse_compose_file(yml, "h");
    EXPECT_EQ(map.count("cache"), 0u);
    EXPECT_EQ(map["web"], std::vector<std::string>({"http://h:80"}));
}

TEST(ComposeFile, OtherTopLevelSectionsIgnored) {
    std::string yml =
        "version: \"3.8\"\n"
        "volumes:\n"
        "  data:\n"
        "    ports:\n"
        "      - 9999:9999\n"
        "services:\n"
        "  api:\n"
        "    ports:\n"
        "      - \"5000:5000\"\n"
        "networks:\n"
        "  backend:\n"
        "    ports:\n"
        "      - 7777:7777\n";

    auto map = parse_compose_file(yml, "h");
    ASSERT_EQ(map.size(), 1u);
    EXPECT_EQ(map["api"], std::vector<std::string>({"http://h:5000"}));
}

TEST(ComposeFile, InvalidHostPortsDropped) {
    std::string yml =
        "services:\n"
        "  web:\n"
        "    ports:\n"
        "      - \"70000:80\"\n"
        "      - \"8080:80\"\n"
        "      - \"8080:81\"\n";

    auto map = parse_compose_file(yml, "h");
    EXPECT_EQ(map["web"], std::vector<std::string>({"http://h:8080"}));
}

TEST(ComposeFile, BindAddressAndProtocol) {
    std::string yml =
        "services:\n"
        "  dns:\n"
        "    ports:\n"
        "      - \"127.0.0.1:5353:53/udp\"\n"
        "      - 53:53/tcp\n";

    auto map = parse_compose_file(yml, "h");
    EXPECT_EQ(map["dns"], std::vector<std::string>({"http://h:5353", "http://h:53"}));
}

TEST(ComposeFile, ContainerOnlyPortNotMatched) {
    std::string yml =
        "services:\n"
        "  web:\n"
        "    ports:\n"
        "      - \"3000\"\n";

    auto map = parse_compose_file(yml, "h");
    ASSERT_EQ(map.count("web"), 1u);
    EXPECT_TRUE(map["web"].empty());
}

TEST(ComposeFile, CommentsAndCrlf) {
    std::string yml =
        "# deployment\r\n"
        "services:\r\n"
        "  # the front end\r\n"
        "  web:\r\n"
        "    ports:\r\n"
        "      # public\r\n"
        "      - \"8080:80\"\r\n";

    auto map = parse_compose_file(yml, "h");
    EXPECT_EQ(map["web"], std::vector<std::string>({"http://h:8080"}));
}

TEST(ComposeFile, NoServicesSection) {
    EXPECT_TRUE(parse_compose_file("", "h").empty());
    EXPECT_TRUE(parse_compose_file("version: '3'\n", "h").empty());
}
