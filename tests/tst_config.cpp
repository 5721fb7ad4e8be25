#include <fstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "dns_config.h"

static std::string writeFile(const std::string& name, const std::string& content)
{
    std::string path = testing::TempDir() + name;
    std::ofstream ofs(path.c_str());
    ofs << content;
    return path;
}

TEST(Config, Defaults)
{
    DNSResolverConfig config;
    ASSERT_TRUE(config.root_servers.empty());
    ASSERT_EQ(53, config.port);
    ASSERT_EQ(10, config.timeout);
    ASSERT_EQ(32, config.max_hops);
    ASSERT_TRUE(config.tcp_fallback);
    ASSERT_FALSE(config.verbose);
}

TEST(Config, ParseJson)
{
    auto path = writeFile("resolver_full.json", R"({
        "root_servers": ["198.41.0.4", "199.9.14.201"],
        "port": 5353,
        "timeout": 2,
        "max_hops": 8,
        "tcp_fallback": false,
        "verbose": true
    })");

    DNSResolverConfig config(path);
    std::vector<std::string> expected{ "198.41.0.4", "199.9.14.201" };
    ASSERT_EQ(expected, config.root_servers);
    ASSERT_EQ(5353, config.port);
    ASSERT_EQ(2, config.timeout);
    ASSERT_EQ(8, config.max_hops);
    ASSERT_FALSE(config.tcp_fallback);
    ASSERT_TRUE(config.verbose);
}

TEST(Config, MissingKeysKeepDefaults)
{
    auto path = writeFile("resolver_min.json", R"({ "root_servers": ["192.33.4.12"] })");

    DNSResolverConfig config(path);
    ASSERT_EQ(std::vector<std::string>{ "192.33.4.12" }, config.root_servers);
    ASSERT_EQ(53, config.port);
    ASSERT_EQ(10, config.timeout);
    ASSERT_EQ(32, config.max_hops);
    ASSERT_TRUE(config.tcp_fallback);
}

TEST(Config, RootServersFileIsAppended)
{
    writeFile("roots_test.txt", "# comment\n\n  192.5.5.241  \n192.112.36.4 # trailing\n");
    auto path = writeFile("resolver_file.json", R"({
        "root_servers": ["198.41.0.4"],
        "root_servers_file": "roots_test.txt"
    })");

    DNSResolverConfig config(path);
    std::vector<std::string> expected{ "198.41.0.4", "192.5.5.241", "192.112.36.4" };
    ASSERT_EQ(expected, config.root_servers);
}

TEST(Config, ReadRootServers)
{
    auto path = writeFile("roots_plain.txt", "198.41.0.4\r\n199.9.14.201\r\n");
    std::vector<std::string> expected{ "198.41.0.4", "199.9.14.201" };
    ASSERT_EQ(expected, read_root_servers(path));
    ASSERT_THROW(read_root_servers(testing::TempDir() + "no_such_roots.txt"), std::runtime_error);
}

TEST(Config, Errors)
{
    ASSERT_THROW(DNSResolverConfig{ testing::TempDir() + "no_such_file.json" }, std::runtime_error);
    ASSERT_THROW(DNSResolverConfig{ writeFile("bad_syntax.json", "{ \"port\": ") }, std::runtime_error);
    ASSERT_THROW(DNSResolverConfig{ writeFile("bad_array.json", "[1, 2]") }, std::runtime_error);
    ASSERT_THROW(DNSResolverConfig{ writeFile("no_roots.json", "{ \"port\": 53 }") }, std::runtime_error);
    ASSERT_THROW(DNSResolverConfig{ writeFile("name_root.json", R"({ "root_servers": ["a.root-servers.net"] })") },
                 std::runtime_error);
    ASSERT_THROW(DNSResolverConfig{ writeFile("bad_timeout.json", R"({ "root_servers": ["198.41.0.4"], "timeout": 0 })") },
                 std::runtime_error);
    ASSERT_THROW(DNSResolverConfig{ writeFile("bad_port.json", R"({ "root_servers": ["198.41.0.4"], "port": 70000 })") },
                 std::runtime_error);
}
