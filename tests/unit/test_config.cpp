/**
 * @file test_config.cpp
 * @brief Unit tests for daemon configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - Adapter, discovery and API options
 * - Error handling
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sdcdisco/daemon/config.hpp>

#include <string>
#include <vector>

using namespace sdcdisco::daemon;
using ::testing::ElementsAre;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    Config parse(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size() + 1);
        argv_storage_.push_back(toChars("sdcdiscod"));
        for (const auto& arg : args) {
            argv_storage_.push_back(toChars(arg));
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }
        return parseArgs(static_cast<int>(argv_ptrs_.size()), argv_ptrs_.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;

    static std::vector<char> toChars(const std::string& s) {
        std::vector<char> chars(s.begin(), s.end());
        chars.push_back('\0');
        return chars;
    }
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, Defaults) {
    Config config = parse({});
    EXPECT_EQ(config.adapter_mode, "all");
    EXPECT_TRUE(config.adapters.empty());
    EXPECT_FALSE(config.force_adapter);
    EXPECT_EQ(config.mcast_port, 3702);
    EXPECT_EQ(config.mcast_ttl, 15);
    EXPECT_TRUE(config.proxy_url.empty());
    EXPECT_FALSE(config.search_udp);
    EXPECT_EQ(config.bind_addr, "127.0.0.1");
    EXPECT_EQ(config.api_port, 50061);
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.error);
}

// =============================================================================
// Options
// =============================================================================

TEST_F(ConfigTest, AdapterOptions) {
    Config config = parse({"--adapter-mode", "whitelist", "--adapters", "10\\.,,192\\.168\\."});
    EXPECT_EQ(config.adapter_mode, "whitelist");
    EXPECT_THAT(config.adapters, ElementsAre("10\\.", "192\\.168\\."));
    EXPECT_FALSE(config.error);
}

TEST_F(ConfigTest, SingleAdapterWithForce) {
    Config config = parse({"--adapter-mode", "single", "--adapter-name", "eth1", "--force-adapter"});
    EXPECT_EQ(config.adapter_mode, "single");
    EXPECT_EQ(config.adapter_name, "eth1");
    EXPECT_TRUE(config.force_adapter);
    EXPECT_FALSE(config.help);
}

TEST_F(ConfigTest, DiscoveryAndApiOptions) {
    Config config = parse({"--mcast-port", "13702", "--mcast-ttl", "1",
                           "--proxy-url", "https://dp.local/discovery", "--proxy-ca", "ca.pem",
                           "--search-udp", "--bind", "0.0.0.0", "--api-port", "6000",
                           "--log-level", "DEBUG"});
    EXPECT_EQ(config.mcast_port, 13702);
    EXPECT_EQ(config.mcast_ttl, 1);
    EXPECT_EQ(config.proxy_url, "https://dp.local/discovery");
    EXPECT_EQ(config.proxy_ca_file, "ca.pem");
    EXPECT_TRUE(config.search_udp);
    EXPECT_EQ(config.bind_addr, "0.0.0.0");
    EXPECT_EQ(config.api_port, 6000);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_FALSE(config.error);
}

TEST_F(ConfigTest, HelpFlag) {
    Config config = parse({"--help"});
    EXPECT_TRUE(config.help);
    EXPECT_FALSE(config.error);

    config = parse({"-h"});
    EXPECT_TRUE(config.help);
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, MissingValue) {
    Config config = parse({"--api-port"});
    EXPECT_TRUE(config.help);
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, UnknownOption) {
    Config config = parse({"--cluster", "x"});
    EXPECT_TRUE(config.error);
}

TEST_F(ConfigTest, InvalidPort) {
    EXPECT_TRUE(parse({"--api-port", "70000"}).error);
    EXPECT_TRUE(parse({"--mcast-port", "0"}).error);
    EXPECT_TRUE(parse({"--mcast-port", "abc"}).error);
}

TEST_F(ConfigTest, UnknownAdapterMode) {
    EXPECT_TRUE(parse({"--adapter-mode", "random"}).error);
}

TEST_F(ConfigTest, ForceWithoutAdapterName) {
    EXPECT_TRUE(parse({"--adapter-mode", "single", "--force-adapter"}).error);
}

TEST(SplitListTest, DropsEmptyItems) {
    EXPECT_THAT(splitList("a,b,,c,"), ElementsAre("a", "b", "c"));
    EXPECT_TRUE(splitList("").empty());
}
