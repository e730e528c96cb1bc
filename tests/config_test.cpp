#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace livecall {
namespace {

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = ParseConfig(json::object());

    EXPECT_EQ(8000, config.server.port);
    EXPECT_FALSE(config.server.bindAddress.has_value());
    EXPECT_EQ(15000ms, config.server.reconnectGrace);
    EXPECT_EQ(2u, config.registry.defaultCapacity);
    EXPECT_TRUE(config.registry.autoCreateRooms);
    EXPECT_EQ(2u, config.fallbackIceServers.size());
    EXPECT_TRUE(config.rooms.empty());
    EXPECT_EQ(rtc::LogLevel::Info, config.logLevel);
}

TEST(ConfigTest, ReadsEverySection) {
    auto config = ParseConfig(json::parse(R"({
        "server": {"port": 9443, "bindAddress": "127.0.0.1", "reconnectGraceMs": 0},
        "registry": {"defaultCapacity": 4, "autoCreateRooms": false},
        "session": {"negotiationTimeoutMs": 5000, "retryBackoffMs": 250,
                    "deviceAcquisitionTimeoutMs": 1000, "maxRetries": 3},
        "fallbackIceServers": [{"urls": "stun:stun.example.org"}],
        "rooms": [{"id": "math-101"}, {"id": "office-hours", "capacity": 6}],
        "logLevel": "debug"
    })"));

    EXPECT_EQ(9443, config.server.port);
    EXPECT_EQ("127.0.0.1", config.server.bindAddress.value_or(""));
    EXPECT_EQ(0ms, config.server.reconnectGrace);
    EXPECT_EQ(4u, config.registry.defaultCapacity);
    EXPECT_FALSE(config.registry.autoCreateRooms);
    EXPECT_EQ(5000ms, config.session.negotiationTimeout);
    EXPECT_EQ(250ms, config.session.retryBackoff);
    EXPECT_EQ(1000ms, config.session.deviceAcquisitionTimeout);
    EXPECT_EQ(3, config.session.maxRetries);
    ASSERT_EQ(1u, config.fallbackIceServers.size());
    EXPECT_EQ("stun:stun.example.org", config.fallbackIceServers[0].urls[0]);
    ASSERT_EQ(2u, config.rooms.size());
    EXPECT_EQ("math-101", config.rooms[0].id);
    EXPECT_EQ(4u, config.rooms[0].capacity);
    EXPECT_EQ(6u, config.rooms[1].capacity);
    EXPECT_EQ(rtc::LogLevel::Debug, config.logLevel);
}

TEST(ConfigTest, RejectsBadValues) {
    const char* documents[] = {
        R"([])",
        R"({"server": 5})",
        R"({"server": {"port": 0}})",
        R"({"server": {"port": 70000}})",
        R"({"server": {"port": "http"}})",
        R"({"server": {"reconnectGraceMs": -1}})",
        R"({"registry": {"defaultCapacity": 0}})",
        R"({"registry": {"defaultCapacity": -1}})",
        R"({"registry": {"archivedRooms": 0}})",
        R"({"rooms": [{"id": "r", "capacity": -1}]})",
        R"({"rooms": [{"id": "r", "capacity": 0}]})",
        R"({"session": {"maxRetries": -2}})",
        R"({"fallbackIceServers": [{"username": "x"}]})",
        R"({"rooms": {"id": "r"}})",
        R"({"rooms": [{"capacity": 3}]})",
        R"({"logLevel": "chatty"})",
    };

    for (const char* document : documents) {
        EXPECT_THROW(ParseConfig(json::parse(document)), std::runtime_error) << document;
    }
}

TEST(ConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "livecall_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"server": {"port": 8100}, "logLevel": "warning"})";
    }

    auto config = LoadConfig(path);
    EXPECT_EQ(8100, config.server.port);
    EXPECT_EQ(rtc::LogLevel::Warning, config.logLevel);

    std::remove(path.c_str());
    EXPECT_THROW(LoadConfig(path), std::runtime_error);
}

TEST(ConfigTest, ParsesLogLevelNames) {
    EXPECT_EQ(rtc::LogLevel::Verbose, ParseLogLevel("verbose"));
    EXPECT_EQ(rtc::LogLevel::None, ParseLogLevel("none"));
    EXPECT_FALSE(ParseLogLevel("INFO").has_value());
}

} // namespace
} // namespace livecall
