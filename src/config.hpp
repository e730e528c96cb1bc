#pragma once

#include "ice_config.hpp"
#include "peer_session.hpp"
#include "room_registry.hpp"

#include <nlohmann/json.hpp>
#include <rtc/rtc.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace livecall {

struct ServerConfig {
    uint16_t port = 8000;
    std::optional<std::string> bindAddress;
    // How long a dropped client keeps its seat before it is removed.
    std::chrono::milliseconds reconnectGrace{15000};
};

struct ScheduledRoom {
    RoomId id;
    size_t capacity = 2;
};

struct AppConfig {
    ServerConfig server;
    RegistryConfig registry;
    PeerSessionOptions session;
    std::vector<IceServer> fallbackIceServers = DefaultStunServers();
    std::vector<ScheduledRoom> rooms;
    rtc::LogLevel logLevel = rtc::LogLevel::Info;
};

std::optional<rtc::LogLevel> ParseLogLevel(const std::string& name);

// Missing keys keep their defaults. Throws std::runtime_error on bad input.
AppConfig ParseConfig(const nlohmann::json& document);
AppConfig LoadConfig(const std::string& path);

} // namespace livecall
