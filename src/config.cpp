#include "config.hpp"

#include <fstream>
#include <stdexcept>

namespace livecall {

namespace {

using json = nlohmann::json;

const json* Section(const json& document, const char* name) {
    auto it = document.find(name);
    if (it == document.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::runtime_error(std::string("\"") + name + "\" must be an object");
    }
    return &*it;
}

template <typename T>
void Read(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Bad value for \"") + key + "\": " + e.what());
    }
}

void ReadMillis(const json& section, const char* key, std::chrono::milliseconds& target) {
    int64_t value = target.count();
    Read(section, key, value);
    if (value < 0) {
        throw std::runtime_error(std::string("\"") + key + "\" must not be negative");
    }
    target = std::chrono::milliseconds{value};
}

size_t ReadCapacity(const json& section, const char* key, size_t fallback) {
    int64_t value = static_cast<int64_t>(fallback);
    Read(section, key, value);
    if (value <= 0) {
        throw std::runtime_error(std::string("\"") + key + "\" must be positive: " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

} // namespace

std::optional<rtc::LogLevel> ParseLogLevel(const std::string& name) {
    if (name == "none") return rtc::LogLevel::None;
    if (name == "fatal") return rtc::LogLevel::Fatal;
    if (name == "error") return rtc::LogLevel::Error;
    if (name == "warning") return rtc::LogLevel::Warning;
    if (name == "info") return rtc::LogLevel::Info;
    if (name == "debug") return rtc::LogLevel::Debug;
    if (name == "verbose") return rtc::LogLevel::Verbose;
    return std::nullopt;
}

AppConfig ParseConfig(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    AppConfig config;

    if (auto server = Section(document, "server")) {
        int port = config.server.port;
        Read(*server, "port", port);
        if (port <= 0 || port > 65535) {
            throw std::runtime_error("\"port\" out of range: " + std::to_string(port));
        }
        config.server.port = static_cast<uint16_t>(port);

        std::string bindAddress;
        Read(*server, "bindAddress", bindAddress);
        if (!bindAddress.empty()) {
            config.server.bindAddress = bindAddress;
        }
        ReadMillis(*server, "reconnectGraceMs", config.server.reconnectGrace);
    }

    if (auto registry = Section(document, "registry")) {
        config.registry.defaultCapacity = ReadCapacity(*registry, "defaultCapacity", config.registry.defaultCapacity);
        Read(*registry, "autoCreateRooms", config.registry.autoCreateRooms);
        config.registry.archivedRooms = ReadCapacity(*registry, "archivedRooms", config.registry.archivedRooms);
    }

    if (auto session = Section(document, "session")) {
        ReadMillis(*session, "negotiationTimeoutMs", config.session.negotiationTimeout);
        ReadMillis(*session, "retryBackoffMs", config.session.retryBackoff);
        ReadMillis(*session, "deviceAcquisitionTimeoutMs", config.session.deviceAcquisitionTimeout);
        Read(*session, "maxRetries", config.session.maxRetries);
        if (config.session.maxRetries < 0) {
            throw std::runtime_error("\"maxRetries\" must not be negative");
        }
    }

    if (auto it = document.find("fallbackIceServers"); it != document.end()) {
        auto servers = ParseIceServerList(*it);
        if (!servers) {
            throw std::runtime_error("Bad fallbackIceServers: " + servers.GetError().message);
        }
        config.fallbackIceServers = std::move(servers.Value());
    }

    if (auto it = document.find("rooms"); it != document.end()) {
        if (!it->is_array()) {
            throw std::runtime_error("\"rooms\" must be an array");
        }
        for (const auto& entry : *it) {
            if (!entry.is_object()) {
                throw std::runtime_error("Room entries must be objects");
            }
            ScheduledRoom room;
            Read(entry, "id", room.id);
            if (room.id.empty()) {
                throw std::runtime_error("Room entries need an id");
            }
            room.capacity = ReadCapacity(entry, "capacity", config.registry.defaultCapacity);
            config.rooms.push_back(std::move(room));
        }
    }

    std::string logLevel;
    Read(document, "logLevel", logLevel);
    if (!logLevel.empty()) {
        auto level = ParseLogLevel(logLevel);
        if (!level) {
            throw std::runtime_error("Unknown logLevel: " + logLevel);
        }
        config.logLevel = *level;
    }

    return config;
}

AppConfig LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    return ParseConfig(document);
}

} // namespace livecall
