#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livecall {

struct IceServer {
    std::vector<std::string> urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;
};

using IceServersCallback = std::function<void(Result<std::vector<IceServer>>)>;

// Backend of GET /webrtc-config.
class IceConfigSource {
public:
    virtual ~IceConfigSource() = default;
    virtual void FetchIceServers(IceServersCallback callback) = 0;
};

class StaticIceConfigSource : public IceConfigSource {
public:
    explicit StaticIceConfigSource(std::vector<IceServer> servers)
        : Servers_(std::move(servers))
    { }

    void FetchIceServers(IceServersCallback callback) override {
        callback(Servers_);
    }

private:
    std::vector<IceServer> Servers_;
};

std::vector<IceServer> DefaultStunServers();

// Accepts the bare array or an object with an "iceServers" array; "urls"
// may be a string or an array of strings.
Result<std::vector<IceServer>> ParseIceServerList(const nlohmann::json& json);
Result<std::vector<IceServer>> ParseIceServers(const std::string& body);
nlohmann::json ToJson(const std::vector<IceServer>& servers);

// TURN credentials are short-lived, so every Fetch goes back to the source.
class IceConfigProvider {
public:
    IceConfigProvider(std::shared_ptr<IceConfigSource> source, std::vector<IceServer> fallback = DefaultStunServers());

    void Fetch(std::function<void(std::vector<IceServer>)> callback);

    uint64_t FetchCount() const {
        return FetchCount_.load();
    }

private:
    std::shared_ptr<IceConfigSource> Source_;
    std::vector<IceServer> Fallback_;
    std::atomic_uint64_t FetchCount_{0};
};

} // namespace livecall
