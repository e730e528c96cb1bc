#include "ice_config.hpp"

#include <iostream>

namespace livecall {

namespace {

using json = nlohmann::json;

Result<IceServer> ParseIceServer(const json& entry) {
    if (!entry.is_object()) {
        return MakeError(ErrorCode::InvalidMessage, "ICE server entry is not an object");
    }

    IceServer server;
    auto urlsIt = entry.find("urls");
    if (urlsIt == entry.end()) {
        return MakeError(ErrorCode::InvalidMessage, "ICE server entry missing urls");
    }
    if (urlsIt->is_string()) {
        server.urls.push_back(urlsIt->get<std::string>());
    } else if (urlsIt->is_array()) {
        for (const auto& url : *urlsIt) {
            if (!url.is_string()) {
                return MakeError(ErrorCode::InvalidMessage, "ICE server url is not a string");
            }
            server.urls.push_back(url.get<std::string>());
        }
    } else {
        return MakeError(ErrorCode::InvalidMessage, "ICE server urls must be a string or an array");
    }
    if (server.urls.empty()) {
        return MakeError(ErrorCode::InvalidMessage, "ICE server entry has no urls");
    }

    if (auto it = entry.find("username"); it != entry.end() && it->is_string()) {
        server.username = it->get<std::string>();
    }
    if (auto it = entry.find("credential"); it != entry.end() && it->is_string()) {
        server.credential = it->get<std::string>();
    }
    return server;
}

} // namespace

std::vector<IceServer> DefaultStunServers() {
    return {
        IceServer{{"stun:stun.l.google.com:19302"}, std::nullopt, std::nullopt},
        IceServer{{"stun:stun1.l.google.com:19302"}, std::nullopt, std::nullopt},
    };
}

Result<std::vector<IceServer>> ParseIceServerList(const json& document) {
    const json* list = &document;
    if (document.is_object()) {
        auto it = document.find("iceServers");
        if (it == document.end()) {
            return MakeError(ErrorCode::InvalidMessage, "ICE config missing iceServers");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        return MakeError(ErrorCode::InvalidMessage, "ICE config is not an array");
    }

    std::vector<IceServer> servers;
    for (const auto& entry : *list) {
        auto server = ParseIceServer(entry);
        if (!server) {
            return server.GetError();
        }
        servers.push_back(std::move(server.Value()));
    }
    return servers;
}

Result<std::vector<IceServer>> ParseIceServers(const std::string& body) {
    json document;
    try {
        document = json::parse(body);
    } catch (const json::parse_error& e) {
        return MakeError(ErrorCode::InvalidMessage, std::string("Invalid ICE config JSON: ") + e.what());
    }
    return ParseIceServerList(document);
}

json ToJson(const std::vector<IceServer>& servers) {
    json list = json::array();
    for (const auto& server : servers) {
        json entry = {{"urls", server.urls}};
        if (server.username) {
            entry["username"] = *server.username;
        }
        if (server.credential) {
            entry["credential"] = *server.credential;
        }
        list.push_back(std::move(entry));
    }
    return list;
}

IceConfigProvider::IceConfigProvider(std::shared_ptr<IceConfigSource> source, std::vector<IceServer> fallback)
    : Source_(std::move(source))
    , Fallback_(std::move(fallback))
{ }

void IceConfigProvider::Fetch(std::function<void(std::vector<IceServer>)> callback) {
    FetchCount_++;

    if (!Source_) {
        callback(Fallback_);
        return;
    }

    Source_->FetchIceServers([fallback = Fallback_, callback = std::move(callback)](Result<std::vector<IceServer>> result) {
        if (!result) {
            std::cerr << "[IceConfig] Fetch failed, using fallback STUN servers: "
                      << result.GetError().message << std::endl;
            callback(fallback);
            return;
        }
        if (result.Value().empty()) {
            std::cout << "[IceConfig] Source returned no servers, using fallback" << std::endl;
            callback(fallback);
            return;
        }
        std::cout << "[IceConfig] Using " << result.Value().size() << " ICE server(s)" << std::endl;
        callback(std::move(result.Value()));
    });
}

} // namespace livecall
