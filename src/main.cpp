#include "config.hpp"
#include "room_registry.hpp"
#include "signaling_server.hpp"

#include <rtc/rtc.hpp>

#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    livecall::AppConfig config;
    if (argc > 1) {
        try {
            config = livecall::LoadConfig(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration: " << e.what() << std::endl;
            return 1;
        }
    }

    rtc::InitLogger(config.logLevel);

    auto registry = std::make_shared<livecall::RoomRegistry>(config.registry);
    for (const auto& room : config.rooms) {
        registry->ScheduleRoom(room.id, room.capacity);
    }

    livecall::SignalingServer server(registry, config.server, config.fallbackIceServers);
    try {
        server.Run();
    } catch (const std::exception& e) {
        std::cerr << "Signaling server stopped: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
