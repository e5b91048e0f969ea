#include "relaylb/config_loader.hpp"
#include "relaylb/liveness_tracker.hpp"
#include "relaylb/logger.hpp"
#include "relaylb/room_registry.hpp"
#include "relaylb/signal_server.hpp"
#include "relaylb/signaling_service.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/fmt/fmt.h>
#include <csignal>
#include <iostream>

using namespace relaylb;

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <port> [config]" << std::endl;
        return 1;
    }

    int port = 0;
    try {
        port = std::stoi(argv[1]);
    } catch (const std::exception&) {
        port = 0;
    }
    if (port <= 0 || port > 65535) {
        std::cerr << "Invalid port: " << argv[1] << std::endl;
        return 1;
    }

    Config config = ConfigLoader::defaults();
    if (argc == 3) {
        auto loaded = ConfigLoader::load(argv[2]);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error() << std::endl;
            return 1;
        }
        config = *loaded;
    }

    Logger::init("", config.signaling.log_level, port);

    try {
        boost::asio::io_context ioc{1};

        RoomRegistry rooms;
        SignalingService service(rooms, config.signaling.max_message_size);
        LivenessTracker liveness(ioc,
            std::chrono::seconds(config.signaling.heartbeat_interval_seconds));

        auto address = boost::asio::ip::make_address(config.signaling.host);
        auto server = std::make_shared<SignalServer>(ioc,
            boost::asio::ip::tcp::endpoint{address, static_cast<uint16_t>(port)},
            service, liveness, config.signaling.max_message_size,
            config.signaling.trusted_proxies);
        server->run();
        liveness.start();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            Logger::info(Logger::Component::Signal,
                fmt::format("Signal {} received, shutting down gracefully", signal));
            liveness.stop();
            server->stop();
            // Closing handshakes finish on their own; the loop exits once
            // the last session is gone.
        });

        std::cout << fmt::format("Signaling server started on port {}\n", port);
        std::cout << "Press Ctrl+C to stop\n";

        ioc.run();

    } catch (const std::exception& e) {
        Logger::critical(Logger::Component::Signal, fmt::format("Fatal error: {}", e.what()));
        Logger::shutdown();
        return 1;
    }

    Logger::info(Logger::Component::Signal, "Server closed");
    Logger::shutdown();
    return 0;
}
