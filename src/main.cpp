#include "relaylb/admin_server.hpp"
#include "relaylb/backend_manager.hpp"
#include "relaylb/config_loader.hpp"
#include "relaylb/health_monitor.hpp"
#include "relaylb/load_balancer.hpp"
#include "relaylb/logger.hpp"
#include "relaylb/periodic_timer.hpp"
#include "relaylb/proxy_server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/fmt/fmt.h>
#include <csignal>
#include <iostream>

using namespace relaylb;

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config/relaylb.json";

    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.load_balancer.log_file, config.load_balancer.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} backends from {}", config.backends.size(), config_path));

    auto algorithm = parse_algorithm(config.load_balancer.algorithm);

    try {
        boost::asio::io_context ioc{1};

        auto backend_manager = std::make_shared<BackendManager>();
        LoadBalancer load_balancer(backend_manager, *algorithm, config.load_balancer.sticky);
        for (const auto& backend : config.backends) {
            auto added = load_balancer.add_backend(backend);
            if (!added) {
                Logger::error(Logger::Component::Config, added.error());
            }
        }

        HealthMonitor health_monitor(ioc, backend_manager,
            std::make_shared<HttpHealthProbe>(config.health_check.path,
                                              config.health_check.timeout_seconds),
            config.health_check);
        health_monitor.subscribe([&load_balancer](const HealthEvent& event) {
            load_balancer.on_health_event(event);
        });
        health_monitor.subscribe_cycle([&load_balancer](const HealthCycleSummary& summary) {
            load_balancer.on_health_cycle(summary);
        });
        health_monitor.start();

        auto sticky_ttl = std::chrono::seconds(config.load_balancer.sticky_ttl_seconds);
        PeriodicTimer sticky_cleanup(ioc,
            std::chrono::seconds(config.load_balancer.cleanup_interval_seconds),
            [&load_balancer, sticky_ttl]() {
                size_t pruned = load_balancer.prune_sticky_sessions(
                    std::chrono::steady_clock::now(), sticky_ttl);
                if (pruned > 0) {
                    Logger::debug(Logger::Component::LB,
                        fmt::format("Pruned {} stale sticky session(s)", pruned));
                }
            });
        sticky_cleanup.start();

        auto address = boost::asio::ip::make_address(config.load_balancer.host);
        auto proxy = std::make_shared<ProxyServer>(ioc,
            boost::asio::ip::tcp::endpoint{address, config.load_balancer.port},
            load_balancer, std::chrono::seconds(config.load_balancer.proxy_timeout_seconds));
        proxy->run();

        AdminApi admin_api(load_balancer);
        std::unique_ptr<AdminServer> admin;
        if (config.admin.enabled) {
            admin = std::make_unique<AdminServer>(ioc, admin_api, config.admin);
            admin->start();
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            Logger::info(Logger::Component::LB,
                fmt::format("Signal {} received, shutting down gracefully", signal));
            health_monitor.stop();
            sticky_cleanup.stop();
            proxy->stop();
            ioc.stop();
        });

        std::cout << fmt::format("Load balancer started on {}:{}\n",
            config.load_balancer.host, config.load_balancer.port);
        std::cout << "Press Ctrl+C to stop\n";

        ioc.run();

        if (admin) {
            admin->stop();
        }

    } catch (const std::exception& e) {
        Logger::critical(Logger::Component::LB, fmt::format("Fatal error: {}", e.what()));
        Logger::shutdown();
        return 1;
    }

    Logger::info(Logger::Component::LB, "Load balancer stopped");
    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return 0;
}
