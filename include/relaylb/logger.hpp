#pragma once

#include <string>
#include <memory>
#include <spdlog/spdlog.h>

namespace relaylb {

class Logger {
public:
    enum class Component {
        LB,
        Config,
        HealthCheck,
        Proxy,
        Router,
        Room,
        Liveness,
        Admin,
        Signal
    };

    // signal_port > 0 redirects the file sink to logs/signal_<port>.log
    static void init(const std::string& log_file, const std::string& log_level,
                    int signal_port = 0);

    static void shutdown();

    static void info(Component component, const std::string& message);
    static void warn(Component component, const std::string& message);
    static void error(Component component, const std::string& message);
    static void debug(Component component, const std::string& message);
    static void critical(Component component, const std::string& message);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::string component_to_string(Component component);
    static spdlog::level::level_enum string_to_level(const std::string& level);
};

} // namespace relaylb
