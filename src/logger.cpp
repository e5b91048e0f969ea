#include "relaylb/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace relaylb {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& log_file, const std::string& log_level,
                 int signal_port) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);

        bool is_signal = signal_port > 0;
        size_t max_size = is_signal ? 5 * 1024 * 1024 : 10 * 1024 * 1024;
        size_t max_files = is_signal ? 3 : 5;

        std::string actual_log_file = log_file;
        if (is_signal) {
            actual_log_file = fmt::format("logs/signal_{}.log", signal_port);
        }

        // Build directories put us one or two levels below the repo root
        std::vector<std::string> search_paths;
        if (actual_log_file.find("logs/") == 0) {
            search_paths = {
                actual_log_file,
                "../" + actual_log_file,
                "../../" + actual_log_file
            };
        } else {
            search_paths = {actual_log_file};
        }

        std::string final_log_path = actual_log_file;
        for (const auto& path : search_paths) {
            std::filesystem::path log_path(path);
            std::filesystem::path log_dir = log_path.parent_path();

            if (log_dir.empty() || std::filesystem::exists(log_dir)) {
                final_log_path = path;
                break;
            }

            std::error_code ec;
            if (std::filesystem::create_directories(log_dir, ec)) {
                final_log_path = path;
                break;
            }
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            final_log_path, max_size, max_files);
        file_sink->set_level(string_to_level(log_level));

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        logger_ = std::make_shared<spdlog::logger>("relaylb", sinks.begin(), sinks.end());

        logger_->set_level(string_to_level(log_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger_->flush_on(spdlog::level::info);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();
    }
}

void Logger::info(Component component, const std::string& message) {
    if (logger_) {
        logger_->info("[{}] {}", component_to_string(component), message);
    }
}

void Logger::warn(Component component, const std::string& message) {
    if (logger_) {
        logger_->warn("[{}] {}", component_to_string(component), message);
    }
}

void Logger::error(Component component, const std::string& message) {
    if (logger_) {
        logger_->error("[{}] {}", component_to_string(component), message);
    }
}

void Logger::debug(Component component, const std::string& message) {
    if (logger_) {
        logger_->debug("[{}] {}", component_to_string(component), message);
    }
}

void Logger::critical(Component component, const std::string& message) {
    if (logger_) {
        logger_->critical("[{}] {}", component_to_string(component), message);
        logger_->flush();
    } else {
        std::cerr << "[" << component_to_string(component) << "] " << message << std::endl;
    }
}

std::string Logger::component_to_string(Component component) {
    switch (component) {
        case Component::LB: return "LB";
        case Component::Config: return "Config";
        case Component::HealthCheck: return "HealthCheck";
        case Component::Proxy: return "Proxy";
        case Component::Router: return "Router";
        case Component::Room: return "Room";
        case Component::Liveness: return "Liveness";
        case Component::Admin: return "Admin";
        case Component::Signal: return "Signal";
        default: return "Unknown";
    }
}

spdlog::level::level_enum Logger::string_to_level(const std::string& level) {
    if (level == "DEBUG") return spdlog::level::debug;
    if (level == "INFO") return spdlog::level::info;
    if (level == "WARN") return spdlog::level::warn;
    if (level == "ERROR") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace relaylb
