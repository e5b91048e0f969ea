#include "relaylb/config_loader.hpp"
#include "relaylb/routing_policy.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace relaylb {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    std::vector<std::string> search_paths = {
        config_path,
        "../" + config_path,
        "../../" + config_path
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear();
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

Config ConfigLoader::defaults() {
    Config config;
    config.load_balancer = {"0.0.0.0", 8080, "logs/relaylb.log", "INFO",
                            "round-robin", false, 3600, 300, 30};
    config.health_check = {30, 5, "/health"};
    config.admin = {true, "127.0.0.1", 9090};
    config.signaling = {"0.0.0.0", 64 * 1024, 30, "INFO", {"127.0.0.1", "::1"}};
    return config;
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config = defaults();

        if (!j.contains("load_balancer")) {
            return std::unexpected("Missing 'load_balancer' section");
        }
        auto& lb = j["load_balancer"];
        auto& lbc = config.load_balancer;
        lbc.host = lb.value("host", lbc.host);
        lbc.port = lb.value("port", lbc.port);
        lbc.log_file = lb.value("log_file", lbc.log_file);
        lbc.log_level = lb.value("log_level", lbc.log_level);
        lbc.algorithm = lb.value("algorithm", lbc.algorithm);
        lbc.sticky = lb.value("sticky", lbc.sticky);
        lbc.sticky_ttl_seconds = lb.value("sticky_ttl_seconds", lbc.sticky_ttl_seconds);
        lbc.cleanup_interval_seconds =
            lb.value("cleanup_interval_seconds", lbc.cleanup_interval_seconds);
        lbc.proxy_timeout_seconds = lb.value("proxy_timeout_seconds", lbc.proxy_timeout_seconds);

        if (!j.contains("backends")) {
            return std::unexpected("Missing 'backends' section");
        }
        for (const auto& backend : j["backends"]) {
            BackendConfig bc;
            bc.host = backend.value("host", "localhost");
            bc.port = backend.value("port", 52178);
            bc.id = backend.value("id", bc.host + ":" + std::to_string(bc.port));
            bc.weight = backend.value("weight", 1);
            config.backends.push_back(bc);
        }

        if (j.contains("health_check")) {
            auto& hc = j["health_check"];
            config.health_check.interval_seconds =
                hc.value("interval_seconds", config.health_check.interval_seconds);
            config.health_check.timeout_seconds =
                hc.value("timeout_seconds", config.health_check.timeout_seconds);
            config.health_check.path = hc.value("path", config.health_check.path);
        }

        if (j.contains("admin")) {
            auto& admin = j["admin"];
            config.admin.enabled = admin.value("enabled", config.admin.enabled);
            config.admin.host = admin.value("host", config.admin.host);
            config.admin.port = admin.value("port", config.admin.port);
        }

        if (j.contains("signaling")) {
            auto& sig = j["signaling"];
            config.signaling.host = sig.value("host", config.signaling.host);
            config.signaling.max_message_size =
                sig.value("max_message_size", config.signaling.max_message_size);
            config.signaling.heartbeat_interval_seconds =
                sig.value("heartbeat_interval_seconds", config.signaling.heartbeat_interval_seconds);
            config.signaling.log_level = sig.value("log_level", config.signaling.log_level);
            config.signaling.trusted_proxies =
                sig.value("trusted_proxies", config.signaling.trusted_proxies);
        }

        auto valid = validate_config(config);
        if (!valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.backends.empty()) {
        return std::unexpected("no backends configured");
    }

    std::unordered_set<std::string> ids;
    for (const auto& backend : config.backends) {
        if (!ids.insert(backend.id).second) {
            return std::unexpected("duplicate backend id '" + backend.id + "'");
        }
        if (backend.weight <= 0) {
            return std::unexpected("backend '" + backend.id + "' has non-positive weight");
        }
    }

    if (!parse_algorithm(config.load_balancer.algorithm)) {
        return std::unexpected("unknown algorithm '" + config.load_balancer.algorithm + "'");
    }

    if (config.health_check.interval_seconds <= 0) {
        return std::unexpected("health_check.interval_seconds must be positive");
    }

    if (config.health_check.timeout_seconds <= 0) {
        return std::unexpected("health_check.timeout_seconds must be positive");
    }

    if (config.load_balancer.cleanup_interval_seconds <= 0 ||
        config.load_balancer.sticky_ttl_seconds <= 0 ||
        config.load_balancer.proxy_timeout_seconds <= 0) {
        return std::unexpected("load_balancer timers must be positive");
    }

    if (config.signaling.heartbeat_interval_seconds <= 0) {
        return std::unexpected("signaling.heartbeat_interval_seconds must be positive");
    }

    return {};
}

} // namespace relaylb
