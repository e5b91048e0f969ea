#pragma once

#include <string>
#include <vector>
#include <expected>
#include <cstdint>

namespace relaylb {

struct BackendConfig {
    std::string id;
    std::string host;
    uint16_t port;
    int weight;
};

struct LoadBalancerConfig {
    std::string host;
    uint16_t port;
    std::string log_file;
    std::string log_level;
    std::string algorithm;
    bool sticky;
    int sticky_ttl_seconds;
    int cleanup_interval_seconds;
    int proxy_timeout_seconds;
};

struct HealthCheckConfig {
    int interval_seconds;
    int timeout_seconds;
    std::string path;
};

struct AdminConfig {
    bool enabled;
    std::string host;
    uint16_t port;
};

struct SignalingConfig {
    std::string host;
    size_t max_message_size;
    int heartbeat_interval_seconds;
    std::string log_level;
    // Peers whose X-Forwarded-For header is believed
    std::vector<std::string> trusted_proxies;
};

struct Config {
    LoadBalancerConfig load_balancer;
    std::vector<BackendConfig> backends;
    HealthCheckConfig health_check;
    AdminConfig admin;
    SignalingConfig signaling;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    // Exposed for the signaling instance, which runs without a config file
    // unless one is given on the command line.
    static Config defaults();

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace relaylb
