#pragma once

#include "relaylb/config_loader.hpp"
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include <expected>
#include <string>
#include <cstdint>

namespace relaylb {

// Errors past this count take a backend out of rotation
inline constexpr uint32_t kMaxBackendErrors = 10;

struct BackendError {
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

struct BackendServer {
    std::string id;
    std::string host;
    uint16_t port;
    int weight;

    bool healthy = true;
    bool draining = false;
    uint64_t connections = 0;
    uint64_t total_connections = 0;
    uint32_t error_count = 0;
    std::optional<BackendError> last_error;
    double response_time_ema = 0.0;
    std::optional<std::chrono::system_clock::time_point> last_health_check;

    BackendServer(std::string i, std::string h, uint16_t p, int w)
        : id(std::move(i)), host(std::move(h)), port(p), weight(w) {}

    bool routable() const { return healthy && !draining; }
};

// Partial update applied by the admin surface; unset fields are left alone.
struct BackendUpdate {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<int> weight;
};

enum class HealthTransition {
    None,
    Recovered,
    Degraded
};

// Registry of backends in registration order. Only the scheduling context
// touches it, so there is no locking.
class BackendManager {
public:
    BackendManager() = default;
    explicit BackendManager(const std::vector<BackendConfig>& backend_configs);

    BackendManager(const BackendManager&) = delete;
    BackendManager& operator=(const BackendManager&) = delete;

    std::expected<BackendServer*, std::string> add_backend(const BackendConfig& config);
    bool remove_backend(const std::string& id);
    BackendServer* find(const std::string& id) const;

    std::vector<BackendServer*> get_all_backends() const;

    // Healthy and not draining
    std::vector<BackendServer*> get_routable_backends() const;

    size_t backend_count() const;
    size_t healthy_count() const;

    bool drain(const std::string& id);
    std::expected<void, std::string> update(const std::string& id, const BackendUpdate& update);

    void record_request_start(BackendServer& backend);

    // Returns Degraded when this error pushed the backend over the threshold.
    HealthTransition record_request_complete(BackendServer& backend, double elapsed_ms,
                                             const std::optional<std::string>& error);

    HealthTransition record_probe_success(BackendServer& backend, double elapsed_ms);
    HealthTransition record_probe_failure(BackendServer& backend, const std::string& error);

private:
    std::vector<std::unique_ptr<BackendServer>> backends_;
};

} // namespace relaylb
