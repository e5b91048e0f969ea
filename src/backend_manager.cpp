#include "relaylb/backend_manager.hpp"
#include <algorithm>

namespace relaylb {

BackendManager::BackendManager(const std::vector<BackendConfig>& backend_configs) {
    backends_.reserve(backend_configs.size());
    for (const auto& config : backend_configs) {
        // Duplicates are rejected by ConfigLoader before we get here
        (void)add_backend(config);
    }
}

std::expected<BackendServer*, std::string> BackendManager::add_backend(const BackendConfig& config) {
    if (config.id.empty()) {
        return std::unexpected("Backend id must not be empty");
    }
    if (config.weight <= 0) {
        return std::unexpected("Backend weight must be positive");
    }
    if (find(config.id) != nullptr) {
        return std::unexpected("Backend '" + config.id + "' already exists");
    }

    backends_.push_back(std::make_unique<BackendServer>(
        config.id, config.host, config.port, config.weight));
    return backends_.back().get();
}

bool BackendManager::remove_backend(const std::string& id) {
    auto it = std::find_if(backends_.begin(), backends_.end(),
        [&id](const auto& backend) { return backend->id == id; });
    if (it == backends_.end()) {
        return false;
    }
    backends_.erase(it);
    return true;
}

BackendServer* BackendManager::find(const std::string& id) const {
    for (const auto& backend : backends_) {
        if (backend->id == id) {
            return backend.get();
        }
    }
    return nullptr;
}

std::vector<BackendServer*> BackendManager::get_all_backends() const {
    std::vector<BackendServer*> result;
    result.reserve(backends_.size());
    for (const auto& backend : backends_) {
        result.push_back(backend.get());
    }
    return result;
}

std::vector<BackendServer*> BackendManager::get_routable_backends() const {
    std::vector<BackendServer*> result;
    for (const auto& backend : backends_) {
        if (backend->routable()) {
            result.push_back(backend.get());
        }
    }
    return result;
}

size_t BackendManager::backend_count() const {
    return backends_.size();
}

size_t BackendManager::healthy_count() const {
    return static_cast<size_t>(std::count_if(backends_.begin(), backends_.end(),
        [](const auto& backend) { return backend->healthy; }));
}

bool BackendManager::drain(const std::string& id) {
    auto* backend = find(id);
    if (backend == nullptr) {
        return false;
    }
    backend->draining = true;
    return true;
}

std::expected<void, std::string> BackendManager::update(const std::string& id,
                                                        const BackendUpdate& update) {
    auto* backend = find(id);
    if (backend == nullptr) {
        return std::unexpected("Backend '" + id + "' not found");
    }
    if (update.weight && *update.weight <= 0) {
        return std::unexpected("Backend weight must be positive");
    }
    if (update.host && update.host->empty()) {
        return std::unexpected("Backend host must not be empty");
    }

    if (update.host) backend->host = *update.host;
    if (update.port) backend->port = *update.port;
    if (update.weight) backend->weight = *update.weight;
    return {};
}

void BackendManager::record_request_start(BackendServer& backend) {
    ++backend.connections;
    ++backend.total_connections;
}

HealthTransition BackendManager::record_request_complete(BackendServer& backend, double elapsed_ms,
                                                         const std::optional<std::string>& error) {
    if (backend.connections > 0) {
        --backend.connections;
    }
    backend.response_time_ema = (backend.response_time_ema + elapsed_ms) / 2.0;

    if (!error) {
        return HealthTransition::None;
    }

    ++backend.error_count;
    backend.last_error = BackendError{*error, std::chrono::system_clock::now()};

    if (backend.error_count > kMaxBackendErrors && backend.healthy) {
        backend.healthy = false;
        return HealthTransition::Degraded;
    }
    return HealthTransition::None;
}

HealthTransition BackendManager::record_probe_success(BackendServer& backend, double elapsed_ms) {
    bool was_healthy = backend.healthy;

    if (backend.error_count > 0) {
        --backend.error_count;
    }
    backend.response_time_ema = elapsed_ms;
    backend.last_health_check = std::chrono::system_clock::now();

    // A backend still over the error threshold stays out until enough
    // successful probes have worked the count back down.
    backend.healthy = backend.error_count <= kMaxBackendErrors;

    if (!was_healthy && backend.healthy) {
        return HealthTransition::Recovered;
    }
    return HealthTransition::None;
}

HealthTransition BackendManager::record_probe_failure(BackendServer& backend, const std::string& error) {
    bool was_healthy = backend.healthy;

    backend.healthy = false;
    ++backend.error_count;
    auto now = std::chrono::system_clock::now();
    backend.last_error = BackendError{error, now};
    backend.last_health_check = now;

    return was_healthy ? HealthTransition::Degraded : HealthTransition::None;
}

} // namespace relaylb
