#pragma once

#include "relaylb/backend_manager.hpp"
#include "relaylb/health_event.hpp"
#include "relaylb/metrics_sink.hpp"
#include "relaylb/route_context.hpp"
#include "relaylb/routing_policy.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace relaylb {

struct StickySessionEntry {
    std::string backend_id;
    std::chrono::steady_clock::time_point last_used;
};

class LoadBalancer {
public:
    LoadBalancer(std::shared_ptr<BackendManager> backend_manager, Algorithm algorithm,
                 bool sticky_sessions, MetricsSink* metrics = nullptr);

    // Replaces the configured policy, e.g. to seed weighted-random in tests
    template<RoutingPolicy Policy>
    void set_policy(Policy policy) {
        policy_ = std::move(policy);
    }

    std::expected<void, std::string> add_backend(const BackendConfig& config);
    bool remove_backend(const std::string& id);
    bool drain_backend(const std::string& id);
    std::expected<void, std::string> update_backend(const std::string& id, const BackendUpdate& update);

    // Sticky/affinity lookup first, then the configured algorithm over the
    // healthy, non-draining set.
    std::expected<BackendServer*, std::string> route(const RouteContext& ctx);

    void on_request_start(BackendServer& backend);

    // Keyed by id: the backend may have been removed while the request was
    // in flight, in which case the completion is dropped.
    void on_request_complete(const std::string& backend_id, double elapsed_ms,
                             const std::optional<std::string>& error = std::nullopt);

    void on_health_event(const HealthEvent& event);
    void on_health_cycle(const HealthCycleSummary& summary);

    size_t prune_sticky_sessions(std::chrono::steady_clock::time_point now,
                                 std::chrono::seconds ttl);
    void clear_sticky_sessions();
    size_t sticky_session_count() const;

    nlohmann::json get_stats() const;

    Algorithm algorithm() const { return algorithm_; }
    bool sticky_sessions_enabled() const { return sticky_sessions_; }
    BackendManager& backends() { return *backend_manager_; }

private:
    std::optional<std::string> affinity_key(const RouteContext& ctx) const;

    std::shared_ptr<BackendManager> backend_manager_;
    Algorithm algorithm_;
    AnyRoutingPolicy policy_;
    bool sticky_sessions_;
    MetricsSink* metrics_;
    std::unordered_map<std::string, StickySessionEntry> sticky_table_;
};

// JSON body for 503 responses
std::string make_unavailable_body(const std::string& message);

} // namespace relaylb
