#include "relaylb/load_balancer.hpp"
#include "relaylb/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <ctime>

using json = nlohmann::json;

namespace relaylb {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string iso8601_now() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

LoadBalancer::LoadBalancer(std::shared_ptr<BackendManager> backend_manager, Algorithm algorithm,
                           bool sticky_sessions, MetricsSink* metrics)
    : backend_manager_(std::move(backend_manager)),
      algorithm_(algorithm),
      policy_(make_policy(algorithm)),
      sticky_sessions_(sticky_sessions),
      metrics_(metrics) {}

std::expected<void, std::string> LoadBalancer::add_backend(const BackendConfig& config) {
    auto result = backend_manager_->add_backend(config);
    if (!result) {
        return std::unexpected(result.error());
    }
    Logger::info(Logger::Component::LB,
        fmt::format("Added server: {} ({}:{})", config.id, config.host, config.port));
    return {};
}

bool LoadBalancer::remove_backend(const std::string& id) {
    if (!backend_manager_->remove_backend(id)) {
        return false;
    }
    Logger::info(Logger::Component::LB, fmt::format("Removed server: {}", id));
    return true;
}

bool LoadBalancer::drain_backend(const std::string& id) {
    if (!backend_manager_->drain(id)) {
        return false;
    }
    Logger::info(Logger::Component::LB, fmt::format("Draining server {}", id));
    return true;
}

std::expected<void, std::string> LoadBalancer::update_backend(const std::string& id,
                                                              const BackendUpdate& update) {
    auto result = backend_manager_->update(id, update);
    if (result) {
        Logger::info(Logger::Component::LB, fmt::format("Updated server {} configuration", id));
    }
    return result;
}

std::optional<std::string> LoadBalancer::affinity_key(const RouteContext& ctx) const {
    // Both peers of a room must reach the same instance, so the room id
    // pins routing even when cookie stickiness is off.
    if (ctx.room_id) {
        return "room:" + *ctx.room_id;
    }
    if (sticky_sessions_ && ctx.session_id) {
        return *ctx.session_id;
    }
    return std::nullopt;
}

std::expected<BackendServer*, std::string> LoadBalancer::route(const RouteContext& ctx) {
    auto key = affinity_key(ctx);
    auto now = std::chrono::steady_clock::now();

    if (key) {
        auto it = sticky_table_.find(*key);
        if (it != sticky_table_.end()) {
            // Draining backends keep their existing mappings
            auto* backend = backend_manager_->find(it->second.backend_id);
            if (backend != nullptr && backend->healthy) {
                it->second.last_used = now;
                return backend;
            }
        }
    }

    auto routable = backend_manager_->get_routable_backends();
    if (routable.empty()) {
        return std::unexpected("No healthy backends available");
    }

    auto selected = std::visit([&routable](auto& policy) { return policy.select(routable); }, policy_);
    if (!selected) {
        return selected;
    }

    if (key) {
        sticky_table_[*key] = StickySessionEntry{(*selected)->id, now};
    }
    return selected;
}

void LoadBalancer::on_request_start(BackendServer& backend) {
    backend_manager_->record_request_start(backend);
}

void LoadBalancer::on_request_complete(const std::string& backend_id, double elapsed_ms,
                                       const std::optional<std::string>& error) {
    auto* backend = backend_manager_->find(backend_id);
    if (backend == nullptr) {
        Logger::debug(Logger::Component::LB,
            fmt::format("Completion for removed server {} ignored", backend_id));
        return;
    }

    auto transition = backend_manager_->record_request_complete(*backend, elapsed_ms, error);
    if (transition == HealthTransition::Degraded) {
        Logger::warn(Logger::Component::LB,
            fmt::format("Server {} marked as unhealthy due to errors", backend_id));
    }

    if (metrics_ != nullptr) {
        metrics_->on_request_complete(*backend, elapsed_ms, error.has_value());
    }
}

void LoadBalancer::on_health_event(const HealthEvent& event) {
    if (event.kind == HealthEvent::Kind::Recovered) {
        Logger::info(Logger::Component::LB,
            fmt::format("Server {} is back online", event.backend_id));
    } else {
        size_t dropped = std::erase_if(sticky_table_, [&event](const auto& entry) {
            return entry.second.backend_id == event.backend_id;
        });
        Logger::warn(Logger::Component::LB,
            fmt::format("Server {} degraded ({}), dropped {} sticky session(s)",
                event.backend_id, event.detail, dropped));
    }

    if (metrics_ != nullptr) {
        metrics_->on_health_event(event);
    }
}

void LoadBalancer::on_health_cycle(const HealthCycleSummary& summary) {
    if (summary.healthy == 0 && summary.total > 0) {
        Logger::error(Logger::Component::LB, "All backend servers are currently unavailable");
    }
    if (metrics_ != nullptr) {
        metrics_->on_health_cycle(summary);
    }
}

size_t LoadBalancer::prune_sticky_sessions(std::chrono::steady_clock::time_point now,
                                           std::chrono::seconds ttl) {
    return std::erase_if(sticky_table_, [&](const auto& entry) {
        return backend_manager_->find(entry.second.backend_id) == nullptr ||
               now - entry.second.last_used > ttl;
    });
}

void LoadBalancer::clear_sticky_sessions() {
    sticky_table_.clear();
    Logger::info(Logger::Component::LB, "Cleared all sticky sessions");
}

size_t LoadBalancer::sticky_session_count() const {
    return sticky_table_.size();
}

json LoadBalancer::get_stats() const {
    auto backends = backend_manager_->get_all_backends();

    uint64_t total_connections = 0;
    uint64_t active_connections = 0;
    uint64_t total_errors = 0;
    double response_time_sum = 0.0;
    size_t healthy = 0;

    json servers = json::array();
    for (const auto* backend : backends) {
        total_connections += backend->total_connections;
        active_connections += backend->connections;
        total_errors += backend->error_count;
        response_time_sum += backend->response_time_ema;
        if (backend->healthy) {
            ++healthy;
        }

        json server;
        server["id"] = backend->id;
        server["host"] = backend->host;
        server["port"] = backend->port;
        server["weight"] = backend->weight;
        server["healthy"] = backend->healthy;
        server["draining"] = backend->draining;
        server["connections"] = backend->connections;
        server["totalConnections"] = backend->total_connections;
        server["errors"] = backend->error_count;
        server["responseTime"] = backend->response_time_ema;
        server["lastHealthCheck"] = backend->last_health_check
            ? to_epoch_ms(*backend->last_health_check) : 0;
        if (backend->last_error) {
            server["lastError"] = {
                {"message", backend->last_error->message},
                {"timestamp", to_epoch_ms(backend->last_error->timestamp)}
            };
        } else {
            server["lastError"] = nullptr;
        }
        servers.push_back(std::move(server));
    }

    json stats;
    stats["totalServers"] = backends.size();
    stats["healthyServers"] = healthy;
    stats["totalConnections"] = total_connections;
    stats["activeConnections"] = active_connections;
    stats["totalErrors"] = total_errors;
    stats["averageResponseTime"] = backends.empty()
        ? 0.0 : response_time_sum / static_cast<double>(backends.size());
    stats["algorithm"] = algorithm_name(algorithm_);
    stats["stickySessionsEnabled"] = sticky_sessions_;
    stats["activeSessions"] = sticky_table_.size();
    stats["servers"] = std::move(servers);
    return stats;
}

std::string make_unavailable_body(const std::string& message) {
    nlohmann::ordered_json body;
    body["error"] = "Service Unavailable";
    body["message"] = message;
    body["timestamp"] = iso8601_now();
    return body.dump();
}

} // namespace relaylb
