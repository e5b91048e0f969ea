#include "relaylb/routing_policy.hpp"

namespace relaylb {

std::expected<BackendServer*, std::string> LeastConnectionsPolicy::select(
    const std::vector<BackendServer*>& backends) {
    if (backends.empty()) {
        return std::unexpected("No healthy backends available");
    }

    BackendServer* best = backends.front();
    for (auto* backend : backends) {
        if (backend->connections < best->connections) {
            best = backend;
        }
    }
    return best;
}

std::expected<BackendServer*, std::string> WeightedRandomPolicy::select(
    const std::vector<BackendServer*>& backends) {
    if (backends.empty()) {
        return std::unexpected("No healthy backends available");
    }

    double total_weight = 0.0;
    for (auto* backend : backends) {
        total_weight += backend->weight;
    }
    if (total_weight <= 0.0) {
        return backends.front();
    }

    std::uniform_real_distribution<double> dist(0.0, total_weight);
    double remainder = dist(rng_);

    for (auto* backend : backends) {
        remainder -= backend->weight;
        if (remainder <= 0.0) {
            return backend;
        }
    }

    return backends.front();
}

std::expected<BackendServer*, std::string> ResponseTimePolicy::select(
    const std::vector<BackendServer*>& backends) {
    if (backends.empty()) {
        return std::unexpected("No healthy backends available");
    }

    BackendServer* fastest = backends.front();
    for (auto* backend : backends) {
        if (backend->response_time_ema < fastest->response_time_ema) {
            fastest = backend;
        }
    }
    return fastest;
}

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    if (name == "round-robin") return Algorithm::RoundRobin;
    if (name == "least-connections") return Algorithm::LeastConnections;
    if (name == "weighted-random" || name == "weighted") return Algorithm::WeightedRandom;
    if (name == "response-time") return Algorithm::ResponseTime;
    return std::nullopt;
}

std::string algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::RoundRobin: return "round-robin";
        case Algorithm::LeastConnections: return "least-connections";
        case Algorithm::WeightedRandom: return "weighted-random";
        case Algorithm::ResponseTime: return "response-time";
    }
    return "round-robin";
}

AnyRoutingPolicy make_policy(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::LeastConnections: return LeastConnectionsPolicy{};
        case Algorithm::WeightedRandom: return WeightedRandomPolicy{};
        case Algorithm::ResponseTime: return ResponseTimePolicy{};
        case Algorithm::RoundRobin: break;
    }
    return RoundRobinPolicy{};
}

} // namespace relaylb
