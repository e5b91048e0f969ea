#pragma once

#include "relaylb/backend_manager.hpp"
#include <vector>
#include <expected>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>

namespace relaylb {

template<typename T>
concept RoutingPolicy = requires(T policy, const std::vector<BackendServer*>& backends) {
    { policy.select(backends) } -> std::same_as<std::expected<BackendServer*, std::string>>;
};

// Cycles over whatever set it is handed, so the index follows the pool as
// backends come and go.
class RoundRobinPolicy {
public:
    std::expected<BackendServer*, std::string> select(const std::vector<BackendServer*>& backends) {
        if (backends.empty()) {
            return std::unexpected("No healthy backends available");
        }

        BackendServer* backend = backends[index_ % backends.size()];
        index_ = (index_ + 1) % backends.size();
        return backend;
    }

private:
    size_t index_ = 0;
};

class LeastConnectionsPolicy {
public:
    std::expected<BackendServer*, std::string> select(const std::vector<BackendServer*>& backends);
};

class WeightedRandomPolicy {
public:
    WeightedRandomPolicy() : rng_(std::random_device{}()) {}
    explicit WeightedRandomPolicy(uint32_t seed) : rng_(seed) {}

    std::expected<BackendServer*, std::string> select(const std::vector<BackendServer*>& backends);

private:
    std::mt19937 rng_;
};

class ResponseTimePolicy {
public:
    std::expected<BackendServer*, std::string> select(const std::vector<BackendServer*>& backends);
};

static_assert(RoutingPolicy<RoundRobinPolicy>);
static_assert(RoutingPolicy<LeastConnectionsPolicy>);
static_assert(RoutingPolicy<WeightedRandomPolicy>);
static_assert(RoutingPolicy<ResponseTimePolicy>);

enum class Algorithm {
    RoundRobin,
    LeastConnections,
    WeightedRandom,
    ResponseTime
};

using AnyRoutingPolicy = std::variant<RoundRobinPolicy, LeastConnectionsPolicy,
                                      WeightedRandomPolicy, ResponseTimePolicy>;

std::optional<Algorithm> parse_algorithm(std::string_view name);
std::string algorithm_name(Algorithm algorithm);
AnyRoutingPolicy make_policy(Algorithm algorithm);

} // namespace relaylb
