#include "relaylb/liveness_tracker.hpp"
#include "relaylb/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace relaylb {

LivenessTracker::LivenessTracker(boost::asio::io_context& ioc,
                                 std::chrono::steady_clock::duration interval)
    : timer_(ioc, interval, [this]() { sweep(); }) {}

void LivenessTracker::track(const std::shared_ptr<ConnectionHandle>& conn) {
    conn->set_alive(true);
    connections_[conn->id()] = conn;
}

void LivenessTracker::untrack(const ConnectionHandle& conn) {
    connections_.erase(conn.id());
}

void LivenessTracker::start() {
    timer_.start();
    Logger::info(Logger::Component::Liveness, "Heartbeat started");
}

void LivenessTracker::stop() {
    timer_.stop();
}

size_t LivenessTracker::sweep() {
    // terminate() can re-enter untrack() through the close path, so work
    // on a snapshot.
    std::vector<std::shared_ptr<ConnectionHandle>> live;
    live.reserve(connections_.size());
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (auto conn = it->second.lock()) {
            live.push_back(std::move(conn));
            ++it;
        } else {
            it = connections_.erase(it);
        }
    }

    size_t terminated = 0;
    for (const auto& conn : live) {
        if (!conn->is_alive()) {
            Logger::info(Logger::Component::Liveness,
                fmt::format("Terminating unresponsive client {}", conn->remote_address()));
            connections_.erase(conn->id());
            conn->terminate();
            ++terminated;
            continue;
        }

        conn->set_alive(false);
        conn->ping();
    }

    if (terminated > 0) {
        Logger::debug(Logger::Component::Liveness,
            fmt::format("Heartbeat sweep terminated {} of {} connection(s)", terminated, live.size()));
    }
    return terminated;
}

} // namespace relaylb
