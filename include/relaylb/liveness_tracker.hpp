#pragma once

#include "relaylb/connection.hpp"
#include "relaylb/periodic_timer.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace relaylb {

// Ping/pong heartbeat. A connection that has not answered the ping from the
// previous sweep is terminated on the next one.
class LivenessTracker {
public:
    LivenessTracker(boost::asio::io_context& ioc, std::chrono::steady_clock::duration interval);

    void track(const std::shared_ptr<ConnectionHandle>& conn);
    void untrack(const ConnectionHandle& conn);

    void start();
    void stop();

    // One heartbeat pass; returns how many connections were terminated
    size_t sweep();

    size_t tracked_count() const { return connections_.size(); }

private:
    PeriodicTimer timer_;
    std::unordered_map<uint64_t, std::weak_ptr<ConnectionHandle>> connections_;
};

} // namespace relaylb
