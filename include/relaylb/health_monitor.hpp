#pragma once

#include "relaylb/backend_manager.hpp"
#include "relaylb/config_loader.hpp"
#include "relaylb/health_event.hpp"
#include "relaylb/periodic_timer.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relaylb {

struct ProbeTarget {
    std::string backend_id;
    std::string host;
    uint16_t port;
};

struct ProbeResult {
    bool healthy;
    double elapsed_ms;
    std::string error;
};

// Blocking probe; HealthMonitor runs it off the scheduling context, one
// worker thread per backend.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual ProbeResult check(const ProbeTarget& target) = 0;
};

class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(std::string path, int timeout_seconds);

    ProbeResult check(const ProbeTarget& target) override;

private:
    std::string path_;
    int timeout_seconds_;
};

class HealthMonitor {
public:
    using EventListener = std::function<void(const HealthEvent&)>;
    using CycleListener = std::function<void(const HealthCycleSummary&)>;

    HealthMonitor(boost::asio::io_context& ioc,
                  std::shared_ptr<BackendManager> backend_manager,
                  std::shared_ptr<HealthProbe> probe,
                  const HealthCheckConfig& config);

    ~HealthMonitor();

    void subscribe(EventListener listener);
    void subscribe_cycle(CycleListener listener);

    void start();
    void stop();

    // Probes every backend once, all at the same time. The cycle ends when
    // every result is in or when timeout_seconds runs out; probes still
    // running then count as failed and their late results are dropped.
    // Returns false without doing anything if the previous cycle has not
    // settled yet.
    bool run_cycle(std::function<void()> on_complete = {});

    bool cycle_in_flight() const { return in_flight_; }

private:
    // Workers of one cycle. Kept until every probe it ran has returned,
    // which may be after the cycle itself ended.
    struct ProbeBatch {
        std::unique_ptr<boost::asio::thread_pool> pool;
        size_t outstanding = 0;
    };

    void on_probe_result(uint64_t cycle, const ProbeTarget& target, const ProbeResult& result);
    void expire_cycle();
    void apply_result(const ProbeTarget& target, const ProbeResult& result);
    void finish_cycle();

    boost::asio::io_context& ioc_;
    std::shared_ptr<BackendManager> backend_manager_;
    std::shared_ptr<HealthProbe> probe_;
    HealthCheckConfig config_;
    PeriodicTimer timer_;
    boost::asio::steady_timer deadline_;

    bool in_flight_ = false;
    uint64_t cycle_ = 0;
    std::chrono::steady_clock::time_point cycle_started_;
    std::unordered_map<std::string, ProbeTarget> awaiting_;
    std::unordered_map<uint64_t, ProbeBatch> batches_;
    std::function<void()> on_cycle_complete_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;

    // Expires with the monitor; results posted after that are discarded
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    std::vector<EventListener> listeners_;
    std::vector<CycleListener> cycle_listeners_;
};

} // namespace relaylb
