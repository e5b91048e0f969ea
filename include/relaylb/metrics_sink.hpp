#pragma once

#include "relaylb/backend_manager.hpp"
#include "relaylb/health_event.hpp"

namespace relaylb {

// Consumer of balancer counters and health notifications. Implementations
// live outside this project (exporters, dashboards); the balancer only
// calls through this interface.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void on_request_complete(const BackendServer& backend, double elapsed_ms,
                                     bool failed) = 0;
    virtual void on_health_event(const HealthEvent& event) = 0;
    virtual void on_health_cycle(const HealthCycleSummary& summary) = 0;
};

} // namespace relaylb
