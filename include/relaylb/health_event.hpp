#pragma once

#include <string>
#include <cstddef>

namespace relaylb {

struct HealthEvent {
    enum class Kind {
        Recovered,
        Degraded
    };

    Kind kind;
    std::string backend_id;
    std::string detail;
};

struct HealthCycleSummary {
    size_t healthy;
    size_t total;
};

} // namespace relaylb
