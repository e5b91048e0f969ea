#include "relaylb/periodic_timer.hpp"

namespace relaylb {

PeriodicTimer::PeriodicTimer(boost::asio::io_context& ioc,
                             std::chrono::steady_clock::duration interval,
                             std::function<void()> on_tick)
    : timer_(ioc), interval_(interval), on_tick_(std::move(on_tick)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

void PeriodicTimer::start() {
    if (running_) {
        return;
    }
    running_ = true;
    schedule();
}

void PeriodicTimer::stop() {
    running_ = false;
    timer_.cancel();
}

void PeriodicTimer::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        // Check ec before touching members: a cancelled wait may complete
        // after this timer is gone.
        if (ec) {
            return;
        }
        if (!running_) {
            return;
        }
        on_tick_();
        if (running_) {
            schedule();
        }
    });
}

} // namespace relaylb
