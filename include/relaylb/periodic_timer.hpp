#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>

namespace relaylb {

// Fixed-interval tick on the io_context. The first tick fires one interval
// after start().
class PeriodicTimer {
public:
    PeriodicTimer(boost::asio::io_context& ioc, std::chrono::steady_clock::duration interval,
                  std::function<void()> on_tick);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

private:
    void schedule();

    boost::asio::steady_timer timer_;
    std::chrono::steady_clock::duration interval_;
    std::function<void()> on_tick_;
    bool running_ = false;
};

} // namespace relaylb
