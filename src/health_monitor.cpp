#include "relaylb/health_monitor.hpp"
#include "relaylb/logger.hpp"
#include <boost/asio/post.hpp>
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace relaylb {

HttpHealthProbe::HttpHealthProbe(std::string path, int timeout_seconds)
    : path_(std::move(path)), timeout_seconds_(timeout_seconds) {}

ProbeResult HttpHealthProbe::check(const ProbeTarget& target) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    };

    try {
        httplib::Client client(target.host, target.port);
        client.set_connection_timeout(timeout_seconds_, 0);
        client.set_read_timeout(timeout_seconds_, 0);
        client.set_write_timeout(timeout_seconds_, 0);
        client.set_default_headers({{"User-Agent", "relaylb-HealthCheck"}});

        auto res = client.Get(path_);
        double elapsed_ms = elapsed();

        if (!res) {
            return {false, elapsed_ms, "Health check failed: " + httplib::to_string(res.error())};
        }
        if (elapsed_ms > timeout_seconds_ * 1000.0) {
            return {false, elapsed_ms, "Health check timed out"};
        }
        if (res->status < 200 || res->status >= 300) {
            return {false, elapsed_ms,
                    fmt::format("Health check failed with status: {}", res->status)};
        }
        return {true, elapsed_ms, {}};

    } catch (const std::exception& e) {
        return {false, elapsed(), std::string("Health check exception: ") + e.what()};
    }
}

HealthMonitor::HealthMonitor(boost::asio::io_context& ioc,
                             std::shared_ptr<BackendManager> backend_manager,
                             std::shared_ptr<HealthProbe> probe,
                             const HealthCheckConfig& config)
    : ioc_(ioc),
      backend_manager_(std::move(backend_manager)),
      probe_(std::move(probe)),
      config_(config),
      timer_(ioc, std::chrono::seconds(config.interval_seconds), [this]() {
          if (!run_cycle()) {
              Logger::debug(Logger::Component::HealthCheck,
                  "Previous health check cycle still running, skipping tick");
          }
      }),
      deadline_(ioc) {}

HealthMonitor::~HealthMonitor() {
    stop();
    alive_.reset();
    deadline_.cancel();
    for (auto& [cycle, batch] : batches_) {
        batch.pool->join();
    }
}

void HealthMonitor::subscribe(EventListener listener) {
    listeners_.push_back(std::move(listener));
}

void HealthMonitor::subscribe_cycle(CycleListener listener) {
    cycle_listeners_.push_back(std::move(listener));
}

void HealthMonitor::start() {
    timer_.start();
    Logger::info(Logger::Component::HealthCheck,
        fmt::format("Health checks started (interval: {}s, timeout: {}s)",
            config_.interval_seconds, config_.timeout_seconds));
}

void HealthMonitor::stop() {
    if (timer_.running()) {
        timer_.stop();
        Logger::info(Logger::Component::HealthCheck, "Health checks stopped");
    }
}

bool HealthMonitor::run_cycle(std::function<void()> on_complete) {
    if (in_flight_) {
        return false;
    }

    Logger::debug(Logger::Component::HealthCheck, "Starting health check cycle");

    std::vector<ProbeTarget> targets;
    for (const auto* backend : backend_manager_->get_all_backends()) {
        targets.push_back({backend->id, backend->host, backend->port});
    }

    in_flight_ = true;
    ++cycle_;
    cycle_started_ = std::chrono::steady_clock::now();
    on_cycle_complete_ = std::move(on_complete);
    awaiting_.clear();

    if (targets.empty()) {
        finish_cycle();
        return true;
    }

    work_guard_.emplace(boost::asio::make_work_guard(ioc_));

    // One worker per backend, so a stalled probe never holds up the others
    auto& batch = batches_[cycle_];
    batch.pool = std::make_unique<boost::asio::thread_pool>(targets.size());
    batch.outstanding = targets.size();

    std::weak_ptr<bool> alive = alive_;

    deadline_.expires_after(std::chrono::seconds(config_.timeout_seconds));
    deadline_.async_wait([this, alive, cycle = cycle_](const boost::system::error_code& ec) {
        if (ec || alive.expired()) {
            return;
        }
        if (in_flight_ && cycle == cycle_) {
            expire_cycle();
        }
    });

    for (auto& target : targets) {
        awaiting_.emplace(target.backend_id, target);
        boost::asio::post(*batch.pool,
            [this, &ioc = ioc_, probe = probe_, target, alive, cycle = cycle_]() {
                ProbeResult result = probe->check(target);
                boost::asio::post(ioc, [this, target, result, alive, cycle]() {
                    if (alive.expired()) {
                        return;
                    }
                    on_probe_result(cycle, target, result);
                });
            });
    }
    return true;
}

void HealthMonitor::on_probe_result(uint64_t cycle, const ProbeTarget& target,
                                    const ProbeResult& result) {
    bool current = in_flight_ && cycle == cycle_ && awaiting_.erase(target.backend_id) > 0;
    if (current) {
        apply_result(target, result);
    } else {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Late health check result for {} dropped", target.backend_id));
    }

    auto batch = batches_.find(cycle);
    if (batch != batches_.end() && --batch->second.outstanding == 0) {
        // The last worker is returning from this very post; join is brief
        batch->second.pool->join();
        batches_.erase(batch);
    }

    if (current && awaiting_.empty()) {
        finish_cycle();
    }
}

void HealthMonitor::expire_cycle() {
    double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - cycle_started_).count();

    auto expired = std::move(awaiting_);
    awaiting_.clear();
    for (const auto& [id, target] : expired) {
        apply_result(target, {false, elapsed_ms, "Health check timed out"});
    }
    finish_cycle();
}

void HealthMonitor::apply_result(const ProbeTarget& target, const ProbeResult& result) {
    auto* backend = backend_manager_->find(target.backend_id);
    if (backend == nullptr) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Backend {} removed during probe, result ignored", target.backend_id));
        return;
    }

    HealthTransition transition;
    if (result.healthy) {
        transition = backend_manager_->record_probe_success(*backend, result.elapsed_ms);
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Backend {}: HEALTHY ({:.0f}ms)", backend->id, result.elapsed_ms));
    } else {
        transition = backend_manager_->record_probe_failure(*backend, result.error);
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("Backend {}: UNHEALTHY ({}, {:.0f}ms)",
                backend->id, result.error, result.elapsed_ms));
    }

    if (transition == HealthTransition::None) {
        return;
    }

    HealthEvent event;
    event.backend_id = backend->id;
    if (transition == HealthTransition::Recovered) {
        event.kind = HealthEvent::Kind::Recovered;
        event.detail = "probe succeeded";
        Logger::info(Logger::Component::HealthCheck,
            fmt::format("Backend {}: state changed UNHEALTHY -> HEALTHY", backend->id));
    } else {
        event.kind = HealthEvent::Kind::Degraded;
        event.detail = result.error;
        Logger::warn(Logger::Component::HealthCheck,
            fmt::format("Backend {}: state changed HEALTHY -> UNHEALTHY ({})",
                backend->id, result.error));
    }

    for (const auto& listener : listeners_) {
        listener(event);
    }
}

void HealthMonitor::finish_cycle() {
    HealthCycleSummary summary{backend_manager_->healthy_count(),
                               backend_manager_->backend_count()};

    Logger::info(Logger::Component::HealthCheck,
        fmt::format("Health check complete: {}/{} servers healthy",
            summary.healthy, summary.total));

    for (const auto& listener : cycle_listeners_) {
        listener(summary);
    }

    in_flight_ = false;
    deadline_.cancel();
    work_guard_.reset();

    if (on_cycle_complete_) {
        auto done = std::move(on_cycle_complete_);
        on_cycle_complete_ = nullptr;
        done();
    }
}

} // namespace relaylb
