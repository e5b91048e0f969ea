#pragma once

#include "relaylb/config_loader.hpp"
#include "relaylb/load_balancer.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace relaylb {

struct AdminResponse {
    int status;
    nlohmann::json body;
};

// Operational surface of the balancer. Must be called on the scheduling
// context; AdminServer takes care of that for HTTP callers.
class AdminApi {
public:
    explicit AdminApi(LoadBalancer& load_balancer);

    AdminResponse get_stats() const;
    AdminResponse add_server(const std::string& body);
    AdminResponse update_server(const std::string& id, const std::string& body);
    AdminResponse remove_server(const std::string& id);
    AdminResponse drain_server(const std::string& id);
    AdminResponse clear_sticky_sessions();

private:
    LoadBalancer& load_balancer_;
};

class AdminServer {
public:
    AdminServer(boost::asio::io_context& ioc, AdminApi& api, const AdminConfig& config);
    ~AdminServer();

    void start();
    void stop();

private:
    // Runs fn on the io_context and waits for its result
    template<typename Fn>
    std::optional<AdminResponse> on_context(Fn fn) {
        auto task = std::make_shared<std::packaged_task<AdminResponse()>>(std::move(fn));
        auto future = task->get_future();
        boost::asio::post(ioc_, [task]() { (*task)(); });
        if (future.wait_for(kContextTimeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future.get();
    }

    void register_routes();

    static constexpr std::chrono::seconds kContextTimeout{5};

    boost::asio::io_context& ioc_;
    AdminApi& api_;
    AdminConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

} // namespace relaylb
