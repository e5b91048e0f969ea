#pragma once

#include "relaylb/load_balancer.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace relaylb {

inline constexpr const char* kLoadBalancerHeader = "relaylb";

// Front door of the balancer. Each accepted connection is routed once and
// proxied to the chosen backend; WebSocket upgrades become a byte tunnel
// that lives until either side hangs up.
class ProxyServer : public std::enable_shared_from_this<ProxyServer> {
public:
    ProxyServer(boost::asio::io_context& ioc,
                const boost::asio::ip::tcp::endpoint& endpoint,
                LoadBalancer& load_balancer,
                std::chrono::seconds timeout);

    void run();
    void stop();
    uint16_t port() const;

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    LoadBalancer& load_balancer_;
    std::chrono::seconds timeout_;
};

} // namespace relaylb
