#pragma once

#include "relaylb/liveness_tracker.hpp"
#include "relaylb/signaling_service.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace relaylb {

// Accepts HTTP on one port: GET /health is answered directly, WebSocket
// upgrades become signaling sessions.
class SignalServer : public std::enable_shared_from_this<SignalServer> {
public:
    SignalServer(boost::asio::io_context& ioc,
                 const boost::asio::ip::tcp::endpoint& endpoint,
                 SignalingService& service,
                 LivenessTracker& liveness,
                 size_t max_message_size,
                 std::vector<std::string> trusted_proxies = {"127.0.0.1", "::1"});

    void run();
    uint16_t port() const;

    // Stops accepting and starts a closing handshake with every client
    void stop();

    void upgrade(boost::asio::ip::tcp::socket socket,
                 boost::beast::http::request<boost::beast::http::string_body> req);

    boost::beast::http::response<boost::beast::http::string_body>
    handle_http(const boost::beast::http::request<boost::beast::http::string_body>& req) const;

private:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    SignalingService& service_;
    LivenessTracker& liveness_;
    size_t max_message_size_;
    std::vector<std::string> trusted_proxies_;
    uint64_t next_connection_id_ = 1;
};

// Address a session is known by: the first X-Forwarded-For entry when the
// peer is a trusted proxy, the peer address otherwise.
std::string resolve_client_address(const std::string& peer_address,
                                   std::string_view forwarded_for,
                                   const std::vector<std::string>& trusted_proxies);

} // namespace relaylb
