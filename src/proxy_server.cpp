#include "relaylb/proxy_server.hpp"
#include "relaylb/logger.hpp"
#include "relaylb/route_context.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace relaylb {

namespace {

constexpr std::uint64_t kMaxRequestBody = 8 * 1024 * 1024;
constexpr std::uint64_t kMaxResponseBody = 64 * 1024 * 1024;
constexpr std::size_t kTunnelBufferSize = 16 * 1024;

std::string endpoint_address(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

class ProxySession : public std::enable_shared_from_this<ProxySession> {
public:
    ProxySession(tcp::socket&& socket, net::io_context& ioc, LoadBalancer& load_balancer,
                 std::chrono::seconds timeout)
        : client_(std::move(socket)),
          backend_(ioc),
          resolver_(ioc),
          load_balancer_(load_balancer),
          timeout_(timeout) {}

    void run() {
        remote_address_ = endpoint_address(client_.socket());
        net::dispatch(client_.get_executor(),
            beast::bind_front_handler(&ProxySession::do_read_request, shared_from_this()));
    }

private:
    void do_read_request() {
        request_parser_.emplace();
        request_parser_->body_limit(kMaxRequestBody);
        client_.expires_after(timeout_);
        http::async_read(client_, client_buffer_, *request_parser_,
            beast::bind_front_handler(&ProxySession::on_request, shared_from_this()));
    }

    void on_request(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            close_all();
            return;
        }
        if (ec) {
            Logger::debug(Logger::Component::Proxy,
                fmt::format("Failed to read request from {}: {}", remote_address_, ec.message()));
            return;
        }

        request_ = request_parser_->release();
        upgrade_ = websocket::is_upgrade(request_);

        Logger::info(Logger::Component::Proxy,
            fmt::format("Client {} -> {} {}{}", remote_address_,
                std::string(request_.method_string()), std::string(request_.target()),
                upgrade_ ? " (upgrade)" : ""));

        auto ctx = RouteContextParser::parse(remote_address_,
            std::string(request_[http::field::cookie]), std::string(request_.target()));

        auto selected = load_balancer_.route(ctx);
        if (!selected) {
            Logger::error(Logger::Component::Router, selected.error());
            send_unavailable("All backend servers are currently unavailable");
            return;
        }

        BackendServer* backend = *selected;
        backend_id_ = backend->id;
        backend_host_ = backend->host;
        backend_port_ = backend->port;

        load_balancer_.on_request_start(*backend);
        started_ = std::chrono::steady_clock::now();
        in_flight_ = true;

        Logger::info(Logger::Component::Router,
            fmt::format("Selected backend: {} ({}:{})", backend_id_, backend_host_, backend_port_));

        request_.set("X-Forwarded-For", remote_address_);
        request_.set("X-Load-Balancer", kLoadBalancerHeader);
        request_.set(http::field::host, fmt::format("{}:{}", backend_host_, backend_port_));
        if (!upgrade_) {
            request_.keep_alive(false);
        }

        resolver_.async_resolve(backend_host_, std::to_string(backend_port_),
            beast::bind_front_handler(&ProxySession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail_backend(ec, "resolve");
            return;
        }
        backend_.expires_after(timeout_);
        backend_.async_connect(results,
            beast::bind_front_handler(&ProxySession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            fail_backend(ec, "connect");
            return;
        }
        backend_.expires_after(timeout_);
        http::async_write(backend_, request_,
            beast::bind_front_handler(&ProxySession::on_backend_write, shared_from_this()));
    }

    void on_backend_write(beast::error_code ec, std::size_t) {
        if (ec) {
            fail_backend(ec, "write");
            return;
        }
        response_parser_.emplace();
        response_parser_->body_limit(kMaxResponseBody);
        // A HEAD response carries the GET Content-Length but no body
        if (request_.method() == http::verb::head) {
            response_parser_->skip(true);
        }
        backend_.expires_after(timeout_);
        http::async_read(backend_, backend_buffer_, *response_parser_,
            beast::bind_front_handler(&ProxySession::on_response, shared_from_this()));
    }

    void on_response(beast::error_code ec, std::size_t) {
        if (ec) {
            fail_backend(ec, "read");
            return;
        }

        response_ = response_parser_->release();
        response_.set("X-Load-Balancer", kLoadBalancerHeader);

        client_.expires_after(timeout_);
        if (upgrade_ && response_.result() == http::status::switching_protocols) {
            http::async_write(client_, response_,
                beast::bind_front_handler(&ProxySession::on_upgrade_written, shared_from_this()));
            return;
        }

        response_.keep_alive(false);
        http::async_write(client_, response_,
            beast::bind_front_handler(&ProxySession::on_response_written, shared_from_this()));
    }

    void on_response_written(beast::error_code ec, std::size_t) {
        if (ec) {
            Logger::debug(Logger::Component::Proxy,
                fmt::format("Client {} went away before the response: {}", remote_address_, ec.message()));
        }

        Logger::info(Logger::Component::Proxy,
            fmt::format("{} -> Client ({:.0f}ms) via backend {}",
                response_.result_int(), elapsed_ms(), backend_id_));

        complete(std::nullopt);
        close_all();
    }

    void on_upgrade_written(beast::error_code ec, std::size_t) {
        if (ec) {
            complete(std::nullopt);
            close_all();
            return;
        }

        client_.expires_never();
        backend_.expires_never();
        Logger::info(Logger::Component::Proxy,
            fmt::format("WebSocket tunnel {} <-> {} open", remote_address_, backend_id_));

        // Bytes that arrived behind the HTTP headers belong to the tunnel
        if (client_buffer_.size() > 0) {
            net::async_write(backend_, client_buffer_.data(),
                [self = shared_from_this()](beast::error_code ec, std::size_t n) {
                    self->client_buffer_.consume(n);
                    if (ec) {
                        self->finish_tunnel(ec);
                        return;
                    }
                    self->pump_upstream();
                });
        } else {
            pump_upstream();
        }

        if (backend_buffer_.size() > 0) {
            net::async_write(client_, backend_buffer_.data(),
                [self = shared_from_this()](beast::error_code ec, std::size_t n) {
                    self->backend_buffer_.consume(n);
                    if (ec) {
                        self->finish_tunnel(ec);
                        return;
                    }
                    self->pump_downstream();
                });
        } else {
            pump_downstream();
        }
    }

    void pump_upstream() {
        client_.async_read_some(net::buffer(upstream_),
            [self = shared_from_this()](beast::error_code ec, std::size_t n) {
                if (ec) {
                    self->finish_tunnel(ec);
                    return;
                }
                net::async_write(self->backend_, net::buffer(self->upstream_.data(), n),
                    [self](beast::error_code ec, std::size_t) {
                        if (ec) {
                            self->finish_tunnel(ec);
                            return;
                        }
                        self->pump_upstream();
                    });
            });
    }

    void pump_downstream() {
        backend_.async_read_some(net::buffer(downstream_),
            [self = shared_from_this()](beast::error_code ec, std::size_t n) {
                if (ec) {
                    self->finish_tunnel(ec);
                    return;
                }
                net::async_write(self->client_, net::buffer(self->downstream_.data(), n),
                    [self](beast::error_code ec, std::size_t) {
                        if (ec) {
                            self->finish_tunnel(ec);
                            return;
                        }
                        self->pump_downstream();
                    });
            });
    }

    void finish_tunnel(beast::error_code ec) {
        if (tunnel_closed_) {
            return;
        }
        tunnel_closed_ = true;

        Logger::info(Logger::Component::Proxy,
            fmt::format("WebSocket tunnel {} <-> {} closed after {:.0f}ms ({})",
                remote_address_, backend_id_, elapsed_ms(), ec.message()));

        // A tunnel ending is the normal way a WebSocket session finishes,
        // not a backend failure.
        complete(std::nullopt);
        close_all();
    }

    void fail_backend(beast::error_code ec, const char* stage) {
        std::string message = fmt::format("Backend {} {} failed: {}", backend_id_, stage, ec.message());
        Logger::error(Logger::Component::Router, message);
        complete(message);
        send_unavailable("Backend connection failed");
    }

    void send_unavailable(const std::string& message) {
        auto res = std::make_shared<http::response<http::string_body>>(
            http::status::service_unavailable, request_.version() ? request_.version() : 11);
        res->set(http::field::content_type, "application/json");
        res->set("X-Load-Balancer", kLoadBalancerHeader);
        res->keep_alive(false);
        res->body() = make_unavailable_body(message);
        res->prepare_payload();

        client_.expires_after(timeout_);
        http::async_write(client_, *res,
            [self = shared_from_this(), res](beast::error_code, std::size_t) {
                self->close_all();
            });
    }

    // Exactly one completion per routed request, whichever path ends it
    void complete(const std::optional<std::string>& error) {
        if (!in_flight_) {
            return;
        }
        in_flight_ = false;
        load_balancer_.on_request_complete(backend_id_, elapsed_ms(), error);
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started_).count();
    }

    void close_all() {
        beast::error_code ec;
        client_.socket().shutdown(tcp::socket::shutdown_both, ec);
        client_.close();
        backend_.close();
    }

    beast::tcp_stream client_;
    beast::tcp_stream backend_;
    tcp::resolver resolver_;
    LoadBalancer& load_balancer_;
    std::chrono::seconds timeout_;

    std::string remote_address_;
    beast::flat_buffer client_buffer_;
    beast::flat_buffer backend_buffer_;
    std::optional<http::request_parser<http::string_body>> request_parser_;
    std::optional<http::response_parser<http::string_body>> response_parser_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    bool upgrade_ = false;

    std::string backend_id_;
    std::string backend_host_;
    uint16_t backend_port_ = 0;
    std::chrono::steady_clock::time_point started_;
    bool in_flight_ = false;
    bool tunnel_closed_ = false;

    std::array<char, kTunnelBufferSize> upstream_{};
    std::array<char, kTunnelBufferSize> downstream_{};
};

} // namespace

ProxyServer::ProxyServer(net::io_context& ioc, const tcp::endpoint& endpoint,
                         LoadBalancer& load_balancer, std::chrono::seconds timeout)
    : ioc_(ioc),
      acceptor_(ioc),
      load_balancer_(load_balancer),
      timeout_(timeout) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec, "open");

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec, "set_option");

    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec, "bind");

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec, "listen");
}

void ProxyServer::run() {
    Logger::info(Logger::Component::LB,
        fmt::format("Load balancer started on {}:{}",
            acceptor_.local_endpoint().address().to_string(), acceptor_.local_endpoint().port()));
    Logger::info(Logger::Component::LB,
        fmt::format("Algorithm: {}", algorithm_name(load_balancer_.algorithm())));
    Logger::info(Logger::Component::LB,
        fmt::format("Sticky sessions: {}",
            load_balancer_.sticky_sessions_enabled() ? "enabled" : "disabled"));
    do_accept();
}

uint16_t ProxyServer::port() const {
    return acceptor_.local_endpoint().port();
}

void ProxyServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
}

void ProxyServer::do_accept() {
    acceptor_.async_accept(ioc_,
        beast::bind_front_handler(&ProxyServer::on_accept, shared_from_this()));
}

void ProxyServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        Logger::error(Logger::Component::Proxy, fmt::format("Accept failed: {}", ec.message()));
    } else {
        std::make_shared<ProxySession>(std::move(socket), ioc_, load_balancer_, timeout_)->run();
    }
    do_accept();
}

} // namespace relaylb
