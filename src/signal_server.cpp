#include "relaylb/signal_server.hpp"
#include "relaylb/logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <deque>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace relaylb {

namespace {

std::string endpoint_address(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

class SignalSession : public ConnectionHandle,
                      public std::enable_shared_from_this<SignalSession> {
public:
    SignalSession(tcp::socket&& socket, uint64_t id, std::string remote_address,
                  SignalingService& service, LivenessTracker& liveness, size_t max_message_size)
        : ConnectionHandle(id, std::move(remote_address)),
          ws_(std::move(socket)),
          service_(service),
          liveness_(liveness),
          max_message_size_(max_message_size) {}

    void run(http::request<http::string_body> req) {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "relaylb-signal");
        }));
        // Frames up to 4x the limit are read so they can be answered with an
        // error frame; anything bigger fails the connection.
        ws_.read_message_max(max_message_size_ * 4);
        ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong) {
                on_pong();
            }
        });

        ws_.async_accept(req,
            beast::bind_front_handler(&SignalSession::on_accept, shared_from_this()));
    }

    void send(std::string frame) override {
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(frame));
        if (queue_.size() > 1) {
            return;
        }
        write_next();
    }

    void ping() override {
        if (closed_ || ping_pending_) {
            return;
        }
        ping_pending_ = true;
        ws_.async_ping({}, [self = shared_from_this()](beast::error_code) {
            self->ping_pending_ = false;
        });
    }

    void terminate() override {
        if (closed_) {
            return;
        }
        // The pending read fails and handle_closed() runs from there
        beast::get_lowest_layer(ws_).close();
    }

    void close() override {
        if (closed_ || closing_) {
            return;
        }
        closing_ = true;
        ws_.async_close(websocket::close_code::going_away,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    self->terminate();
                }
            });
    }

    bool is_open() const override {
        return !closed_ && ws_.is_open();
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            Logger::warn(Logger::Component::Signal,
                fmt::format("WebSocket handshake with {} failed: {}", remote_address(), ec.message()));
            return;
        }

        auto self = shared_from_this();
        service_.on_open(self);
        liveness_.track(self);
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_,
            beast::bind_front_handler(&SignalSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            handle_closed(ec);
            return;
        }

        std::string frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        service_.on_message(shared_from_this(), frame);

        if (!closed_) {
            do_read();
        }
    }

    void write_next() {
        ws_.text(true);
        ws_.async_write(net::buffer(queue_.front()),
            beast::bind_front_handler(&SignalSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            Logger::error(Logger::Component::Signal,
                fmt::format("WebSocket error for client {}: {}", remote_address(), ec.message()));
            queue_.clear();
            terminate();
            return;
        }

        queue_.pop_front();
        if (!queue_.empty()) {
            write_next();
        }
    }

    void handle_closed(beast::error_code ec) {
        if (closed_) {
            return;
        }
        closed_ = true;

        if (ec != websocket::error::closed && ec != net::error::operation_aborted &&
            ec != net::error::eof) {
            Logger::debug(Logger::Component::Signal,
                fmt::format("Connection {} ended: {}", remote_address(), ec.message()));
        }

        liveness_.untrack(*this);
        service_.on_close(shared_from_this());
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    SignalingService& service_;
    LivenessTracker& liveness_;
    size_t max_message_size_;
    std::deque<std::string> queue_;
    bool ping_pending_ = false;
    bool closing_ = false;
    bool closed_ = false;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<SignalServer> server)
        : stream_(std::move(socket)), server_(std::move(server)) {}

    void run() {
        net::dispatch(stream_.get_executor(),
            beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, req_,
            beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            Logger::debug(Logger::Component::Signal, fmt::format("HTTP read failed: {}", ec.message()));
            return;
        }

        if (websocket::is_upgrade(req_)) {
            stream_.expires_never();
            server_->upgrade(stream_.release_socket(), std::move(req_));
            return;
        }

        auto res = std::make_shared<http::response<http::string_body>>(server_->handle_http(req_));
        bool keep_alive = res->keep_alive();
        http::async_write(stream_, *res,
            [self = shared_from_this(), res, keep_alive](beast::error_code ec, std::size_t) {
                if (ec) {
                    return;
                }
                if (!keep_alive) {
                    self->do_close();
                    return;
                }
                self->do_read();
            });
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<SignalServer> server_;
};

} // namespace

SignalServer::SignalServer(net::io_context& ioc, const tcp::endpoint& endpoint,
                           SignalingService& service, LivenessTracker& liveness,
                           size_t max_message_size, std::vector<std::string> trusted_proxies)
    : ioc_(ioc),
      acceptor_(ioc),
      service_(service),
      liveness_(liveness),
      max_message_size_(max_message_size),
      trusted_proxies_(std::move(trusted_proxies)) {
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

void SignalServer::run() {
    Logger::info(Logger::Component::Signal,
        fmt::format("Signaling server running on {}:{}",
            acceptor_.local_endpoint().address().to_string(), acceptor_.local_endpoint().port()));
    Logger::info(Logger::Component::Signal,
        fmt::format("Maximum room size: {} clients, maximum message size: {} bytes",
            kMaxRoomSize, max_message_size_));
    do_accept();
}

uint16_t SignalServer::port() const {
    return acceptor_.local_endpoint().port();
}

void SignalServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);

    for (const auto& conn : service_.connections()) {
        conn->close();
    }
}

void SignalServer::do_accept() {
    acceptor_.async_accept(ioc_,
        beast::bind_front_handler(&SignalServer::on_accept, shared_from_this()));
}

void SignalServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        Logger::error(Logger::Component::Signal, fmt::format("Accept failed: {}", ec.message()));
    } else {
        std::make_shared<HttpSession>(std::move(socket), shared_from_this())->run();
    }
    do_accept();
}

void SignalServer::upgrade(tcp::socket socket, http::request<http::string_body> req) {
    std::string_view forwarded;
    if (auto it = req.find("X-Forwarded-For"); it != req.end()) {
        forwarded = std::string_view(it->value().data(), it->value().size());
    }
    std::string remote = resolve_client_address(endpoint_address(socket), forwarded, trusted_proxies_);

    std::make_shared<SignalSession>(std::move(socket), next_connection_id_++, remote,
                                    service_, liveness_, max_message_size_)
        ->run(std::move(req));
}

http::response<http::string_body> SignalServer::handle_http(
    const http::request<http::string_body>& req) const {
    http::response<http::string_body> res;
    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.set(http::field::server, "relaylb-signal");

    if (req.method() == http::verb::get && req.target() == "/health") {
        nlohmann::json body;
        body["status"] = "healthy";
        body["rooms"] = service_.rooms().room_count();
        body["connections"] = service_.connection_count();

        res.result(http::status::ok);
        res.set(http::field::content_type, "application/json");
        res.body() = body.dump();
    } else {
        res.result(http::status::not_found);
        res.set(http::field::content_type, "text/plain");
        res.body() = "404 Not Found";
    }

    res.prepare_payload();
    return res;
}

std::string resolve_client_address(const std::string& peer_address,
                                   std::string_view forwarded_for,
                                   const std::vector<std::string>& trusted_proxies) {
    if (forwarded_for.empty() ||
        std::find(trusted_proxies.begin(), trusted_proxies.end(), peer_address) == trusted_proxies.end()) {
        return peer_address;
    }

    // Leftmost entry is the original client
    auto first = forwarded_for.substr(0, forwarded_for.find(','));
    auto begin = first.find_first_not_of(' ');
    if (begin == std::string_view::npos) {
        return peer_address;
    }
    auto end = first.find_last_not_of(' ');
    return std::string(first.substr(begin, end - begin + 1));
}

} // namespace relaylb
