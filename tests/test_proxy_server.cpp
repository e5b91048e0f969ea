#include <gtest/gtest.h>
#include "relaylb/liveness_tracker.hpp"
#include "relaylb/proxy_server.hpp"
#include "relaylb/room_registry.hpp"
#include "relaylb/signal_server.hpp"
#include "relaylb/signaling_service.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <optional>
#include <thread>

using namespace relaylb;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

class RecordingSink : public MetricsSink {
public:
    void on_request_complete(const BackendServer& backend, double, bool failed) override {
        completions.emplace_back(backend.id, failed);
    }
    void on_health_event(const HealthEvent&) override {}
    void on_health_cycle(const HealthCycleSummary&) override {}

    std::vector<std::pair<std::string, bool>> completions;
};

uint16_t unused_port() {
    net::io_context scratch;
    tcp::acceptor acceptor(scratch, {net::ip::make_address("127.0.0.1"), 0});
    return acceptor.local_endpoint().port();
}

template<typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

class ProxyServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend.Get("/echo", [](const httplib::Request& req, httplib::Response& res) {
            json body;
            body["forwardedFor"] = req.get_header_value("X-Forwarded-For");
            body["loadBalancer"] = req.get_header_value("X-Load-Balancer");
            res.set_content(body.dump(), "application/json");
        });
        backend_port = backend.bind_to_any_port("127.0.0.1");
        ASSERT_GT(backend_port, 0);
        backend_thread = std::thread([this]() { backend.listen_after_bind(); });
        while (!backend.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        backend_manager = std::make_shared<BackendManager>(std::vector<BackendConfig>{
            {"echo", "127.0.0.1", static_cast<uint16_t>(backend_port), 1},
        });
        load_balancer = std::make_unique<LoadBalancer>(backend_manager, Algorithm::RoundRobin,
                                                       false, &sink);

        signal_server = std::make_shared<SignalServer>(ioc,
            tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, service, liveness, kMaxMessageSize);
        signal_server->run();

        proxy = std::make_shared<ProxyServer>(ioc,
            tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, *load_balancer,
            std::chrono::seconds(5));
        proxy->run();

        io_thread = std::thread([this]() { ioc.run(); });
    }

    void TearDown() override {
        if (io_thread.joinable()) {
            net::post(ioc, [this]() {
                proxy->stop();
                signal_server->stop();
            });
            work.reset();
            ioc.stop();
            io_thread.join();
        }
        backend.stop();
        if (backend_thread.joinable()) {
            backend_thread.join();
        }
    }

    // Balancer state belongs to the io thread; reads and writes go through here
    template<typename F>
    auto on_ioc(F fn) -> decltype(fn()) {
        std::packaged_task<decltype(fn())()> task(std::move(fn));
        auto result = task.get_future();
        net::post(ioc, [&task]() { task(); });
        return result.get();
    }

    void route_only_to(const BackendConfig& config) {
        on_ioc([&]() {
            load_balancer->remove_backend("echo");
            auto added = load_balancer->add_backend(config);
            ASSERT_TRUE(added.has_value()) << added.error();
        });
    }

    size_t completion_count() {
        return on_ioc([this]() { return sink.completions.size(); });
    }

    httplib::Client client() {
        httplib::Client cli("127.0.0.1", proxy->port());
        cli.set_read_timeout(5, 0);
        return cli;
    }

    httplib::Server backend;
    std::thread backend_thread;
    int backend_port = 0;

    std::shared_ptr<BackendManager> backend_manager;
    RecordingSink sink;
    std::unique_ptr<LoadBalancer> load_balancer;
    RoomRegistry rooms;
    SignalingService service{rooms};

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work{ioc.get_executor()};
    LivenessTracker liveness{ioc, std::chrono::seconds(30)};
    std::shared_ptr<SignalServer> signal_server;
    std::shared_ptr<ProxyServer> proxy;
    std::thread io_thread;
};

TEST_F(ProxyServerTest, ForwardsWithBalancerHeaders) {
    auto cli = client();
    auto res = cli.Get("/echo");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("X-Load-Balancer"), kLoadBalancerHeader);

    auto body = json::parse(res->body);
    EXPECT_EQ(body["forwardedFor"], "127.0.0.1");
    EXPECT_EQ(body["loadBalancer"], kLoadBalancerHeader);

    ASSERT_TRUE(eventually([this]() { return completion_count() == 1; }));
    on_ioc([this]() {
        auto* echo = backend_manager->find("echo");
        EXPECT_EQ(echo->connections, 0);
        EXPECT_EQ(echo->total_connections, 1);
        EXPECT_EQ(echo->error_count, 0);
        EXPECT_FALSE(sink.completions[0].second);
    });
}

TEST_F(ProxyServerTest, HeadRequestHasNoBody) {
    auto cli = client();
    auto res = cli.Head("/echo");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(res->body.empty());

    ASSERT_TRUE(eventually([this]() { return completion_count() == 1; }));
    on_ioc([this]() {
        auto* echo = backend_manager->find("echo");
        EXPECT_EQ(echo->connections, 0);
        EXPECT_EQ(echo->error_count, 0);
        EXPECT_FALSE(echo->last_error.has_value());
        EXPECT_FALSE(sink.completions[0].second);
    });
}

TEST_F(ProxyServerTest, BackendFailureAnswersUnavailable) {
    route_only_to({"dead", "127.0.0.1", unused_port(), 1});

    auto cli = client();
    auto res = cli.Get("/echo");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
    EXPECT_EQ(res->get_header_value("X-Load-Balancer"), kLoadBalancerHeader);

    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"], "Service Unavailable");
    EXPECT_EQ(body["message"], "Backend connection failed");
    EXPECT_TRUE(body.contains("timestamp"));

    ASSERT_TRUE(eventually([this]() { return completion_count() == 1; }));
    on_ioc([this]() {
        auto* dead = backend_manager->find("dead");
        EXPECT_EQ(dead->connections, 0);
        EXPECT_EQ(dead->error_count, 1);
        ASSERT_TRUE(dead->last_error.has_value());
        EXPECT_EQ(sink.completions[0], std::make_pair(std::string("dead"), true));
    });
}

TEST_F(ProxyServerTest, NoHealthyBackendAnswersUnavailable) {
    on_ioc([this]() { backend_manager->find("echo")->healthy = false; });

    auto cli = client();
    auto res = cli.Get("/echo");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    EXPECT_EQ(json::parse(res->body)["message"], "All backend servers are currently unavailable");

    // Nothing was routed, so nothing completes
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(completion_count(), 0);
}

TEST_F(ProxyServerTest, EachRequestCompletesOnce) {
    auto cli = client();
    for (int i = 0; i < 5; ++i) {
        auto res = cli.Get("/echo");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
    }

    ASSERT_TRUE(eventually([this]() { return completion_count() == 5; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(completion_count(), 5);
    on_ioc([this]() {
        auto* echo = backend_manager->find("echo");
        EXPECT_EQ(echo->connections, 0);
        EXPECT_EQ(echo->total_connections, 5);
    });
}

TEST_F(ProxyServerTest, WebSocketTunnelRelaysBetweenPeers) {
    route_only_to({"signal", "127.0.0.1", signal_server->port(), 1});

    net::io_context client_ioc;
    auto connect = [&]() {
        auto ws = std::make_unique<websocket::stream<tcp::socket>>(client_ioc);
        ws->next_layer().connect({net::ip::make_address("127.0.0.1"), proxy->port()});
        ws->handshake("127.0.0.1", "/?room=r1");
        return ws;
    };
    auto read_frame = [](websocket::stream<tcp::socket>& ws) {
        beast::flat_buffer buffer;
        ws.read(buffer);
        return beast::buffers_to_string(buffer.data());
    };

    auto first = connect();
    first->write(net::buffer(std::string(R"({"type":"join","room":"r1"})")));
    EXPECT_EQ(json::parse(read_frame(*first))["initiator"], true);

    auto second = connect();
    second->write(net::buffer(std::string(R"({"type":"join","room":"r1"})")));
    EXPECT_EQ(json::parse(read_frame(*second))["initiator"], false);

    std::string offer = R"({"type":"offer","sdp":"v=0"})";
    first->write(net::buffer(offer));
    EXPECT_EQ(read_frame(*second), offer);

    EXPECT_EQ(on_ioc([this]() { return backend_manager->find("signal")->connections; }), 2);

    first->close(websocket::close_code::normal);
    second->close(websocket::close_code::normal);

    ASSERT_TRUE(eventually([this]() { return completion_count() == 2; }));
    on_ioc([this]() {
        auto* signal = backend_manager->find("signal");
        EXPECT_EQ(signal->connections, 0);
        EXPECT_EQ(signal->total_connections, 2);
        EXPECT_EQ(signal->error_count, 0);
        for (const auto& [id, failed] : sink.completions) {
            EXPECT_EQ(id, "signal");
            EXPECT_FALSE(failed);
        }
    });
}

TEST_F(ProxyServerTest, FrameSentWithUpgradeRequestReachesBackend) {
    route_only_to({"signal", "127.0.0.1", signal_server->port(), 1});

    std::string payload = R"({"type":"join","room":"r2"})";
    std::string wire =
        "GET /?room=r2 HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "Sec-WebSocket-Version: 13\r\n"
        "\r\n";
    // Masked text frame with an all-zero key, so the payload goes out as is
    wire.push_back(static_cast<char>(0x81));
    wire.push_back(static_cast<char>(0x80 | payload.size()));
    wire.append(4, '\0');
    wire += payload;

    net::io_context client_ioc;
    tcp::socket socket(client_ioc);
    socket.connect({net::ip::make_address("127.0.0.1"), proxy->port()});
    net::write(socket, net::buffer(wire));

    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    http::read_header(socket, buffer, parser);
    const auto& res = parser.get();
    EXPECT_EQ(res.result(), http::status::switching_protocols);
    EXPECT_EQ(res["Sec-WebSocket-Accept"], "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    EXPECT_EQ(res["X-Load-Balancer"], kLoadBalancerHeader);

    auto fill = [&](size_t wanted) {
        while (buffer.size() < wanted) {
            buffer.commit(socket.read_some(buffer.prepare(512)));
        }
    };
    fill(2);
    auto* bytes = static_cast<const unsigned char*>(buffer.data().data());
    EXPECT_EQ(bytes[0], 0x81);
    size_t length = bytes[1] & 0x7f;
    fill(2 + length);
    bytes = static_cast<const unsigned char*>(buffer.data().data());
    std::string frame(reinterpret_cast<const char*>(bytes) + 2, length);
    EXPECT_EQ(frame, R"({"type":"init","initiator":true})");

    socket.close();
    ASSERT_TRUE(eventually([this]() { return completion_count() == 1; }));
    EXPECT_EQ(on_ioc([this]() { return backend_manager->find("signal")->connections; }), 0);
}
