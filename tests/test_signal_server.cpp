#include <gtest/gtest.h>
#include "relaylb/liveness_tracker.hpp"
#include "relaylb/room_registry.hpp"
#include "relaylb/signal_server.hpp"
#include "relaylb/signaling_service.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
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
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using json = nlohmann::json;

class SignalServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = start_server({"127.0.0.1", "::1"});
        io_thread = std::thread([this]() { ioc.run(); });
    }

    void TearDown() override {
        net::post(ioc, [this]() {
            for (auto& s : servers) {
                s->stop();
            }
        });
        work.reset();
        ioc.stop();
        io_thread.join();
    }

    std::shared_ptr<SignalServer> start_server(std::vector<std::string> trusted_proxies) {
        auto s = std::make_shared<SignalServer>(ioc,
            tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}, service, liveness,
            kMaxMessageSize, std::move(trusted_proxies));
        s->run();
        servers.push_back(s);
        return s;
    }

    template<typename F>
    auto on_ioc(F fn) -> decltype(fn()) {
        std::packaged_task<decltype(fn())()> task(std::move(fn));
        auto result = task.get_future();
        net::post(ioc, [&task]() { task(); });
        return result.get();
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

    using Client = websocket::stream<tcp::socket>;

    std::unique_ptr<Client> connect(uint16_t port, const std::string& forwarded_for = "") {
        auto ws = std::make_unique<Client>(client_ioc);
        ws->next_layer().connect({net::ip::make_address("127.0.0.1"), port});
        if (!forwarded_for.empty()) {
            ws->set_option(websocket::stream_base::decorator(
                [forwarded_for](websocket::request_type& req) {
                    req.set("X-Forwarded-For", forwarded_for);
                }));
        }
        ws->handshake("127.0.0.1", "/");
        return ws;
    }

    static void send(Client& ws, const std::string& frame) {
        ws.text(true);
        ws.write(net::buffer(frame));
    }

    static std::string receive(Client& ws) {
        beast::flat_buffer buffer;
        ws.read(buffer);
        return beast::buffers_to_string(buffer.data());
    }

    RoomRegistry rooms;
    SignalingService service{rooms};

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work{ioc.get_executor()};
    LivenessTracker liveness{ioc, std::chrono::seconds(30)};
    std::vector<std::shared_ptr<SignalServer>> servers;
    std::shared_ptr<SignalServer> server;
    std::thread io_thread;

    net::io_context client_ioc;
};

TEST_F(SignalServerTest, HealthEndpoint) {
    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["rooms"], 0);
    EXPECT_EQ(body["connections"], 0);
}

TEST_F(SignalServerTest, OtherPathsAreNotFound) {
    httplib::Client cli("127.0.0.1", server->port());

    auto res = cli.Get("/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    res = cli.Post("/health", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(SignalServerTest, JoinRelayAndRoomFull) {
    auto first = connect(server->port());
    auto second = connect(server->port());
    auto third = connect(server->port());

    send(*first, R"({"type":"join","room":"abc"})");
    EXPECT_EQ(receive(*first), R"({"type":"init","initiator":true})");
    send(*second, R"({"type":"join","room":"abc"})");
    EXPECT_EQ(receive(*second), R"({"type":"init","initiator":false})");
    send(*third, R"({"type":"join","room":"abc"})");
    EXPECT_EQ(receive(*third), R"({"type":"error","error":"Room is full"})");

    // Relayed byte for byte, including spacing and key order
    std::string answer = R"({"sdp": "v=0",  "type":"answer"})";
    send(*second, answer);
    EXPECT_EQ(receive(*first), answer);

    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["rooms"], 1);
    EXPECT_EQ(body["connections"], 3);

    first->close(websocket::close_code::normal);
    second->close(websocket::close_code::normal);
    third->close(websocket::close_code::normal);

    ASSERT_TRUE(eventually([this]() {
        return on_ioc([this]() { return service.connection_count(); }) == 0;
    }));
    EXPECT_EQ(on_ioc([this]() { return rooms.room_count(); }), 0);
    EXPECT_EQ(on_ioc([this]() { return liveness.tracked_count(); }), 0);
}

TEST_F(SignalServerTest, InvalidFramesGetErrors) {
    auto ws = connect(server->port());

    send(*ws, "not json");
    EXPECT_EQ(json::parse(receive(*ws))["error"], "Invalid JSON format");

    send(*ws, R"({"room":"abc"})");
    EXPECT_EQ(json::parse(receive(*ws))["error"], "Invalid message structure");

    send(*ws, std::string(kMaxMessageSize + 1, 'x'));
    EXPECT_EQ(json::parse(receive(*ws))["error"], "Message too large");

    ws->close(websocket::close_code::normal);
}

TEST_F(SignalServerTest, ForwardedForFromTrustedPeer) {
    auto ws = connect(server->port(), "203.0.113.7");
    send(*ws, R"({"type":"join","room":"abc"})");
    receive(*ws);

    auto remote = on_ioc([this]() { return service.connections().front()->remote_address(); });
    EXPECT_EQ(remote, "203.0.113.7");
    ws->close(websocket::close_code::normal);
}

TEST_F(SignalServerTest, ForwardedForFromUntrustedPeerIgnored) {
    auto direct = on_ioc([this]() { return start_server({}); });

    auto ws = connect(direct->port(), "203.0.113.7");
    send(*ws, R"({"type":"join","room":"abc"})");
    receive(*ws);

    auto remote = on_ioc([this]() { return service.connections().front()->remote_address(); });
    EXPECT_EQ(remote, "127.0.0.1");
    ws->close(websocket::close_code::normal);
}

TEST(ResolveClientAddressTest, FirstForwardedEntryFromTrustedPeer) {
    std::vector<std::string> trusted{"10.0.0.2"};
    EXPECT_EQ(resolve_client_address("10.0.0.2", "203.0.113.7, 10.0.0.9", trusted), "203.0.113.7");
    EXPECT_EQ(resolve_client_address("10.0.0.2", " 198.51.100.4 ", trusted), "198.51.100.4");
}

TEST(ResolveClientAddressTest, PeerAddressOtherwise) {
    std::vector<std::string> trusted{"10.0.0.2"};
    EXPECT_EQ(resolve_client_address("10.0.0.3", "203.0.113.7", trusted), "10.0.0.3");
    EXPECT_EQ(resolve_client_address("10.0.0.2", "", trusted), "10.0.0.2");
    EXPECT_EQ(resolve_client_address("10.0.0.2", "  , 1.2.3.4", trusted), "10.0.0.2");
    EXPECT_EQ(resolve_client_address("10.0.0.2", "203.0.113.7", {}), "10.0.0.2");
}
