#include "relaylb/admin_server.hpp"
#include "relaylb/logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace relaylb {

namespace {

AdminResponse error_response(int status, const std::string& message) {
    return {status, json{{"error", message}}};
}

std::optional<uint16_t> parse_port(const json& value) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    auto port = value.get<int64_t>();
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

} // namespace

AdminApi::AdminApi(LoadBalancer& load_balancer)
    : load_balancer_(load_balancer) {}

AdminResponse AdminApi::get_stats() const {
    return {200, load_balancer_.get_stats()};
}

AdminResponse AdminApi::add_server(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return error_response(400, "Body must be a JSON object");
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        return error_response(400, "'id' is required");
    }
    if (!j.contains("port")) {
        return error_response(400, "'port' is required");
    }
    auto port = parse_port(j["port"]);
    if (!port) {
        return error_response(400, "'port' must be an integer in 1-65535");
    }
    auto weight = j.value("weight", json(1));
    if (!weight.is_number_integer()) {
        return error_response(400, "'weight' must be an integer");
    }
    if (j.contains("host") && !j["host"].is_string()) {
        return error_response(400, "'host' must be a string");
    }

    BackendConfig config;
    config.id = j["id"].get<std::string>();
    config.host = j.value("host", std::string("localhost"));
    config.port = *port;
    config.weight = weight.get<int>();

    auto result = load_balancer_.add_backend(config);
    if (!result) {
        int status = load_balancer_.backends().find(config.id) != nullptr ? 409 : 400;
        return error_response(status, result.error());
    }

    const auto* backend = load_balancer_.backends().find(config.id);
    return {201, json{{"id", backend->id}, {"host", backend->host},
                      {"port", backend->port}, {"weight", backend->weight}}};
}

AdminResponse AdminApi::update_server(const std::string& id, const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return error_response(400, "Body must be a JSON object");
    }

    BackendUpdate update;
    if (j.contains("host")) {
        if (!j["host"].is_string()) {
            return error_response(400, "'host' must be a string");
        }
        update.host = j["host"].get<std::string>();
    }
    if (j.contains("port")) {
        auto port = parse_port(j["port"]);
        if (!port) {
            return error_response(400, "'port' must be an integer in 1-65535");
        }
        update.port = *port;
    }
    if (j.contains("weight")) {
        if (!j["weight"].is_number_integer()) {
            return error_response(400, "'weight' must be an integer");
        }
        update.weight = j["weight"].get<int>();
    }

    if (load_balancer_.backends().find(id) == nullptr) {
        return error_response(404, "Server '" + id + "' not found");
    }

    auto result = load_balancer_.update_backend(id, update);
    if (!result) {
        return error_response(400, result.error());
    }
    return {200, json{{"updated", id}}};
}

AdminResponse AdminApi::remove_server(const std::string& id) {
    if (!load_balancer_.remove_backend(id)) {
        return error_response(404, "Server '" + id + "' not found");
    }
    return {200, json{{"removed", id}}};
}

AdminResponse AdminApi::drain_server(const std::string& id) {
    if (!load_balancer_.drain_backend(id)) {
        return error_response(404, "Server '" + id + "' not found");
    }
    return {200, json{{"draining", id}}};
}

AdminResponse AdminApi::clear_sticky_sessions() {
    size_t cleared = load_balancer_.sticky_session_count();
    load_balancer_.clear_sticky_sessions();
    return {200, json{{"cleared", cleared}}};
}

AdminServer::AdminServer(boost::asio::io_context& ioc, AdminApi& api, const AdminConfig& config)
    : ioc_(ioc), api_(api), config_(config), server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

AdminServer::~AdminServer() {
    stop();
}

void AdminServer::register_routes() {
    auto reply = [](httplib::Response& res, const std::optional<AdminResponse>& response) {
        if (!response) {
            res.status = 503;
            res.set_content(R"({"error": "Load balancer busy"})", "application/json");
            return;
        }
        res.status = response->status;
        res.set_content(response->body.dump(2), "application/json");
    };

    server_->Get("/stats", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, on_context([this]() { return api_.get_stats(); }));
    });

    server_->Post("/servers", [this, reply](const httplib::Request& req, httplib::Response& res) {
        Logger::info(Logger::Component::Admin, fmt::format("POST /servers from {}", req.remote_addr));
        std::string body = req.body;
        reply(res, on_context([this, body]() { return api_.add_server(body); }));
    });

    server_->Patch(R"(/servers/([^/]+))", [this, reply](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        std::string body = req.body;
        Logger::info(Logger::Component::Admin, fmt::format("PATCH /servers/{} from {}", id, req.remote_addr));
        reply(res, on_context([this, id, body]() { return api_.update_server(id, body); }));
    });

    server_->Delete(R"(/servers/([^/]+))", [this, reply](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        Logger::info(Logger::Component::Admin, fmt::format("DELETE /servers/{} from {}", id, req.remote_addr));
        reply(res, on_context([this, id]() { return api_.remove_server(id); }));
    });

    server_->Post(R"(/servers/([^/]+)/drain)", [this, reply](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        Logger::info(Logger::Component::Admin, fmt::format("POST /servers/{}/drain from {}", id, req.remote_addr));
        reply(res, on_context([this, id]() { return api_.drain_server(id); }));
    });

    server_->Delete("/sessions", [this, reply](const httplib::Request& req, httplib::Response& res) {
        Logger::info(Logger::Component::Admin, fmt::format("DELETE /sessions from {}", req.remote_addr));
        reply(res, on_context([this]() { return api_.clear_sticky_sessions(); }));
    });
}

void AdminServer::start() {
    server_thread_ = std::thread([this]() {
        if (!server_->listen(config_.host, config_.port)) {
            Logger::error(Logger::Component::Admin,
                fmt::format("Admin API failed to listen on {}:{}", config_.host, config_.port));
        }
    });
    Logger::info(Logger::Component::Admin,
        fmt::format("Admin API on {}:{}", config_.host, config_.port));
}

void AdminServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

} // namespace relaylb
