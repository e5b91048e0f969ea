#include "relaylb/signaling_service.hpp"
#include "relaylb/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace relaylb {

SignalingService::SignalingService(RoomRegistry& rooms, size_t max_message_size)
    : rooms_(rooms), max_message_size_(max_message_size) {}

void SignalingService::on_open(const std::shared_ptr<ConnectionHandle>& conn) {
    connections_[conn->id()] = conn;
    Logger::info(Logger::Component::Signal,
        fmt::format("New client connected from IP: {}", conn->remote_address()));
}

void SignalingService::on_message(const std::shared_ptr<ConnectionHandle>& conn,
                                  const std::string& frame) {
    auto message = SignalingProtocol::parse(frame, max_message_size_);
    if (!message) {
        Logger::debug(Logger::Component::Signal,
            fmt::format("Rejected frame from {}: {}", conn->remote_address(), message.error()));
        conn->send(SignalingProtocol::make_error(message.error()));
        return;
    }

    if (message->type == "join") {
        handle_join(conn, *message);
        return;
    }

    if (!conn->room_id()) {
        Logger::debug(Logger::Component::Signal,
            fmt::format("Dropping '{}' from {}: not in a room", message->type, conn->remote_address()));
        return;
    }

    // The original frame goes out, not message->document re-serialized
    rooms_.relay(*conn, frame);
}

void SignalingService::handle_join(const std::shared_ptr<ConnectionHandle>& conn,
                                   const InboundMessage& message) {
    auto room = message.document.find("room");
    if (room == message.document.end() || !SignalingProtocol::is_valid_room_id(*room)) {
        conn->send(SignalingProtocol::make_error(errors::kInvalidRoomId));
        return;
    }

    auto joined = rooms_.join(conn, room->get<std::string>());
    if (!joined) {
        conn->send(SignalingProtocol::make_error(
            joined.error() == JoinError::RoomFull ? errors::kRoomFull : errors::kInvalidRoomId));
        return;
    }

    conn->send(SignalingProtocol::make_init(*joined));
}

void SignalingService::on_close(const std::shared_ptr<ConnectionHandle>& conn) {
    if (connections_.erase(conn->id()) == 0) {
        return;
    }

    Logger::info(Logger::Component::Signal,
        fmt::format("Client {} disconnected", conn->remote_address()));

    rooms_.leave(*conn);
    conn->mark_terminated();
}

std::vector<std::shared_ptr<ConnectionHandle>> SignalingService::connections() const {
    std::vector<std::shared_ptr<ConnectionHandle>> result;
    result.reserve(connections_.size());
    for (const auto& [id, conn] : connections_) {
        result.push_back(conn);
    }
    return result;
}

} // namespace relaylb
