#include "relaylb/room_registry.hpp"
#include "relaylb/logger.hpp"
#include "relaylb/signaling_protocol.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace relaylb {

RoomRegistry::RoomRegistry(size_t max_room_size)
    : max_room_size_(max_room_size) {}

std::expected<bool, JoinError> RoomRegistry::join(const std::shared_ptr<ConnectionHandle>& conn,
                                                  const std::string& room_id) {
    if (room_id.empty() || room_id.size() > kMaxRoomIdLength) {
        return std::unexpected(JoinError::InvalidRoomId);
    }

    auto it = rooms_.find(room_id);
    if (it != rooms_.end()) {
        auto& occupants = it->second.occupants;
        bool already_here = std::any_of(occupants.begin(), occupants.end(),
            [&conn](const auto& occupant) { return occupant.get() == conn.get(); });
        if (already_here) {
            return conn->is_initiator();
        }
        if (occupants.size() >= max_room_size_) {
            Logger::info(Logger::Component::Room,
                fmt::format("Client {} attempted to join full room: {}",
                    conn->remote_address(), room_id));
            return std::unexpected(JoinError::RoomFull);
        }
    }

    if (conn->room_id()) {
        leave(*conn);
        it = rooms_.find(room_id);
    }

    bool initiator = false;
    if (it == rooms_.end()) {
        Room room;
        room.id = room_id;
        room.occupants.push_back(conn);
        rooms_.emplace(room_id, std::move(room));
        initiator = true;
        Logger::info(Logger::Component::Room, fmt::format("Creating new room: {}", room_id));
    } else {
        it->second.occupants.push_back(conn);
    }

    conn->assign_room(room_id, initiator);

    Logger::info(Logger::Component::Room,
        fmt::format("Client {} joined room: {} (initiator: {}), {} client(s)",
            conn->remote_address(), room_id, initiator, occupant_count(room_id)));
    return initiator;
}

size_t RoomRegistry::relay(const ConnectionHandle& from, const std::string& payload) {
    if (!from.room_id()) {
        return 0;
    }

    auto it = rooms_.find(*from.room_id());
    if (it == rooms_.end()) {
        return 0;
    }

    size_t delivered = 0;
    for (const auto& peer : it->second.occupants) {
        if (peer.get() != &from && peer->is_open()) {
            peer->send(payload);
            ++delivered;
        }
    }
    return delivered;
}

void RoomRegistry::leave(ConnectionHandle& conn) {
    if (!conn.room_id()) {
        return;
    }

    std::string room_id = *conn.room_id();
    conn.clear_room();

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return;
    }

    auto& occupants = it->second.occupants;
    std::erase_if(occupants, [&conn](const auto& occupant) { return occupant.get() == &conn; });

    Logger::info(Logger::Component::Room,
        fmt::format("Room {} now has {} client(s)", room_id, occupants.size()));

    if (occupants.empty()) {
        rooms_.erase(it);
        Logger::info(Logger::Component::Room, fmt::format("Room {} deleted (empty)", room_id));
    }
}

bool RoomRegistry::has_room(const std::string& room_id) const {
    return rooms_.contains(room_id);
}

size_t RoomRegistry::occupant_count(const std::string& room_id) const {
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? 0 : it->second.occupants.size();
}

std::vector<std::shared_ptr<ConnectionHandle>> RoomRegistry::occupants(const std::string& room_id) const {
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return {};
    }
    return it->second.occupants;
}

} // namespace relaylb
