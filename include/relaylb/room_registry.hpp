#pragma once

#include "relaylb/connection.hpp"
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace relaylb {

enum class JoinError {
    InvalidRoomId,
    RoomFull
};

struct Room {
    std::string id;
    std::vector<std::shared_ptr<ConnectionHandle>> occupants;
};

// Rooms of at most two peers, keyed by room id. A room exists exactly as
// long as it has an occupant.
class RoomRegistry {
public:
    explicit RoomRegistry(size_t max_room_size = 2);

    // On success the value is the joiner's initiator flag. A connection
    // already in a room leaves it first.
    std::expected<bool, JoinError> join(const std::shared_ptr<ConnectionHandle>& conn,
                                        const std::string& room_id);

    // Forwards payload untouched to every other open occupant of the
    // sender's room. Returns the number of peers it was handed to.
    size_t relay(const ConnectionHandle& from, const std::string& payload);

    void leave(ConnectionHandle& conn);

    bool has_room(const std::string& room_id) const;
    size_t room_count() const { return rooms_.size(); }
    size_t occupant_count(const std::string& room_id) const;
    std::vector<std::shared_ptr<ConnectionHandle>> occupants(const std::string& room_id) const;

private:
    size_t max_room_size_;
    std::unordered_map<std::string, Room> rooms_;
};

} // namespace relaylb
