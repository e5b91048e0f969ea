#pragma once

#include "relaylb/connection.hpp"
#include "relaylb/room_registry.hpp"
#include "relaylb/signaling_protocol.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace relaylb {

// Connection lifecycle and message handling for one signaling instance
class SignalingService {
public:
    explicit SignalingService(RoomRegistry& rooms, size_t max_message_size = kMaxMessageSize);

    void on_open(const std::shared_ptr<ConnectionHandle>& conn);
    void on_message(const std::shared_ptr<ConnectionHandle>& conn, const std::string& frame);
    void on_close(const std::shared_ptr<ConnectionHandle>& conn);

    size_t connection_count() const { return connections_.size(); }
    std::vector<std::shared_ptr<ConnectionHandle>> connections() const;

    RoomRegistry& rooms() { return rooms_; }

private:
    void handle_join(const std::shared_ptr<ConnectionHandle>& conn, const InboundMessage& message);

    RoomRegistry& rooms_;
    size_t max_message_size_;
    std::unordered_map<uint64_t, std::shared_ptr<ConnectionHandle>> connections_;
};

} // namespace relaylb
