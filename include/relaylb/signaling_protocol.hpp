#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace relaylb {

inline constexpr size_t kMaxMessageSize = 64 * 1024;
inline constexpr size_t kMaxRoomIdLength = 50;
inline constexpr size_t kMaxRoomSize = 2;

namespace errors {
inline constexpr std::string_view kMessageTooLarge = "Message too large";
inline constexpr std::string_view kInvalidJson = "Invalid JSON format";
inline constexpr std::string_view kInvalidStructure = "Invalid message structure";
inline constexpr std::string_view kInvalidRoomId = "Invalid room ID";
inline constexpr std::string_view kRoomFull = "Room is full";
} // namespace errors

struct InboundMessage {
    std::string type;
    nlohmann::json document;
};

class SignalingProtocol {
public:
    // Size, JSON and "type" checks, in that order. The error is the text
    // that goes back to the client in an error frame.
    static std::expected<InboundMessage, std::string> parse(std::string_view frame,
                                                            size_t max_size = kMaxMessageSize);

    static bool is_valid_room_id(const nlohmann::json& room);

    static std::string make_init(bool initiator);
    static std::string make_error(std::string_view error);
};

} // namespace relaylb
