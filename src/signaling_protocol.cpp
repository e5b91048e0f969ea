#include "relaylb/signaling_protocol.hpp"

namespace relaylb {

std::expected<InboundMessage, std::string> SignalingProtocol::parse(std::string_view frame,
                                                                    size_t max_size) {
    if (frame.size() > max_size) {
        return std::unexpected(std::string(errors::kMessageTooLarge));
    }

    nlohmann::json document = nlohmann::json::parse(frame, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(std::string(errors::kInvalidJson));
    }

    if (!document.is_object()) {
        return std::unexpected(std::string(errors::kInvalidStructure));
    }

    auto type = document.find("type");
    if (type == document.end() || !type->is_string() || type->get_ref<const std::string&>().empty()) {
        return std::unexpected(std::string(errors::kInvalidStructure));
    }

    InboundMessage message;
    message.type = type->get<std::string>();
    message.document = std::move(document);
    return message;
}

bool SignalingProtocol::is_valid_room_id(const nlohmann::json& room) {
    if (!room.is_string()) {
        return false;
    }
    const auto& id = room.get_ref<const std::string&>();
    return !id.empty() && id.size() <= kMaxRoomIdLength;
}

std::string SignalingProtocol::make_init(bool initiator) {
    nlohmann::ordered_json frame;
    frame["type"] = "init";
    frame["initiator"] = initiator;
    return frame.dump();
}

std::string SignalingProtocol::make_error(std::string_view error) {
    nlohmann::ordered_json frame;
    frame["type"] = "error";
    frame["error"] = std::string(error);
    return frame.dump();
}

} // namespace relaylb
