#pragma once

#include <optional>
#include <string>

namespace relaylb {

struct RouteContext {
    std::string remote_address;
    std::optional<std::string> session_id;
    std::optional<std::string> room_id;
};

class RouteContextParser {
public:
    // Build a context from the pieces of an inbound request
    static RouteContext parse(const std::string& remote_address,
                              const std::string& cookie_header,
                              const std::string& target);

    // "sessionId=<token>" anywhere in a Cookie header
    static std::optional<std::string> extract_session_id(const std::string& cookie_header);

    // "room=<id>" in the query string of a request target
    static std::optional<std::string> extract_room_id(const std::string& target);
};

} // namespace relaylb
