#include "relaylb/route_context.hpp"
#include <regex>

namespace relaylb {

RouteContext RouteContextParser::parse(const std::string& remote_address,
                                       const std::string& cookie_header,
                                       const std::string& target) {
    RouteContext ctx;
    ctx.remote_address = remote_address;
    ctx.session_id = extract_session_id(cookie_header);
    ctx.room_id = extract_room_id(target);
    return ctx;
}

std::optional<std::string> RouteContextParser::extract_session_id(const std::string& cookie_header) {
    static const std::regex session_regex(R"((?:^|;\s*)sessionId=([^;]+))");

    std::smatch match;
    if (std::regex_search(cookie_header, match, session_regex)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> RouteContextParser::extract_room_id(const std::string& target) {
    auto query_pos = target.find('?');
    if (query_pos == std::string::npos) {
        return std::nullopt;
    }

    static const std::regex room_regex(R"((?:^|&)room=([^&#]+))");

    std::string query = target.substr(query_pos + 1);
    std::smatch match;
    if (std::regex_search(query, match, room_regex)) {
        return match[1].str();
    }
    return std::nullopt;
}

} // namespace relaylb
