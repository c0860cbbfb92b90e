#pragma once

#include "pairing/PairingRegistry.h"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace signalrelay::api {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline constexpr std::size_t kMaxRoomIdLength = 64;
inline constexpr std::size_t kMinCodeLength = 3;
inline constexpr std::size_t kMaxCodeLength = 20;

struct RoomRoute {
    enum class Kind { NotRoom, Accepted, IdTooLong };

    Kind kind = Kind::NotRoom;
    std::string room_id;
};

// Matches "/room/<id>" with id in [a-zA-Z0-9_-]+; the query string is ignored.
RoomRoute match_room(std::string_view target);

// Plain HTTP surface: health, pairing, CORS preflight, and the refusals for
// room requests that cannot be upgraded. The WebSocket upgrade itself is the
// server's business; see wants_room_upgrade().
class HttpApi {
public:
    explicit HttpApi(pairing::PairingRegistry& pairing);

    Response handle(const Request& req) const;

    // True when `req` is a well-formed upgrade to a room; `room_id` is filled.
    static bool wants_room_upgrade(const Request& req, std::string& room_id);

private:
    Response register_pairing_(const Request& req) const;
    Response lookup_pairing_(const Request& req, const std::string& code) const;

    pairing::PairingRegistry& pairing_;
};

} // namespace signalrelay::api
