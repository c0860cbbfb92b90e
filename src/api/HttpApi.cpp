#include "api/HttpApi.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>

#include <utility>

namespace signalrelay::api {

namespace json = boost::json;

namespace {

constexpr char kAllowedMethods[] = "GET, POST, OPTIONS";
constexpr char kAllowedHeaders[] =
    "Content-Type, Upgrade, Connection, Sec-WebSocket-Key, Sec-WebSocket-Version, Sec-WebSocket-Protocol";

bool is_id_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool is_id(std::string_view s) noexcept {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_id_char(c)) return false;
    }
    return true;
}

// Length as clients measure it: UTF-16 code units, so a four-byte UTF-8
// sequence counts twice.
std::size_t utf16_length(std::string_view s) noexcept {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) == 0x80) continue;
        n += c >= 0xF0 ? 2 : 1;
    }
    return n;
}

std::string_view to_std(boost::beast::string_view s) noexcept {
    return std::string_view(s.data(), s.size());
}

std::string_view path_of(std::string_view target) noexcept {
    return target.substr(0, target.find('?'));
}

// Mirrors JavaScript truthiness, which is what pairing clients were written against.
bool is_truthy(const json::value* v) noexcept {
    if (!v) return false;
    switch (v->kind()) {
        case json::kind::null:    return false;
        case json::kind::bool_:   return v->get_bool();
        case json::kind::int64:   return v->get_int64() != 0;
        case json::kind::uint64:  return v->get_uint64() != 0;
        case json::kind::double_: return v->get_double() != 0.0;
        case json::kind::string:  return !v->get_string().empty();
        default:                  return true;
    }
}

Response make_response(const Request& req, http::status status) {
    Response res{status, req.version()};
    res.set(http::field::server, "signalrelay");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    return res;
}

Response json_response(const Request& req, http::status status, const json::value& body) {
    Response res = make_response(req, status);
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

Response error_response(const Request& req, http::status status, std::string_view message) {
    return json_response(req, status, json::object{{"error", json::string_view(message.data(), message.size())}});
}

} // namespace

RoomRoute match_room(std::string_view target) {
    constexpr std::string_view prefix = "/room/";

    RoomRoute route;
    const std::string_view path = path_of(target);
    if (path.substr(0, prefix.size()) != prefix) return route;

    const std::string_view id = path.substr(prefix.size());
    if (!is_id(id)) return route;

    route.kind = id.size() > kMaxRoomIdLength ? RoomRoute::Kind::IdTooLong : RoomRoute::Kind::Accepted;
    route.room_id = std::string(id);
    return route;
}

HttpApi::HttpApi(pairing::PairingRegistry& pairing) : pairing_(pairing) {}

bool HttpApi::wants_room_upgrade(const Request& req, std::string& room_id) {
    if (req.method() != http::verb::get) return false;
    if (!boost::beast::websocket::is_upgrade(req)) return false;

    auto route = match_room(to_std(req.target()));
    if (route.kind != RoomRoute::Kind::Accepted) return false;
    room_id = std::move(route.room_id);
    return true;
}

Response HttpApi::handle(const Request& req) const {
    if (req.method() == http::verb::options) {
        Response res = make_response(req, http::status::ok);
        res.set(http::field::access_control_allow_methods, kAllowedMethods);
        res.set(http::field::access_control_allow_headers, kAllowedHeaders);
        res.prepare_payload();
        return res;
    }

    const std::string_view path = path_of(to_std(req.target()));

    if (path == "/" || path == "/health") {
        return json_response(req, http::status::ok, json::object{{"status", "ok"}});
    }

    if (path == "/pair" && req.method() == http::verb::post) {
        return register_pairing_(req);
    }

    constexpr std::string_view pair_prefix = "/pair/";
    if (path.substr(0, pair_prefix.size()) == pair_prefix && req.method() == http::verb::get) {
        const std::string_view code = path.substr(pair_prefix.size());
        if (is_id(code)) return lookup_pairing_(req, std::string(code));
    }

    if (req.method() == http::verb::get) {
        const auto route = match_room(to_std(req.target()));
        if (route.kind == RoomRoute::Kind::IdTooLong) {
            return error_response(req, http::status::bad_request, "Room ID too long");
        }
        if (route.kind == RoomRoute::Kind::Accepted) {
            // Upgrades never reach here; the server takes them first.
            return error_response(req, http::status::upgrade_required, "Expected WebSocket upgrade");
        }
    }

    return error_response(req, http::status::not_found, "Not found");
}

Response HttpApi::register_pairing_(const Request& req) const {
    const std::string_view content_type = to_std(req[http::field::content_type]);
    if (content_type.find("application/json") == std::string_view::npos) {
        return error_response(req, http::status::bad_request, "Content-Type must be application/json");
    }

    json::error_code ec;
    json::value body = json::parse(req.body(), ec);
    if (ec) return error_response(req, http::status::bad_request, "Invalid JSON body");

    auto* obj = body.if_object();
    const json::value* code = obj ? obj->if_contains("code") : nullptr;
    const json::string* code_str = code ? code->if_string() : nullptr;
    const std::size_t code_length =
        code_str ? utf16_length(std::string_view(code_str->data(), code_str->size())) : 0;
    if (!code_str || code_length < kMinCodeLength || code_length > kMaxCodeLength) {
        return error_response(req, http::status::bad_request,
                              "Invalid code: must be a string of 3-20 characters");
    }

    json::value* info = obj->if_contains("info");
    json::object* info_obj = info ? info->if_object() : nullptr;
    if (!info_obj) {
        return error_response(req, http::status::bad_request, "Invalid info: must be an object");
    }

    const json::value* expires = info_obj->if_contains("expires");
    if (!is_truthy(info_obj->if_contains("device_id")) ||
        !is_truthy(info_obj->if_contains("public_key")) ||
        !is_truthy(info_obj->if_contains("relay_url")) ||
        !expires || !expires->is_number()) {
        return error_response(req, http::status::bad_request,
                              "Invalid info: must contain device_id, public_key, relay_url, and expires");
    }

    double ttl = 0;
    if (const json::value* t = obj->if_contains("ttl"); t && t->is_number()) {
        ttl = t->to_number<double>();
    }

    pairing_.register_code(std::string(code_str->data(), code_str->size()), std::move(*info), ttl);
    return json_response(req, http::status::ok, json::object{{"ok", true}});
}

Response HttpApi::lookup_pairing_(const Request& req, const std::string& code) const {
    auto result = pairing_.lookup(code);
    switch (result.status) {
        case pairing::PairingRegistry::LookupResult::Status::Found:
            return json_response(req, http::status::ok, result.info);
        case pairing::PairingRegistry::LookupResult::Status::Expired:
            return error_response(req, http::status::not_found, "Expired");
        case pairing::PairingRegistry::LookupResult::Status::NotFound:
            break;
    }
    return error_response(req, http::status::not_found, "Not found");
}

} // namespace signalrelay::api
