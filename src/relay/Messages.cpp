#include "relay/Messages.h"

#include <boost/json.hpp>

namespace signalrelay::relay::messages {

namespace json = boost::json;

static std::string dump(const json::object& obj) {
    return json::serialize(obj);
}

static json::string_view js(std::string_view s) noexcept {
    return json::string_view(s.data(), s.size());
}

std::string join(const std::string& peer_id, const std::vector<std::string>& peers) {
    json::array list;
    list.reserve(peers.size());
    for (const auto& p : peers) list.emplace_back(p);

    return dump({
        {"type", "join"},
        {"peerId", peer_id},
        {"data", json::object{{"peers", std::move(list)}}}
    });
}

std::string peer_joined(const std::string& peer_id) {
    return dump({{"type", "peer-joined"}, {"peerId", peer_id}});
}

std::string peer_left(const std::string& peer_id) {
    return dump({{"type", "peer-left"}, {"peerId", peer_id}});
}

std::string error(std::string_view message) {
    return dump({
        {"type", "error"},
        {"data", json::object{{"message", js(message)}}}
    });
}

std::string relayed(std::string_view type, const std::string& sender,
                    const std::optional<json::value>& data) {
    json::object out{{"type", js(type)}, {"peerId", sender}};
    if (data) out["data"] = *data;
    return dump(out);
}

bool is_relayable_type(std::string_view type) noexcept {
    return type == "offer" || type == "answer" || type == "ice";
}

Signal parse_signal(std::string_view raw) {
    Signal sig;

    json::error_code ec;
    json::value v = json::parse(js(raw), ec);
    if (ec) {
        sig.status = Signal::Status::InvalidJson;
        return sig;
    }

    // Anything that is not an object with a known string type is a type error,
    // including valid non-object JSON such as `42`.
    const auto* obj = v.if_object();
    const json::value* type = obj ? obj->if_contains("type") : nullptr;
    const json::string* type_str = type ? type->if_string() : nullptr;
    if (!type_str || !is_relayable_type(std::string_view(type_str->data(), type_str->size()))) {
        sig.status = Signal::Status::InvalidType;
        return sig;
    }

    sig.status = Signal::Status::Ok;
    sig.type = std::string(type_str->data(), type_str->size());
    if (const json::value* data = obj->if_contains("data")) sig.data = *data;
    return sig;
}

} // namespace signalrelay::relay::messages
