#pragma once

#include <boost/json/value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signalrelay::relay::messages {

inline constexpr std::string_view kRateLimitExceeded = "Rate limit exceeded";
inline constexpr std::string_view kInvalidJson = "Invalid JSON";
inline constexpr std::string_view kInvalidType = "Invalid message type";

// Server -> client frames.
std::string join(const std::string& peer_id, const std::vector<std::string>& peers);
std::string peer_joined(const std::string& peer_id);
std::string peer_left(const std::string& peer_id);
std::string error(std::string_view message);

// `data` is omitted from the frame when the sender did not supply one.
std::string relayed(std::string_view type, const std::string& sender,
                    const std::optional<boost::json::value>& data);

// Client -> server frame after validation.
struct Signal {
    enum class Status { Ok, InvalidJson, InvalidType };

    Status status = Status::InvalidJson;
    std::string type;
    std::optional<boost::json::value> data;
};

bool is_relayable_type(std::string_view type) noexcept;
Signal parse_signal(std::string_view raw);

} // namespace signalrelay::relay::messages
