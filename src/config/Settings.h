#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace signalrelay::config {

struct Settings {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8787;
    unsigned threads = 1;

    unsigned room_ttl_seconds = 60;
    unsigned rate_limit = 10;          // messages per second per peer
    double pairing_ttl_seconds = 300;  // used when a registration names none

    std::size_t max_message_bytes = 64 * 1024;
    std::size_t max_pending_writes = 256;

    bool verbose = false;

    using Getenv = std::function<const char*(const char*)>;

    // Unset or unparsable variables keep their defaults.
    static Settings from_environment();
    static Settings from_environment(const Getenv& getenv);
};

enum class ArgsResult { Run, Help };

// Command-line flags override the environment. Throws std::invalid_argument
// on an unknown flag, a missing value, or a value out of range.
ArgsResult apply_args(Settings& settings, int argc, const char* const* argv);

std::string usage(std::string_view program);

} // namespace signalrelay::config
