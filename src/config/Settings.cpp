#include "config/Settings.h"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace signalrelay::config {

namespace {

std::optional<unsigned long> parse_positive(std::string_view text, unsigned long max) {
    if (text.empty()) return std::nullopt;
    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > max) return std::nullopt;
    }
    if (value == 0) return std::nullopt;
    return value;
}

std::optional<double> parse_positive_seconds(std::string_view text) {
    if (text.empty()) return std::nullopt;
    const std::string copy(text);
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size() || !(value > 0) || !std::isfinite(value)) return std::nullopt;
    return value;
}

bool parse_flag(std::string_view text) {
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

template <typename T>
void env_number(const Settings::Getenv& getenv, const char* name, T& field, unsigned long max) {
    if (const char* v = getenv(name)) {
        if (auto parsed = parse_positive(v, max)) field = static_cast<T>(*parsed);
    }
}

template <typename T>
T require_number(std::string_view flag, std::string_view text, unsigned long max) {
    auto parsed = parse_positive(text, max);
    if (!parsed) {
        throw std::invalid_argument("invalid value for " + std::string(flag) + ": '" + std::string(text) + "'");
    }
    return static_cast<T>(*parsed);
}

} // namespace

Settings Settings::from_environment() {
    return from_environment([](const char* name) { return std::getenv(name); });
}

Settings Settings::from_environment(const Getenv& getenv) {
    Settings s;
    constexpr auto kUintMax = std::numeric_limits<unsigned>::max();

    if (const char* host = getenv("SIGNALRELAY_HOST"); host && *host) s.host = host;
    env_number(getenv, "SIGNALRELAY_PORT", s.port, 65535);
    env_number(getenv, "SIGNALRELAY_THREADS", s.threads, 256);
    env_number(getenv, "ROOM_TTL_SECONDS", s.room_ttl_seconds, kUintMax);
    env_number(getenv, "RATE_LIMIT_MESSAGES_PER_SECOND", s.rate_limit, kUintMax);
    env_number(getenv, "SIGNALRELAY_MAX_MESSAGE_BYTES", s.max_message_bytes, kUintMax);
    env_number(getenv, "SIGNALRELAY_MAX_PENDING_WRITES", s.max_pending_writes, kUintMax);

    if (const char* ttl = getenv("PAIRING_TTL_SECONDS")) {
        if (auto parsed = parse_positive_seconds(ttl)) s.pairing_ttl_seconds = *parsed;
    }
    if (const char* v = getenv("SIGNALRELAY_VERBOSE")) s.verbose = parse_flag(v);
    return s;
}

ArgsResult apply_args(Settings& settings, int argc, const char* const* argv) {
    constexpr auto kUintMax = std::numeric_limits<unsigned>::max();

    for (int i = 1; i < argc; ++i) {
        const std::string_view a = argv[i];

        if (a == "--help" || a == "-h") return ArgsResult::Help;
        if (a == "--verbose" || a == "-v") {
            settings.verbose = true;
            continue;
        }

        if (i + 1 >= argc) throw std::invalid_argument("missing value for " + std::string(a));
        const std::string_view v = argv[++i];

        if (a == "--host") {
            if (v.empty()) throw std::invalid_argument("invalid value for --host: ''");
            settings.host = std::string(v);
        } else if (a == "--port") {
            settings.port = require_number<std::uint16_t>(a, v, 65535);
        } else if (a == "--threads") {
            settings.threads = require_number<unsigned>(a, v, 256);
        } else if (a == "--room-ttl") {
            settings.room_ttl_seconds = require_number<unsigned>(a, v, kUintMax);
        } else if (a == "--rate-limit") {
            settings.rate_limit = require_number<unsigned>(a, v, kUintMax);
        } else if (a == "--pairing-ttl") {
            auto parsed = parse_positive_seconds(v);
            if (!parsed) throw std::invalid_argument("invalid value for --pairing-ttl: '" + std::string(v) + "'");
            settings.pairing_ttl_seconds = *parsed;
        } else if (a == "--max-message-bytes") {
            settings.max_message_bytes = require_number<std::size_t>(a, v, kUintMax);
        } else if (a == "--max-pending-writes") {
            settings.max_pending_writes = require_number<std::size_t>(a, v, kUintMax);
        } else {
            throw std::invalid_argument("unknown argument: " + std::string(a));
        }
    }
    return ArgsResult::Run;
}

std::string usage(std::string_view program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --host <addr>               bind address (SIGNALRELAY_HOST, default 0.0.0.0)\n"
        << "  --port <n>                  listen port (SIGNALRELAY_PORT, default 8787)\n"
        << "  --threads <n>               worker threads (SIGNALRELAY_THREADS, default 1)\n"
        << "  --room-ttl <sec>            idle room lifetime (ROOM_TTL_SECONDS, default 60)\n"
        << "  --rate-limit <n>            messages per second per peer (RATE_LIMIT_MESSAGES_PER_SECOND, default 10)\n"
        << "  --pairing-ttl <sec>         default pairing code lifetime (PAIRING_TTL_SECONDS, default 300)\n"
        << "  --max-message-bytes <n>     largest accepted WebSocket message (default 65536)\n"
        << "  --max-pending-writes <n>    queued frames before a peer is dropped (default 256)\n"
        << "  -v, --verbose               log joins, leaves and sweeps\n"
        << "  -h, --help                  show this help\n";
    return out.str();
}

} // namespace signalrelay::config
