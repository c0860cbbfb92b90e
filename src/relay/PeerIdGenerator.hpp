#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace signalrelay::relay {

// Peer ids are "peer-" + a ULID (Crockford base32, 26 chars).
// Ids minted within the same millisecond are strictly increasing, so a single
// generator never hands out the same id twice.
class PeerIdGenerator {
public:
    static constexpr std::size_t kUlidLength = 26;

    PeerIdGenerator()
        : rng_(seed_engine_()) {}

    PeerIdGenerator(const PeerIdGenerator&) = delete;
    PeerIdGenerator& operator=(const PeerIdGenerator&) = delete;

    std::string next() {
        return "peer-" + next_ulid_();
    }

private:
    using u128 = unsigned __int128;
    using Bytes = std::array<std::uint8_t, 16>;

    std::string next_ulid_() {
        Bytes bytes{};
        const std::uint64_t ts_ms = now_ms_();

        // 48-bit big-endian timestamp
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (8 * (5 - i))) & 0xFF);
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                last_rand_ = random_80_();
            } else {
                ++last_rand_;
            }
            write_rand_80_(bytes, last_rand_);
        }

        return encode_(bytes);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // Called with mu_ held.
    u128 random_80_() {
        const std::uint64_t hi = dist64_(rng_) & 0xFFFF;
        const std::uint64_t lo = dist64_(rng_);
        return (static_cast<u128>(hi) << 64) | lo;
    }

    static void write_rand_80_(Bytes& bytes, u128 rand80) {
        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
    }

    // 128 bits -> 26 base32 digits; the leading digit carries the top 3 bits.
    static std::string encode_(const Bytes& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        u128 value = 0;
        for (std::uint8_t b : bytes) value = (value << 8) | b;

        std::string out(kUlidLength, '0');
        for (std::size_t i = kUlidLength; i-- > 0;) {
            out[i] = alphabet[static_cast<std::size_t>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace signalrelay::relay
