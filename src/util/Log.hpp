#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace signalrelay::util {

inline std::string iso_timestamp_utc() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool on) noexcept { verbose_flag().store(on); }
inline bool verbose() noexcept { return verbose_flag().load(); }

// Worker threads share std::cerr; one line per call.
inline void log(std::string_view msg) {
    static std::mutex mu;
    const std::string stamp = iso_timestamp_utc();
    std::lock_guard<std::mutex> lk(mu);
    std::cerr << "[" << stamp << "] " << msg << "\n";
}

inline void debug(std::string_view msg) {
    if (verbose()) log(msg);
}

} // namespace signalrelay::util
