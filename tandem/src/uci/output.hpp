#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace tandem::uci {

namespace detail {
inline std::mutex &outputMutex() {
    static std::mutex m;
    return m;
}
inline std::atomic<bool> &debugFlag() {
    static std::atomic<bool> flag{false};
    return flag;
}
} // namespace detail

// Writes one full line to stdout. The command loop and the search thread both
// print, so every line goes through this.
inline void send(std::string_view line) {
    std::lock_guard<std::mutex> lock(detail::outputMutex());
    std::cout << line << '\n' << std::flush;
}

inline void infoString(std::string_view text) {
    std::string line("info string ");
    line.append(text);
    send(line);
}

inline void setDebug(bool enabled) { detail::debugFlag().store(enabled, std::memory_order_relaxed); }
inline bool debugEnabled() { return detail::debugFlag().load(std::memory_order_relaxed); }

// "info string dbg=..." breadcrumb, printed only when the Debug option is on.
inline void debug(std::string_view text) {
    if (!debugEnabled()) return;
    std::string line("dbg=");
    line.append(text);
    infoString(line);
}

} // namespace tandem::uci
