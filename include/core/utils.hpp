#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relsync::utils {

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string to_upper(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    constexpr std::string_view ws = " \t\n\r";
    const auto first = str.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(ws);
    return std::string(str.substr(first, last - first + 1));
}

// Empty tokens are dropped
inline std::vector<std::string> split(std::string_view str, char delimiter) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= str.size()) {
        const auto end = std::min(str.find(delimiter, start), str.size());
        if (end > start) {
            tokens.emplace_back(str.substr(start, end - start));
        }
        start = end + 1;
    }
    return tokens;
}

/**
 * @brief Canonical form of an external page/database id.
 *
 * The source hands out ids both dashed (8-4-4-4-12) and compact, and
 * PostgreSQL prints UUID columns dashed. Every comparison goes through this.
 */
[[nodiscard]] inline std::string normalize_id(std::string_view id) {
    std::string result;
    result.reserve(id.size());
    for (const char c : id) {
        if (c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

/**
 * @brief Truncate to at most max_chars code points without splitting a
 * UTF-8 sequence.
 */
[[nodiscard]] inline std::string truncate_utf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (chars == max_chars) {
            return s.substr(0, i);
        }
        const auto lead = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        i += len;
        ++chars;
    }
    return s;
}

// Wall time since construction
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (stderr, one line per call, filtered by a process-wide level)
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO, WARN, ERROR };

namespace detail {
    inline constexpr std::array<std::string_view, 4> kTags{"DEBUG", "INFO ", "WARN ", "ERROR"};

    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    // HH:MM:SS.mmm, local time
    inline std::string clock_stamp() {
        const auto now = std::chrono::system_clock::now();
        const auto secs = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm local{};
        ::localtime_r(&secs, &local);
        return std::format("{:02d}:{:02d}:{:02d}.{:03d}",
            local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));
    }

    inline void emit(Level level, std::string_view msg) {
        if (level < threshold().load(std::memory_order_relaxed)) {
            return;
        }
        const auto line = std::format("{} [{}] {}\n",
            clock_stamp(), kTags[static_cast<size_t>(level)], msg);

        static std::mutex sink;
        std::lock_guard lock(sink);
        std::cerr << line;
    }
} // namespace detail

// Accepts "debug", "info", "warn"/"warning", "error" in any case
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

inline void debug(std::string_view msg) { detail::emit(Level::DEBUG, msg); }
inline void info(std::string_view msg)  { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg)  { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace relsync::utils
