#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace piiguard::utils {

// ============================================================================
// ASCII Character Classes (locale-independent)
// ============================================================================

inline constexpr bool is_ascii_upper(char c) { return c >= 'A' && c <= 'Z'; }
inline constexpr bool is_ascii_lower(char c) { return c >= 'a' && c <= 'z'; }
inline constexpr bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

inline constexpr char ascii_lower(char c) {
    return is_ascii_upper(c) ? static_cast<char>(c - 'A' + 'a') : c;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = ascii_lower(c);
    }
    return result;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
    }
    return true;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

// ============================================================================
// Numeric Parsing (std::from_chars: no exceptions, no locale, no allocations)
// ============================================================================

[[nodiscard]] inline std::optional<double> try_parse_double(std::string_view sv) {
    double result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a time point as UTC ISO-8601 with millisecond precision
 * (e.g. "2024-03-01T12:00:00.250Z").
 */
inline std::string format_iso8601_utc(const std::chrono::system_clock::time_point& tp) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch());
    auto ms = since_epoch.count() % 1000;
    auto secs = since_epoch.count() / 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    const auto time = static_cast<std::time_t>(secs);
    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms));
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < static_cast<int>(min_level().load(std::memory_order_relaxed))) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_min_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

inline Level min_level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

/**
 * @brief Parse "info" / "warn" / "error" (case-insensitive)
 */
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    if (iequals(name, "info")) return Level::INFO;
    if (iequals(name, "warn") || iequals(name, "warning")) return Level::WARN;
    if (iequals(name, "error")) return Level::ERROR;
    return std::nullopt;
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

/**
 * @brief Write a structured event line as-is
 *
 * Not subject to the minimum level and carries no timestamp or tag, so a
 * collector can parse each line as a standalone record.
 */
inline void event(const std::string& line) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    std::cerr << line << '\n';
}

} // namespace log

} // namespace piiguard::utils
