#pragma once

#include <string>
#include <string_view>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <random>
#include <format>
#include <sstream>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace auditpipe::utils {

// ============================================================================
// UUID Generation
// ============================================================================

// RFC 4122 version 4 layout
inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Time Utilities
// ============================================================================

using TimePoint = std::chrono::system_clock::time_point;

inline TimePoint now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Format as ISO-8601 UTC with millisecond precision
 *        (e.g. 2026-03-01T08:15:30.250Z).
 */
inline std::string format_timestamp(const TimePoint& tp) {
    const auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    auto secs = ms_total / 1000;
    auto ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    const std::time_t time = static_cast<std::time_t>(secs);
    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms));
}

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" (a space may replace the 'T'),
 * an optional fractional second, and an optional zone suffix of 'Z',
 * "+HH", "+HHMM" or "+HH:MM". A missing zone is read as UTC.
 */
[[nodiscard]] inline std::optional<TimePoint> parse_timestamp(std::string_view s) {
    auto read_num = [&s](size_t pos, size_t len, int& out) {
        if (pos + len > s.size()) return false;
        const auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + pos + len, out);
        return ec == std::errc{} && ptr == s.data() + pos + len;
    };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_num(0, 4, year) || s.size() < 10 || s[4] != '-' ||
        !read_num(5, 2, month) || s[7] != '-' || !read_num(8, 2, day)) {
        return std::nullopt;
    }

    size_t pos = 10;
    int64_t micros = 0;
    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        if (!read_num(pos + 1, 2, hour) || s.size() < pos + 9 || s[pos + 3] != ':' ||
            !read_num(pos + 4, 2, minute) || s[pos + 6] != ':' ||
            !read_num(pos + 7, 2, second)) {
            return std::nullopt;
        }
        pos += 9;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            int64_t scale = 100000;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                micros += (s[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
    }

    int offset_minutes = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' && pos + 1 == s.size()) {
            pos = s.size();
        } else if (s[pos] == '+' || s[pos] == '-') {
            const int sign = (s[pos] == '-') ? -1 : 1;
            int oh = 0, om = 0;
            if (!read_num(pos + 1, 2, oh)) return std::nullopt;
            size_t rest = pos + 3;
            if (rest < s.size() && s[rest] == ':') ++rest;
            if (rest < s.size()) {
                if (!read_num(rest, 2, om) || rest + 2 != s.size()) return std::nullopt;
            }
            offset_minutes = sign * (oh * 60 + om);
        } else {
            return std::nullopt;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) return std::nullopt;

    TimePoint tp = std::chrono::sys_days{ymd};
    tp += std::chrono::hours{hour} + std::chrono::minutes{minute} +
          std::chrono::seconds{second} + std::chrono::microseconds{micros};
    tp -= std::chrono::minutes{offset_minutes};
    return tp;
}

// ============================================================================
// Numeric Parsing (std::from_chars: no exceptions, no locale, no allocations)
// ============================================================================

template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline T parse_int(std::string_view sv, T default_val = T{}) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    return (ec == std::errc{} && ptr == sv.data() + sv.size()) ? result : default_val;
}

// Returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

[[nodiscard]] inline std::optional<double> try_parse_double(std::string_view sv) {
    double result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// Decode hex string to bytes (returns empty on invalid input)
[[nodiscard]] inline std::vector<uint8_t> hex_to_bytes(std::string_view hex) {
    if (hex.size() < 2 || hex.size() % 2 != 0) return {};

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        unsigned int val{};
        const auto [ptr, ec] = std::from_chars(hex.data() + i, hex.data() + i + 2, val, 16);
        if (ec != std::errc{}) return {};
        bytes.push_back(static_cast<uint8_t>(val));
    }
    return bytes;
}

[[nodiscard]] inline std::string bytes_to_hex(const uint8_t* data, size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kHex[data[i] >> 4];
        out += kHex[data[i] & 0x0F];
    }
    return out;
}

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

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
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

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
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

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

// Unknown names leave the level unchanged and return false
inline bool set_level(std::string_view name) {
    const auto lower = to_lower(name);
    if (lower == "debug") set_level(Level::DEBUG);
    else if (lower == "info") set_level(Level::INFO);
    else if (lower == "warn" || lower == "warning") set_level(Level::WARN);
    else if (lower == "error") set_level(Level::ERROR);
    else return false;
    return true;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
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

} // namespace log

} // namespace auditpipe::utils
