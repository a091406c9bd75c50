/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging pipeline
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace sluice
{

// Destination buffering
inline constexpr size_t DEFAULT_BUFFER_THRESHOLD = 100; // Entries queued before a buffered destination auto-flushes

// Async logger queue
inline constexpr size_t DEFAULT_QUEUE_CAPACITY   = 1000;                          // Max entries waiting for the consumer
inline constexpr auto ENQUEUE_WAIT_TIMEOUT       = std::chrono::milliseconds(50); // Bounded wait on a full queue
inline constexpr auto FLUSH_WAIT_TIMEOUT         = std::chrono::seconds(5);       // Max wait for the consumer to pass a flush marker
inline constexpr auto CONSUMER_POLL_INTERVAL     = std::chrono::milliseconds(100);

// SQLite destination
inline constexpr size_t DEFAULT_POOL_SIZE = 10; // Max pooled connections per database

/**
 * @brief Concept for types that can be logged through fmt
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Enumeration of log levels in ascending order of severity
 *
 * none disables a threshold entirely and is never attached to an entry.
 */
enum class log_level : int8_t
{
    trace    = 0, ///< Finest-grained information
    debug    = 1, ///< Debugging information
    info     = 2, ///< General information
    warn     = 3, ///< Warning messages
    error    = 4, ///< Error messages
    critical = 5, ///< Failures requiring immediate attention
    none     = 6, ///< Logging disabled
};

inline constexpr size_t LOG_LEVEL_COUNT = 7;

// Four-letter codes used by the text formats
inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_codes = {
    "TRCE", "DBUG", "INFO", "WARN", "FAIL", "CRIT", "NONE",
};

// Full names used by the structured formats
inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_names = {
    "Trace", "Debug", "Information", "Warning", "Error", "Critical", "None",
};

inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_colors = {
    "",          // trace
    "",          // debug
    "",          // info
    "\033[33m",  // warn
    "\033[31m",  // error
    "\033[1;31m", // critical
    "",          // none
};

inline const char *log_level_code(log_level level)
{
    auto idx = static_cast<size_t>(level);
    return idx < LOG_LEVEL_COUNT ? log_level_codes[idx] : "????";
}

inline const char *log_level_name(log_level level)
{
    auto idx = static_cast<size_t>(level);
    return idx < LOG_LEVEL_COUNT ? log_level_names[idx] : "Unknown";
}

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or std::nullopt if the name is not recognized
 *
 * Recognized values: "trace", "debug", "info", "information", "warn", "warning",
 * "error", "fail", "critical", "crit", "fatal", "none", "off"
 */
inline std::optional<log_level> log_level_from_string(std::string_view str)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace" || lower == "trce") return log_level::trace;
    if (lower == "debug" || lower == "dbug") return log_level::debug;
    if (lower == "info" || lower == "information") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error" || lower == "fail") return log_level::error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return log_level::critical;
    if (lower == "none" || lower == "off") return log_level::none;

    return std::nullopt;
}

/**
 * @brief How a destination persists incoming entries
 */
enum class write_mode : uint8_t
{
    immediate, ///< Persist every entry the moment it arrives
    buffered,  ///< Queue entries, persist on threshold, flush or close
};

/**
 * @brief Synchronization a destination applies around writes and flushes
 */
enum class thread_safety : uint8_t
{
    thread_safe,     ///< One writer or flusher at a time
    not_thread_safe, ///< Caller guarantees single-threaded use
};

inline std::optional<write_mode> write_mode_from_string(std::string_view str)
{
    if (str == "immediate") return write_mode::immediate;
    if (str == "buffered") return write_mode::buffered;
    return std::nullopt;
}

inline std::optional<thread_safety> thread_safety_from_string(std::string_view str)
{
    if (str == "thread_safe") return thread_safety::thread_safe;
    if (str == "not_thread_safe") return thread_safety::not_thread_safe;
    return std::nullopt;
}

using log_clock     = std::chrono::system_clock;
using log_timestamp = log_clock::time_point;

} // namespace sluice
