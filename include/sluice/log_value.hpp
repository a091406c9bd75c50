/**
 * @file log_value.hpp
 * @brief Structured property values and conversion from call-site arguments
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <chrono>

#include "log_types.hpp"

namespace sluice
{

/**
 * @brief A single structured value captured from a log call
 *
 * Arguments are normalised into one of a handful of alternatives so that
 * every destination can serialise them without knowing the caller's types.
 */
using log_value = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string, log_timestamp>;

/**
 * @brief Named structured properties of an entry or a scope
 *
 * Keys are unique. Use add_property() to insert; an existing name keeps its
 * original value.
 */
using log_properties = std::map<std::string, log_value, std::less<>>;

inline void add_property(log_properties &props, std::string_view name, log_value value)
{
    if (props.find(name) != props.end()) return;
    props.emplace(std::string(name), std::move(value));
}

template <typename T>
concept system_time_point = requires {
    typename T::clock;
    typename T::duration;
} && std::is_same_v<typename T::clock, log_clock>;

/**
 * @brief Convert a call-site argument into a log_value
 *
 * Arithmetic types keep their numeric representation, anything string-like
 * becomes a string, system_clock time points become timestamps. Any other
 * fmt-formattable type is rendered once to text.
 */
template <typename T>
log_value to_log_value(T &&arg)
{
    using U = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<U, log_value>) { return std::forward<T>(arg); }
    else if constexpr (std::is_same_v<U, std::nullptr_t>) { return nullptr; }
    else if constexpr (std::is_same_v<U, bool>) { return arg; }
    else if constexpr (std::is_same_v<U, char>) { return std::string(1, arg); }
    else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) { return static_cast<int64_t>(arg); }
    else if constexpr (std::is_integral_v<U>) { return static_cast<uint64_t>(arg); }
    else if constexpr (std::is_floating_point_v<U>) { return static_cast<double>(arg); }
    else if constexpr (std::is_enum_v<U>) { return static_cast<int64_t>(arg); }
    else if constexpr (std::is_convertible_v<T, std::string_view>)
    {
        if constexpr (std::is_pointer_v<U>)
        {
            if (arg == nullptr) return nullptr;
        }
        return std::string(std::string_view(arg));
    }
    else if constexpr (std::is_same_v<U, log_timestamp>) { return arg; }
    else if constexpr (system_time_point<U>)
    {
        return std::chrono::time_point_cast<log_clock::duration>(arg);
    }
    else
    {
        static_assert(Loggable<U>, "Argument type must be convertible to a log_value or formattable by fmt");
        return fmt::format("{}", arg);
    }
}

/**
 * @brief Render a timestamp as ISO-8601 UTC with 7 fractional digits
 *
 * Used by the structured destinations: 2026-10-19T18:01:02.1234567Z
 */
inline std::string format_timestamp_precise(log_timestamp ts)
{
    using namespace std::chrono;
    auto secs  = floor<seconds>(ts);
    auto ticks = duration_cast<nanoseconds>(ts - secs).count() / 100;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:07}Z", fmt::gmtime(log_clock::to_time_t(secs)), ticks);
}

/**
 * @brief Render a timestamp as ISO-8601 UTC with millisecond precision
 *
 * Used by the text formats: 2026-10-19T18:01:02.123Z
 */
inline std::string format_timestamp_text(log_timestamp ts)
{
    using namespace std::chrono;
    auto secs = floor<seconds>(ts);
    auto ms   = duration_cast<milliseconds>(ts - secs).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(log_clock::to_time_t(secs)), ms);
}

/**
 * @brief Plain text rendering of a value
 *
 * null renders as "null", booleans as "True"/"False".
 */
inline std::string to_display_string(const log_value &value)
{
    return std::visit(
        [](const auto &v) -> std::string
        {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>) { return "null"; }
            else if constexpr (std::is_same_v<V, bool>) { return v ? "True" : "False"; }
            else if constexpr (std::is_same_v<V, std::string>) { return v; }
            else if constexpr (std::is_same_v<V, log_timestamp>) { return format_timestamp_precise(v); }
            else { return fmt::format("{}", v); }
        },
        value);
}

} // namespace sluice
