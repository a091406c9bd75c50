/**
 * @file log_diagnostics.hpp
 * @brief Fallback channel for failures inside the logging pipeline itself
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A destination that fails cannot report through the pipeline it belongs to.
 * Such failures are formatted here and handed to a process-wide handler, by
 * default a line on stderr.
 */
#pragma once

#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include "log_types.hpp"

namespace sluice
{

using diagnostic_handler = std::function<void(std::string_view)>;

namespace detail
{

struct diagnostic_state
{
    std::mutex mutex;
    diagnostic_handler handler;

    static diagnostic_state &instance()
    {
        static diagnostic_state state_;
        return state_;
    }
};

} // namespace detail

/**
 * @brief Replace the diagnostic handler
 * @param handler New handler, or an empty function to restore stderr output
 * @return The previous handler
 */
inline diagnostic_handler set_diagnostic_handler(diagnostic_handler handler)
{
    auto &state = detail::diagnostic_state::instance();
    std::lock_guard lock(state.mutex);
    std::swap(state.handler, handler);
    return handler;
}

/**
 * @brief Report an internal failure
 *
 * Calls are serialised; a handler never runs concurrently with itself.
 * A throwing handler is not allowed to escape: the line falls back to stderr.
 */
template <typename... Args>
void report_internal_error(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    auto &state = detail::diagnostic_state::instance();
    try
    {
        std::string line = fmt::format(fmt_str, std::forward<Args>(args)...);

        std::lock_guard lock(state.mutex);
        if (state.handler) { state.handler(line); }
        else { fmt::print(stderr, "[sluice] {}\n", line); }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[sluice] diagnostic failure: %s\n", e.what());
    }
}

} // namespace sluice
