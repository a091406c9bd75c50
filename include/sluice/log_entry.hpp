/**
 * @file log_entry.hpp
 * @brief Immutable log event record shared between destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_exception.hpp"

namespace sluice
{

/**
 * @brief Numeric id plus optional name identifying a kind of event
 */
struct log_event_id
{
    int32_t id = 0;
    std::string name;

    bool operator==(const log_event_id &) const = default;
};

/**
 * @brief One log event
 *
 * Created once by a logger and never mutated afterwards. Entries travel as
 * log_entry_ptr so that buffering destinations and the async queue can keep
 * them without copying.
 */
struct log_entry
{
    log_timestamp timestamp;
    log_level level = log_level::info;
    std::string category;
    log_event_id event_id;
    std::string message;
    std::optional<std::string> message_template;
    log_properties properties;
    log_properties scope_properties;
    std::shared_ptr<const log_exception_info> exception;
};

using log_entry_ptr = std::shared_ptr<const log_entry>;

/**
 * @brief Render an entry as a plain text line
 *
 * Format: "[timestamp] [CODE] category: message", exception text on the
 * following line. No trailing newline.
 */
inline std::string format_text_line(const log_entry &entry)
{
    std::string line = fmt::format("[{}] [{}] {}: {}",
                                   format_timestamp_text(entry.timestamp),
                                   log_level_code(entry.level),
                                   entry.category,
                                   entry.message);
    if (entry.exception)
    {
        line += '\n';
        line += entry.exception->to_string();
    }
    return line;
}

} // namespace sluice
