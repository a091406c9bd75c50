/**
 * @file log_formatters.hpp
 * @brief Entry formatting for the text and JSON-lines destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <array>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <tao/json/events/to_stream.hpp>
#include <tao/json/events/to_pretty_stream.hpp>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_entry.hpp"

namespace sluice
{

/**
 * @brief Plain text line formatter
 *
 * Produces "[timestamp] [CODE] category: message" followed by the exception
 * text, optionally wrapped in the level's ANSI colour.
 */
class text_formatter
{
  public:
    bool use_color   = false;
    bool add_newline = true;

    std::string format(const log_entry &entry) const
    {
        std::string out;
        const char *color = use_color ? log_level_colors[static_cast<size_t>(entry.level)] : "";
        bool colored      = color[0] != '\0';

        if (colored) out += color;
        out += format_text_line(entry);
        if (colored) out += "\033[0m";
        if (add_newline) out += '\n';
        return out;
    }
};

/**
 * @brief Emit a log_value as a JSON event
 */
template <typename Consumer> void produce_log_value(Consumer &c, const log_value &value)
{
    std::visit(
        [&c](const auto &v)
        {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>) { c.null(); }
            else if constexpr (std::is_same_v<V, bool>) { c.boolean(v); }
            else if constexpr (std::is_same_v<V, int64_t>) { c.number(static_cast<std::int64_t>(v)); }
            else if constexpr (std::is_same_v<V, uint64_t>) { c.number(static_cast<std::uint64_t>(v)); }
            else if constexpr (std::is_same_v<V, double>) { c.number(v); }
            else if constexpr (std::is_same_v<V, std::string>) { c.string(v); }
            else if constexpr (std::is_same_v<V, log_timestamp>) { c.string(format_timestamp_precise(v)); }
        },
        value);
}

/**
 * @brief Emit a property map as a JSON object
 */
template <typename Consumer> void produce_log_properties(Consumer &c, const log_properties &props)
{
    c.begin_object();
    for (const auto &[name, value] : props)
    {
        c.key(name);
        produce_log_value(c, value);
        c.member();
    }
    c.end_object();
}

template <typename Consumer> void produce_exception(Consumer &c, const log_exception_info *ex)
{
    if (!ex)
    {
        c.null();
        return;
    }

    c.begin_object();
    c.key("type");
    c.string(ex->type);
    c.member();
    c.key("message");
    c.string(ex->message);
    c.member();
    c.key("stackTrace");
    if (ex->stack_trace.empty()) { c.null(); }
    else { c.string(ex->stack_trace); }
    c.member();
    c.key("innerException");
    produce_exception(c, ex->inner.get());
    c.member();
    c.end_object();
}

/**
 * @brief JSON formatter using taocpp/json library
 *
 * One object per entry with the fixed fields first:
 * - "@timestamp", "@level", "@category", "@message", "@messageTemplate"
 * - "eventId": {"id", "name"}
 * - each message property as "@Name" (names already starting with '@' are kept)
 * - each scope property as "scope.Name"
 * - "exception" when the entry carries one
 *
 * A property whose key collides with a fixed field, or with a key already
 * written ("@Id" and "Id" both map to "@Id"), is skipped.
 *
 * Usage:
 * @code
 * json_formatter formatter;
 * formatter.pretty_print = true;  // Enable pretty printing
 * formatter.add_newline  = true;  // Add newline after JSON
 * @endcode
 */
class json_formatter
{
  public:
    bool pretty_print = false;
    bool add_newline  = true;

    static constexpr std::array<std::string_view, 7> reserved_keys = {
        "@timestamp", "@level", "@category", "@message", "@messageTemplate", "eventId", "exception",
    };

    static bool is_reserved(std::string_view key)
    {
        for (auto k : reserved_keys)
        {
            if (k == key) return true;
        }
        return false;
    }

    /**
     * @brief Produce JSON events for one entry
     *
     * Follows taocpp/json's producer pattern so any events consumer can be
     * used (stream, pretty stream, value builder).
     */
    template <typename Consumer> void produce_log_json(Consumer &c, const log_entry &entry) const
    {
        c.begin_object();

        c.key("@timestamp");
        c.string(format_timestamp_precise(entry.timestamp));
        c.member();

        c.key("@level");
        c.string(log_level_name(entry.level));
        c.member();

        c.key("@category");
        c.string(entry.category);
        c.member();

        c.key("@message");
        c.string(entry.message);
        c.member();

        c.key("@messageTemplate");
        if (entry.message_template) { c.string(*entry.message_template); }
        else { c.null(); }
        c.member();

        c.key("eventId");
        c.begin_object();
        c.key("id");
        c.number(static_cast<std::int64_t>(entry.event_id.id));
        c.member();
        c.key("name");
        if (entry.event_id.name.empty()) { c.null(); }
        else { c.string(entry.event_id.name); }
        c.member();
        c.end_object();
        c.member();

        std::set<std::string, std::less<>> emitted;
        for (const auto &[name, value] : entry.properties)
        {
            std::string key = (!name.empty() && name[0] == '@') ? name : "@" + name;
            if (is_reserved(key) || !emitted.insert(key).second) continue;
            c.key(key);
            produce_log_value(c, value);
            c.member();
        }

        for (const auto &[name, value] : entry.scope_properties)
        {
            c.key("scope." + name);
            produce_log_value(c, value);
            c.member();
        }

        if (entry.exception)
        {
            c.key("exception");
            produce_exception(c, entry.exception.get());
            c.member();
        }

        c.end_object();
    }

    std::string format(const log_entry &entry) const
    {
        std::ostringstream stream;

        if (pretty_print)
        {
            // Pretty print with 2-space indent
            tao::json::events::to_pretty_stream consumer(stream, 2);
            produce_log_json(consumer, entry);
        }
        else
        {
            tao::json::events::to_stream consumer(stream);
            produce_log_json(consumer, entry);
        }

        if (add_newline) { stream << '\n'; }
        return stream.str();
    }
};

/**
 * @brief Serialise a property map as compact JSON text
 */
inline std::string properties_to_json(const log_properties &props)
{
    std::ostringstream stream;
    tao::json::events::to_stream consumer(stream);
    produce_log_properties(consumer, props);
    return stream.str();
}

} // namespace sluice
