/**
 * @file log_template.hpp
 * @brief Message template parsing and property extraction
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A message template contains placeholders of the form {Name} or
 * {Name:format}. Each placeholder occurrence consumes one argument, left to
 * right. The argument is rendered into the message and captured as a
 * structured property under Name.
 *
 * Format suffixes:
 * - "l" / "u" (any case): lower / upper case the rendered text
 * - anything else: used as an fmt format spec for numbers and timestamps
 *   (e.g. {Elapsed:.2f}, {Id:08x}, {When:%Y-%m-%d}); a spec fmt rejects
 *   falls back to the plain rendering
 *
 * @code
 * std::array<log_value, 2> args{int64_t{123}, std::string("10.0.0.1")};
 * auto r = parse_template("User {Id} from {Ip}", args);
 * // r.message    == "User 123 from 10.0.0.1"
 * // r.properties == {Id: 123, Ip: "10.0.0.1"}
 * @endcode
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "log_types.hpp"
#include "log_value.hpp"

namespace sluice
{

struct template_parse_result
{
    std::string message;
    log_properties properties;
};

namespace detail
{

/**
 * @brief Locate the next placeholder at or after pos
 * @return true with open/close set to the brace positions, false when none remain
 */
inline bool next_placeholder(std::string_view tmpl, size_t pos, size_t &open, size_t &close)
{
    while (pos < tmpl.size())
    {
        open = tmpl.find('{', pos);
        if (open == std::string_view::npos) return false;

        close = tmpl.find('}', open + 1);
        if (close == std::string_view::npos) return false;

        // "{}" is not a placeholder
        if (close > open + 1) return true;
        pos = open + 1;
    }
    return false;
}

inline std::string_view clean_property_name(std::string_view token)
{
    auto colon = token.find(':');
    return colon == std::string_view::npos ? token : token.substr(0, colon);
}

inline std::string apply_format_spec(const log_value &value, std::string_view spec)
{
    std::string plain = to_display_string(value);

    if (spec.size() == 1)
    {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(spec[0])));
        if (c == 'l')
        {
            std::transform(plain.begin(), plain.end(), plain.begin(), [](unsigned char ch) { return std::tolower(ch); });
            return plain;
        }
        if (c == 'u')
        {
            std::transform(plain.begin(), plain.end(), plain.begin(), [](unsigned char ch) { return std::toupper(ch); });
            return plain;
        }
    }

    std::string fmt_str = fmt::format("{{:{}}}", spec);
    try
    {
        return std::visit(
            [&](const auto &v) -> std::string
            {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, int64_t> || std::is_same_v<V, uint64_t> || std::is_same_v<V, double>)
                {
                    return fmt::format(fmt::runtime(fmt_str), v);
                }
                else if constexpr (std::is_same_v<V, log_timestamp>)
                {
                    return fmt::format(fmt::runtime(fmt_str), fmt::gmtime(log_clock::to_time_t(v)));
                }
                else { return plain; }
            },
            value);
    }
    catch (const fmt::format_error &)
    {
        return plain;
    }
}

inline std::string render_value(const log_value &value, std::string_view token)
{
    if (std::holds_alternative<std::nullptr_t>(value)) return "null";

    auto colon = token.find(':');
    if (colon != std::string_view::npos && colon + 1 < token.size())
    {
        return apply_format_spec(value, token.substr(colon + 1));
    }
    return to_display_string(value);
}

} // namespace detail

/**
 * @brief Render a template and capture its properties
 * @param tmpl Message template
 * @param args Arguments in placeholder order
 *
 * Placeholders beyond the last argument stay verbatim. When a name repeats,
 * the first argument bound to it is the captured property; every occurrence
 * is still rendered with its own argument.
 */
inline template_parse_result parse_template(std::string_view tmpl, std::span<const log_value> args)
{
    template_parse_result result;
    if (tmpl.empty()) return result;

    result.message.reserve(tmpl.size());

    size_t pos     = 0;
    size_t arg_idx = 0;
    size_t open = 0, close = 0;

    while (arg_idx < args.size() && detail::next_placeholder(tmpl, pos, open, close))
    {
        std::string_view token = tmpl.substr(open + 1, close - open - 1);
        const log_value &value = args[arg_idx++];

        add_property(result.properties, detail::clean_property_name(token), value);

        result.message.append(tmpl.substr(pos, open - pos));
        result.message.append(detail::render_value(value, token));
        pos = close + 1;
    }

    result.message.append(tmpl.substr(pos));
    return result;
}

/**
 * @brief Distinct property names of a template, in order of first appearance
 */
inline std::vector<std::string> extract_property_names(std::string_view tmpl)
{
    std::vector<std::string> names;
    size_t pos  = 0;
    size_t open = 0, close = 0;

    while (detail::next_placeholder(tmpl, pos, open, close))
    {
        std::string name(detail::clean_property_name(tmpl.substr(open + 1, close - open - 1)));
        if (std::find(names.begin(), names.end(), name) == names.end()) { names.push_back(std::move(name)); }
        pos = close + 1;
    }
    return names;
}

} // namespace sluice
