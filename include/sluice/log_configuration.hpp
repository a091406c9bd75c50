/**
 * @file log_configuration.hpp
 * @brief Fluent builders and JSON documents describing a logging pipeline
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Builders collect destination descriptions and validate all of them in
 * build(); nothing is opened before validation passes.
 *
 * @code
 * auto factory = sluice::logger_configuration{}
 *                    .minimum_level(sluice::log_level::debug)
 *                    .add_console()
 *                    .add_json_file("logs/app.jsonl", {.mode = sluice::write_mode::buffered})
 *                    .build();
 * auto log = factory->create_logger("startup");
 * @endcode
 *
 * The same pipeline as a JSON document:
 * @code
 * {
 *   "minimum_level": "debug",
 *   "queue_capacity": 1000,
 *   "destinations": [
 *     { "kind": "console", "colors": true },
 *     { "kind": "json", "path": "logs/app.jsonl", "write_mode": "buffered", "buffer_threshold": 50 }
 *   ]
 * }
 * @endcode
 * Destination keys: kind (console, text, json, sqlite), write_mode,
 * thread_safety, buffer_threshold, path, append, colors, stream (stdout,
 * stderr), pool_size, create_if_missing.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <unistd.h>
#include <tao/json.hpp>

#include "log_types.hpp"
#include "log_error.hpp"
#include "log_destination.hpp"
#include "log_console_destination.hpp"
#include "log_file_destinations.hpp"
#include "log_sqlite_destination.hpp"
#include "log_writers.hpp"
#include "log_factory.hpp"

namespace sluice
{

enum class destination_kind : uint8_t
{
    console,
    text,
    json,
    sqlite,
};

inline std::optional<destination_kind> destination_kind_from_string(std::string_view str)
{
    if (str == "console") return destination_kind::console;
    if (str == "text") return destination_kind::text;
    if (str == "json") return destination_kind::json;
    if (str == "sqlite") return destination_kind::sqlite;
    return std::nullopt;
}

/**
 * @brief Description of one destination, turned into an instance by build()
 */
struct destination_spec
{
    destination_kind kind = destination_kind::console;
    destination_options options;
    console_options console;
    std::string path;
    bool append            = false;
    size_t pool_size       = DEFAULT_POOL_SIZE;
    bool create_if_missing = true;
};

/**
 * @brief Builder state shared by the sync and async configurations
 */
template <typename Derived> class basic_logger_configuration
{
  public:
    Derived &minimum_level(log_level level)
    {
        minimum_ = level;
        return self();
    }

    Derived &add_console(destination_options options = {}, console_options console = {})
    {
        specs_.push_back(destination_spec{.kind = destination_kind::console, .options = options, .console = console});
        return self();
    }

    Derived &add_text_file(std::string path, destination_options options = {}, bool append = false)
    {
        specs_.push_back(destination_spec{
            .kind = destination_kind::text, .options = options, .path = std::move(path), .append = append});
        return self();
    }

    Derived &add_json_file(std::string path, destination_options options = {}, bool append = false)
    {
        specs_.push_back(destination_spec{
            .kind = destination_kind::json, .options = options, .path = std::move(path), .append = append});
        return self();
    }

    Derived &add_sqlite(std::string path,
                        destination_options options = {},
                        size_t pool_size            = DEFAULT_POOL_SIZE,
                        bool create_if_missing      = true)
    {
        specs_.push_back(destination_spec{.kind              = destination_kind::sqlite,
                                          .options           = options,
                                          .path              = std::move(path),
                                          .pool_size         = pool_size,
                                          .create_if_missing = create_if_missing});
        return self();
    }

    Derived &add_destination(destination_spec spec)
    {
        specs_.push_back(std::move(spec));
        return self();
    }

    /// Use an already constructed destination, e.g. an application specific one
    Derived &add_destination(std::shared_ptr<buffered_destination> dest)
    {
        if (!dest) { throw config_error("destination must not be null"); }
        custom_.push_back(std::move(dest));
        return self();
    }

    log_level minimum() const { return minimum_; }
    const std::vector<destination_spec> &destination_specs() const { return specs_; }

    /**
     * @brief Check every description without opening anything
     * @throws config_error describing the first problem found
     */
    void validate() const
    {
        if (specs_.empty() && custom_.empty()) { throw config_error("at least one log destination is required"); }

        for (const auto &spec : specs_)
        {
            if (spec.options.buffer_threshold == 0) { throw config_error("buffer threshold must be at least 1"); }
            if (spec.kind != destination_kind::console) { validate_log_path(spec.path); }
            if (spec.kind == destination_kind::sqlite && spec.pool_size == 0)
            {
                throw config_error("connection pool size must be greater than zero");
            }
        }
    }

  protected:
    /**
     * @brief Validate, then open every destination in declaration order
     * @throws config_error, sink_init_error
     */
    std::vector<std::shared_ptr<buffered_destination>> create_destinations() const
    {
        validate();

        std::vector<std::shared_ptr<buffered_destination>> result;
        result.reserve(specs_.size() + custom_.size());

        for (const auto &spec : specs_)
        {
            switch (spec.kind)
            {
            case destination_kind::console:
                result.push_back(std::make_shared<console_destination>(spec.options, spec.console));
                break;
            case destination_kind::text:
                result.push_back(std::make_shared<text_file_destination>(
                    spec.options, file_options{.path = spec.path, .append = spec.append}));
                break;
            case destination_kind::json:
                result.push_back(std::make_shared<json_file_destination>(
                    spec.options, file_options{.path = spec.path, .append = spec.append}));
                break;
            case destination_kind::sqlite:
                result.push_back(std::make_shared<sqlite_destination>(
                    spec.options,
                    sqlite_options{
                        .path = spec.path, .pool_size = spec.pool_size, .create_if_missing = spec.create_if_missing}));
                break;
            }
        }

        for (const auto &dest : custom_) { result.push_back(dest); }
        return result;
    }

    log_level minimum_ = log_level::info;
    std::vector<destination_spec> specs_;
    std::vector<std::shared_ptr<buffered_destination>> custom_;

  private:
    Derived &self() { return static_cast<Derived &>(*this); }
};

/**
 * @brief Builder for a synchronous logger_factory
 */
class logger_configuration : public basic_logger_configuration<logger_configuration>
{
  public:
    std::unique_ptr<logger_factory> build() const
    {
        auto created = create_destinations();
        std::vector<std::shared_ptr<log_destination>> destinations(created.begin(), created.end());
        return std::make_unique<logger_factory>(std::move(destinations), minimum_);
    }
};

/**
 * @brief Builder for an async_logger_factory
 */
class async_logger_configuration : public basic_logger_configuration<async_logger_configuration>
{
  public:
    async_logger_configuration &queue_capacity(size_t capacity)
    {
        queue_capacity_ = capacity;
        return *this;
    }

    size_t queue_capacity() const { return queue_capacity_; }

    std::unique_ptr<async_logger_factory> build() const
    {
        if (queue_capacity_ == 0) { throw config_error("async queue capacity must be at least 1"); }

        auto created = create_destinations();
        std::vector<std::shared_ptr<async_log_destination>> destinations(created.begin(), created.end());
        return std::make_unique<async_logger_factory>(std::move(destinations), minimum_, queue_capacity_);
    }

  private:
    size_t queue_capacity_ = DEFAULT_QUEUE_CAPACITY;
};

namespace detail
{

inline const tao::json::value *find_member(const tao::json::value &obj, const std::string &key)
{
    return obj.find(key);
}

inline std::string json_string(const tao::json::value &obj, const std::string &key, std::string fallback = {})
{
    auto *v = find_member(obj, key);
    if (!v) return fallback;
    if (!v->is_string()) { throw config_error("\"" + key + "\" must be a string"); }
    return v->get_string();
}

inline bool json_bool(const tao::json::value &obj, const std::string &key, bool fallback)
{
    auto *v = find_member(obj, key);
    if (!v) return fallback;
    if (!v->is_boolean()) { throw config_error("\"" + key + "\" must be true or false"); }
    return v->get_boolean();
}

inline size_t json_size(const tao::json::value &obj, const std::string &key, size_t fallback)
{
    auto *v = find_member(obj, key);
    if (!v) return fallback;
    if (v->is_unsigned()) return static_cast<size_t>(v->get_unsigned());
    if (v->is_signed() && v->get_signed() >= 0) return static_cast<size_t>(v->get_signed());
    throw config_error("\"" + key + "\" must be a positive integer");
}

inline destination_spec destination_from_json(const tao::json::value &obj)
{
    if (!obj.is_object()) { throw config_error("each destination must be a JSON object"); }

    destination_spec spec;

    auto kind_name = json_string(obj, "kind");
    auto kind      = destination_kind_from_string(kind_name);
    if (!kind) { throw config_error("unknown destination kind: \"" + kind_name + "\""); }
    spec.kind = *kind;

    auto mode_name = json_string(obj, "write_mode", "immediate");
    auto mode      = write_mode_from_string(mode_name);
    if (!mode) { throw config_error("unknown write_mode: \"" + mode_name + "\""); }
    spec.options.mode = *mode;

    auto safety_name = json_string(obj, "thread_safety", "thread_safe");
    auto safety      = thread_safety_from_string(safety_name);
    if (!safety) { throw config_error("unknown thread_safety: \"" + safety_name + "\""); }
    spec.options.safety = *safety;

    spec.options.buffer_threshold = json_size(obj, "buffer_threshold", DEFAULT_BUFFER_THRESHOLD);

    spec.path              = json_string(obj, "path");
    spec.append            = json_bool(obj, "append", false);
    spec.pool_size         = json_size(obj, "pool_size", DEFAULT_POOL_SIZE);
    spec.create_if_missing = json_bool(obj, "create_if_missing", true);

    spec.console.use_colors = json_bool(obj, "colors", true);
    auto stream             = json_string(obj, "stream", "stdout");
    if (stream == "stdout") { spec.console.fd = STDOUT_FILENO; }
    else if (stream == "stderr") { spec.console.fd = STDERR_FILENO; }
    else { throw config_error("unknown console stream: \"" + stream + "\""); }

    return spec;
}

template <typename Config> Config configuration_from_value(const tao::json::value &doc)
{
    if (!doc.is_object()) { throw config_error("logging configuration must be a JSON object"); }

    Config config;

    auto level_name = json_string(doc, "minimum_level", "info");
    auto level      = log_level_from_string(level_name);
    if (!level) { throw config_error("unknown log level: \"" + level_name + "\""); }
    config.minimum_level(*level);

    if constexpr (requires { config.queue_capacity(size_t{}); })
    {
        config.queue_capacity(json_size(doc, "queue_capacity", DEFAULT_QUEUE_CAPACITY));
    }

    auto *dests = find_member(doc, "destinations");
    if (!dests || !dests->is_array()) { throw config_error("\"destinations\" must be an array"); }
    for (const auto &d : dests->get_array()) { config.add_destination(destination_from_json(d)); }

    config.validate();
    return config;
}

} // namespace detail

/**
 * @brief Parse a JSON configuration document
 * @tparam Config logger_configuration or async_logger_configuration
 * @throws config_error on malformed JSON or invalid settings
 */
template <typename Config = logger_configuration> Config configuration_from_json(std::string_view text)
{
    tao::json::value doc;
    try
    {
        doc = tao::json::from_string(text);
    }
    catch (const std::exception &e)
    {
        throw config_error(std::string("invalid logging configuration JSON: ") + e.what());
    }
    return detail::configuration_from_value<Config>(doc);
}

/**
 * @brief Load a JSON configuration document from a file
 * @throws config_error when the file cannot be read or is invalid
 */
template <typename Config = logger_configuration> Config configuration_from_file(const std::string &path)
{
    if (!std::filesystem::exists(path)) { throw config_error("logging configuration file not found: " + path); }

    tao::json::value doc;
    try
    {
        doc = tao::json::from_file(path);
    }
    catch (const std::exception &e)
    {
        throw config_error("invalid logging configuration file " + path + ": " + e.what());
    }
    return detail::configuration_from_value<Config>(doc);
}

} // namespace sluice
