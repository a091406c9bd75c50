/**
 * @file log_logger.hpp
 * @brief Logger front end and the synchronous logger
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A logger is bound to one category. A log call is checked against the
 * logger's minimum level first; arguments are only converted and the
 * template only parsed for enabled levels. Enabled calls produce one
 * immutable log_entry, enriched with the current scope properties, which is
 * handed to the concrete logger for delivery.
 *
 * @code
 * logger log("orders", log_level::info, destinations);
 * log.info("Order {OrderId} placed by {Customer}", 1042, "acme");
 * log.error(ex, "Payment for {OrderId} failed", 1042);
 * auto scope = log.begin_scope({{"RequestId", "r-17"}});
 * @endcode
 */
#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_value.hpp"
#include "log_entry.hpp"
#include "log_template.hpp"
#include "log_scope.hpp"
#include "log_destination.hpp"

namespace sluice
{

/**
 * @brief Category, level filter and entry construction shared by all loggers
 */
class basic_logger
{
  public:
    basic_logger(std::string category, log_level minimum) : category_(std::move(category)), minimum_(minimum) {}

    virtual ~basic_logger() = default;

    basic_logger(const basic_logger &)            = delete;
    basic_logger &operator=(const basic_logger &) = delete;

    const std::string &category() const { return category_; }

    log_level minimum_level() const { return minimum_.load(std::memory_order_relaxed); }
    void set_minimum_level(log_level level) { minimum_.store(level, std::memory_order_relaxed); }

    /// True when a call at level would produce an entry
    bool is_enabled(log_level level) const { return level != log_level::none && level >= minimum_level(); }

    template <typename... Args> void log(log_level level, std::string_view tmpl, Args &&...args)
    {
        if (!is_enabled(level)) return;
        emit(level, log_event_id{}, nullptr, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log(log_level level, const log_event_id &event_id, std::string_view tmpl, Args &&...args)
    {
        if (!is_enabled(level)) return;
        emit(level, event_id, nullptr, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log(log_level level, const std::exception &ex, std::string_view tmpl, Args &&...args)
    {
        if (!is_enabled(level)) return;
        emit(level, log_event_id{}, capture_exception(ex), tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log(log_level level,
             const log_event_id &event_id,
             const std::exception &ex,
             std::string_view tmpl,
             Args &&...args)
    {
        if (!is_enabled(level)) return;
        emit(level, event_id, capture_exception(ex), tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void trace(std::string_view tmpl, Args &&...args)
    {
        log(log_level::trace, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void debug(std::string_view tmpl, Args &&...args)
    {
        log(log_level::debug, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void info(std::string_view tmpl, Args &&...args)
    {
        log(log_level::info, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void warn(std::string_view tmpl, Args &&...args)
    {
        log(log_level::warn, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void error(std::string_view tmpl, Args &&...args)
    {
        log(log_level::error, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void error(const std::exception &ex, std::string_view tmpl, Args &&...args)
    {
        log(log_level::error, ex, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void critical(std::string_view tmpl, Args &&...args)
    {
        log(log_level::critical, tmpl, std::forward<Args>(args)...);
    }

    template <typename... Args> void critical(const std::exception &ex, std::string_view tmpl, Args &&...args)
    {
        log(log_level::critical, ex, tmpl, std::forward<Args>(args)...);
    }

    /// Forwards to sluice::begin_scope; scopes are per thread, not per logger
    template <typename... Args> scope_handle begin_scope(Args &&...args)
    {
        return sluice::begin_scope(std::forward<Args>(args)...);
    }

    scope_handle begin_scope(std::initializer_list<log_property> props) { return sluice::begin_scope(props); }

    virtual void flush() = 0;
    virtual void close() = 0;

  protected:
    /// Deliver a fully built entry to the destinations
    virtual void dispatch(log_entry_ptr entry) = 0;

  private:
    template <typename... Args>
    void emit(log_level level,
              const log_event_id &event_id,
              std::shared_ptr<const log_exception_info> exception,
              std::string_view tmpl,
              Args &&...args)
    {
        template_parse_result parsed;
        if constexpr (sizeof...(Args) == 0) { parsed = parse_template(tmpl, {}); }
        else
        {
            const log_value values[] = {to_log_value(std::forward<Args>(args))...};
            parsed                   = parse_template(tmpl, values);
        }

        if (parsed.message.empty() && !exception) return;

        auto entry              = std::make_shared<log_entry>();
        entry->timestamp        = log_clock::now();
        entry->level            = level;
        entry->category         = category_;
        entry->event_id         = event_id;
        entry->message          = std::move(parsed.message);
        entry->properties       = std::move(parsed.properties);
        entry->scope_properties = current_scope_properties();
        entry->exception        = std::move(exception);
        if (!tmpl.empty()) { entry->message_template = std::string(tmpl); }

        dispatch(std::move(entry));
    }

    std::string category_;
    std::atomic<log_level> minimum_;
};

/**
 * @brief Logger that writes to every destination on the calling thread
 *
 * Destinations are called in registration order. A failing destination
 * reports on the diagnostic channel and never stops the others.
 */
class logger : public basic_logger
{
  public:
    logger(std::string category, log_level minimum, std::vector<std::shared_ptr<log_destination>> destinations)
        : basic_logger(std::move(category), minimum), destinations_(std::move(destinations))
    {
    }

    ~logger() override { close(); }

    void flush() override
    {
        for (auto &dest : destinations_) { dest->flush(); }
    }

    /// Stops accepting entries and flushes. Destinations stay open; their owner closes them.
    void close() override
    {
        if (closed_.exchange(true)) return;
        flush();
    }

    bool is_closed() const { return closed_.load(); }

    const std::vector<std::shared_ptr<log_destination>> &destinations() const { return destinations_; }

  protected:
    void dispatch(log_entry_ptr entry) override
    {
        if (closed_.load(std::memory_order_acquire)) return;
        for (auto &dest : destinations_) { dest->write_log(entry); }
    }

  private:
    std::vector<std::shared_ptr<log_destination>> destinations_;
    std::atomic<bool> closed_{false};
};

} // namespace sluice
