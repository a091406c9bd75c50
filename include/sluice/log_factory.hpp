/**
 * @file log_factory.hpp
 * @brief Per-category logger caches owning the destination set
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A factory owns a list of destinations and a minimum level and hands out one
 * logger per category. The first request for a category creates the logger;
 * later requests return the same instance.
 *
 * Closing a factory flushes and closes every logger it created, then closes
 * every destination. Failures along the way are reported on the diagnostic
 * channel and never propagated. Factories are created by the application and
 * passed to whoever needs loggers; there is no global instance.
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

#include "robin_hood.h"
#include "log_types.hpp"
#include "log_error.hpp"
#include "log_diagnostics.hpp"
#include "log_exception.hpp"
#include "log_destination.hpp"
#include "log_logger.hpp"
#include "log_async_logger.hpp"

namespace sluice
{

template <typename Logger, typename Destination> class basic_logger_factory
{
  public:
    using logger_ptr = std::shared_ptr<Logger>;

    /**
     * @throws config_error when destinations is empty
     */
    basic_logger_factory(std::vector<std::shared_ptr<Destination>> destinations, log_level minimum)
        : destinations_(std::move(destinations)), minimum_(minimum)
    {
        if (destinations_.empty()) { throw config_error("at least one log destination is required"); }
    }

    virtual ~basic_logger_factory() = default;

    basic_logger_factory(const basic_logger_factory &)            = delete;
    basic_logger_factory &operator=(const basic_logger_factory &) = delete;

    /**
     * @brief Get or create the logger for a category
     * @throws std::logic_error after close()
     */
    logger_ptr create_logger(std::string_view category)
    {
        if (closed_.load()) { throw std::logic_error("logger factory is closed"); }

        std::string key(category);

        // Try to find existing logger (read lock)
        {
            std::shared_lock lock(mutex_);
            auto it = loggers_.find(key);
            if (it != loggers_.end()) { return it->second; }
        }

        // Create new logger (write lock)
        std::unique_lock lock(mutex_);
        // close() may have taken its snapshot while we waited for the lock
        if (closed_.load()) { throw std::logic_error("logger factory is closed"); }

        // Double-check in case another thread created it
        auto it = loggers_.find(key);
        if (it != loggers_.end()) { return it->second; }

        auto created = make_logger(key, minimum_.load());
        loggers_.emplace(std::move(key), created);
        return created;
    }

    /// Logger whose category is the demangled name of T
    template <typename T> logger_ptr create_logger() { return create_logger(demangle_type_name(typeid(T).name())); }

    /**
     * @brief Set the minimum level of every cached logger and of loggers created later
     */
    void set_minimum_level(log_level level)
    {
        minimum_.store(level);
        std::shared_lock lock(mutex_);
        for (auto &[name, log] : loggers_) { log->set_minimum_level(level); }
    }

    log_level minimum_level() const { return minimum_.load(); }

    void flush()
    {
        for (auto &log : snapshot())
        {
            try
            {
                log->flush();
            }
            catch (const std::exception &e)
            {
                report_internal_error("flush of logger '{}' failed: {}", log->category(), e.what());
            }
            catch (...)
            {
                report_internal_error("flush of logger '{}' failed: unknown exception", log->category());
            }
        }
    }

    void close()
    {
        {
            // Serialise with creation so no logger appears after the snapshots below
            std::unique_lock lock(mutex_);
            if (closed_.exchange(true)) return;
        }

        flush();

        for (auto &log : snapshot())
        {
            try
            {
                log->close();
            }
            catch (const std::exception &e)
            {
                report_internal_error("close of logger '{}' failed: {}", log->category(), e.what());
            }
            catch (...)
            {
                report_internal_error("close of logger '{}' failed: unknown exception", log->category());
            }
        }

        for (auto &dest : destinations_)
        {
            try
            {
                close_destination(*dest);
            }
            catch (const std::exception &e)
            {
                report_internal_error("close of destination {} failed: {}", dest->name(), e.what());
            }
            catch (...)
            {
                report_internal_error("close of destination {} failed: unknown exception", dest->name());
            }
        }
    }

    bool is_closed() const { return closed_.load(); }

    size_t logger_count() const
    {
        std::shared_lock lock(mutex_);
        return loggers_.size();
    }

    const std::vector<std::shared_ptr<Destination>> &destinations() const { return destinations_; }

  protected:
    virtual logger_ptr make_logger(const std::string &category, log_level minimum) = 0;
    virtual void close_destination(Destination &dest) = 0;

    std::vector<std::shared_ptr<Destination>> destinations_;

  private:
    std::vector<logger_ptr> snapshot() const
    {
        std::shared_lock lock(mutex_);
        std::vector<logger_ptr> result;
        result.reserve(loggers_.size());
        for (auto &[name, log] : loggers_) { result.push_back(log); }
        return result;
    }

    robin_hood::unordered_map<std::string, logger_ptr> loggers_;
    mutable std::shared_mutex mutex_; // Allow concurrent lookups
    std::atomic<log_level> minimum_;
    std::atomic<bool> closed_{false};
};

/**
 * @brief Factory of synchronous loggers
 */
class logger_factory : public basic_logger_factory<logger, log_destination>
{
  public:
    logger_factory(std::vector<std::shared_ptr<log_destination>> destinations, log_level minimum = log_level::info)
        : basic_logger_factory(std::move(destinations), minimum)
    {
    }

    ~logger_factory() override { close(); }

  protected:
    logger_ptr make_logger(const std::string &category, log_level minimum) override
    {
        return std::make_shared<logger>(category, minimum, destinations_);
    }

    void close_destination(log_destination &dest) override { dest.close(); }
};

/**
 * @brief Factory of queued loggers, each with its own consumer thread
 */
class async_logger_factory : public basic_logger_factory<async_logger, async_log_destination>
{
  public:
    /**
     * @throws config_error when destinations is empty or queue_capacity is zero
     */
    async_logger_factory(std::vector<std::shared_ptr<async_log_destination>> destinations,
                         log_level minimum     = log_level::info,
                         size_t queue_capacity = DEFAULT_QUEUE_CAPACITY)
        : basic_logger_factory(std::move(destinations), minimum), queue_capacity_(queue_capacity)
    {
        if (queue_capacity_ == 0) { throw config_error("async queue capacity must be at least 1"); }
    }

    ~async_logger_factory() override { close(); }

    size_t queue_capacity() const { return queue_capacity_; }

  protected:
    logger_ptr make_logger(const std::string &category, log_level minimum) override
    {
        return std::make_shared<async_logger>(category, minimum, destinations_, queue_capacity_);
    }

    void close_destination(async_log_destination &dest) override { dest.close_async().wait(); }

  private:
    size_t queue_capacity_;
};

} // namespace sluice
