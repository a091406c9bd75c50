/**
 * @file sqlite_connection_pool.hpp
 * @brief Bounded pool of SQLite connections
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The pool hands out at most max_size connections at a time. A counting
 * semaphore with max_size permits bounds the number of checked-out handles;
 * idle connections rest in a lock-free queue. Connections are opened lazily,
 * so live connections (checked out + resting) never exceed max_size.
 *
 * @code
 * sqlite_connection_pool pool("logs/app.db", 4);
 * {
 *     auto conn = pool.acquire();   // blocks while 4 are checked out
 *     conn->execute("DELETE FROM LogEntries");
 * }                                 // returned to the pool here
 * @endcode
 *
 * @warning The pool must outlive every pooled_connection it hands out.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <sys/types.h>

#include "moodycamel/concurrentqueue.h"
#include "moodycamel/lightweightsemaphore.h"

#include "log_types.hpp"
#include "log_error.hpp"
#include "sqlite_connection.hpp"

namespace sluice
{

inline constexpr auto POOL_STOP_POLL_INTERVAL = std::chrono::milliseconds(10); // Stop-token check interval while blocked

class sqlite_connection_pool;

/**
 * @brief Checked-out connection; returns itself to the pool on destruction
 */
class pooled_connection
{
  public:
    pooled_connection(sqlite_connection_pool *pool, std::unique_ptr<sqlite_connection> conn)
        : pool_(pool), conn_(std::move(conn))
    {
    }

    pooled_connection(const pooled_connection &)            = delete;
    pooled_connection &operator=(const pooled_connection &) = delete;

    pooled_connection(pooled_connection &&other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)), conn_(std::move(other.conn_))
    {
    }

    pooled_connection &operator=(pooled_connection &&other) noexcept
    {
        if (this != &other)
        {
            release();
            pool_ = std::exchange(other.pool_, nullptr);
            conn_ = std::move(other.conn_);
        }
        return *this;
    }

    ~pooled_connection() { release(); }

    sqlite_connection *operator->() { return conn_.get(); }
    sqlite_connection &operator*() { return *conn_; }
    sqlite_connection *get() { return conn_.get(); }

  private:
    void release() noexcept;

    sqlite_connection_pool *pool_;
    std::unique_ptr<sqlite_connection> conn_;
};

class sqlite_connection_pool
{
  public:
    struct stats
    {
        size_t max_size;          ///< Configured maximum
        size_t live;              ///< Open connections, checked out or resting
        size_t resting;           ///< Open connections waiting in the pool
        size_t available_permits; ///< Checkouts possible without blocking
        uint64_t discarded;       ///< Connections closed because they were found unusable
    };

    /**
     * @param path Database file opened by every pooled connection
     * @param max_size Maximum live connections
     * @throws config_error when max_size is zero
     */
    explicit sqlite_connection_pool(std::string path,
                                    size_t max_size = DEFAULT_POOL_SIZE,
                                    int flags       = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)
        : path_(std::move(path)), max_size_(max_size), flags_(flags), permits_(0)
    {
        if (max_size_ == 0) { throw config_error("connection pool size must be greater than zero"); }
        permits_.signal(static_cast<ssize_t>(max_size_));
    }

    sqlite_connection_pool(const sqlite_connection_pool &)            = delete;
    sqlite_connection_pool &operator=(const sqlite_connection_pool &) = delete;

    ~sqlite_connection_pool() { close(); }

    /**
     * @brief Check out a connection, blocking until a permit is free
     * @throws std::logic_error after close(), sqlite_error when a new connection cannot be opened
     */
    pooled_connection acquire()
    {
        check_open();
        permits_.wait();
        return checkout();
    }

    /**
     * @brief Check out a connection, giving up after timeout
     * @return The connection, or std::nullopt when no permit became free in time
     */
    template <typename Rep, typename Period>
    std::optional<pooled_connection> try_acquire_for(std::chrono::duration<Rep, Period> timeout)
    {
        check_open();
        auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
        if (!permits_.wait(static_cast<std::int64_t>(usecs))) return std::nullopt;
        return checkout();
    }

    /**
     * @brief Check out a connection, giving up once stop is requested
     * @return The connection, or std::nullopt when stop was requested first
     */
    std::optional<pooled_connection> acquire(std::stop_token stop)
    {
        check_open();
        auto poll_usecs = std::chrono::duration_cast<std::chrono::microseconds>(POOL_STOP_POLL_INTERVAL).count();
        while (!permits_.wait(static_cast<std::int64_t>(poll_usecs)))
        {
            if (stop.stop_requested()) return std::nullopt;
        }
        if (stop.stop_requested())
        {
            permits_.signal();
            return std::nullopt;
        }
        return checkout();
    }

    /// Close all resting connections. Connections still checked out are closed as they come back.
    void close() noexcept
    {
        if (closed_.exchange(true)) return;

        std::unique_ptr<sqlite_connection> conn;
        while (resting_.try_dequeue(conn))
        {
            conn.reset();
            live_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    stats get_stats() const
    {
        return stats{
            .max_size          = max_size_,
            .live              = live_.load(std::memory_order_relaxed),
            .resting           = resting_.size_approx(),
            .available_permits = static_cast<size_t>(permits_.availableApprox()),
            .discarded         = discarded_.load(std::memory_order_relaxed),
        };
    }

    const std::string &path() const { return path_; }

  private:
    friend class pooled_connection;

    void check_open() const
    {
        if (closed_.load()) { throw std::logic_error("connection pool for " + path_ + " is closed"); }
    }

    // Caller holds one permit; it is released again if no connection can be produced
    pooled_connection checkout()
    {
        try
        {
            // A resting connection can go bad while idle (file replaced, disk gone)
            std::unique_ptr<sqlite_connection> conn;
            while (resting_.try_dequeue(conn))
            {
                if (conn->ping()) { return pooled_connection(this, std::move(conn)); }
                discard(std::move(conn));
            }

            conn = std::make_unique<sqlite_connection>(path_, flags_);
            live_.fetch_add(1, std::memory_order_relaxed);
            return pooled_connection(this, std::move(conn));
        }
        catch (...)
        {
            permits_.signal();
            throw;
        }
    }

    void give_back(std::unique_ptr<sqlite_connection> conn) noexcept
    {
        if (conn)
        {
            if (!conn->is_usable()) { discard(std::move(conn)); }
            else if (closed_.load() || !resting_.enqueue(std::move(conn)))
            {
                conn.reset();
                live_.fetch_sub(1, std::memory_order_relaxed);
            }
        }
        permits_.signal();
    }

    void discard(std::unique_ptr<sqlite_connection> conn) noexcept
    {
        conn.reset();
        live_.fetch_sub(1, std::memory_order_relaxed);
        discarded_.fetch_add(1, std::memory_order_relaxed);
    }

    std::string path_;
    size_t max_size_;
    int flags_;
    moodycamel::ConcurrentQueue<std::unique_ptr<sqlite_connection>> resting_;
    moodycamel::LightweightSemaphore permits_;
    std::atomic<size_t> live_{0};
    std::atomic<uint64_t> discarded_{0};
    std::atomic<bool> closed_{false};
};

inline void pooled_connection::release() noexcept
{
    if (!pool_) return;
    pool_->give_back(std::move(conn_));
    pool_ = nullptr;
}

} // namespace sluice
