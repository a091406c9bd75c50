/**
 * @file log_async_logger.hpp
 * @brief Logger that hands entries to a background consumer thread
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Log calls only enqueue. A single consumer thread per logger dequeues entries
 * and fans each one out to every destination's write_log_async(), waiting for
 * all of them before taking the next entry.
 *
 * The queue is bounded by a slot semaphore. When no slot frees up within
 * ENQUEUE_WAIT_TIMEOUT:
 * - error and critical entries are written directly on the calling thread
 * - anything else is dropped and counted
 *
 * A direct write can reach the destinations before entries still waiting in
 * the queue. Per producing thread, queued entries keep their order. Direct
 * writes and flushes still go through write_log_async() and flush_async(), so
 * a buffered_destination runs them on its writer thread, never alongside the
 * consumer's writes.
 *
 * Lifecycle: running -> draining (close() called, no new entries accepted,
 * the consumer finishes the backlog) -> stopped (consumer joined,
 * destinations flushed). There is no way back to running.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "moodycamel/concurrentqueue.h"
#include "moodycamel/blockingconcurrentqueue.h"
#include "moodycamel/lightweightsemaphore.h"

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_logger.hpp"
#include "log_destination.hpp"
#include "log_diagnostics.hpp"
#include "log_error.hpp"

namespace sluice
{

enum class async_logger_state : uint8_t
{
    running,
    draining,
    stopped,
};

inline const char *async_logger_state_name(async_logger_state state)
{
    switch (state)
    {
    case async_logger_state::running: return "running";
    case async_logger_state::draining: return "draining";
    case async_logger_state::stopped: return "stopped";
    }
    return "unknown";
}

class async_logger : public basic_logger
{
  public:
    /**
     * @brief Async logger statistics
     */
    struct stats
    {
        uint64_t enqueued;        ///< Entries accepted into the queue
        uint64_t dropped;         ///< Entries discarded (queue full or logger closed)
        uint64_t direct_writes;   ///< High severity entries written on the caller's thread
        size_t queue_size;        ///< Approximate entries waiting for the consumer
        async_logger_state state; ///< Current lifecycle state
    };

    /**
     * @param capacity Maximum entries waiting for the consumer
     * @throws config_error when capacity is zero
     */
    async_logger(std::string category,
                 log_level minimum,
                 std::vector<std::shared_ptr<async_log_destination>> destinations,
                 size_t capacity = DEFAULT_QUEUE_CAPACITY)
        : basic_logger(std::move(category), minimum),
          destinations_(std::move(destinations)),
          capacity_(capacity),
          slots_(0)
    {
        if (capacity_ == 0) { throw config_error("async queue capacity must be at least 1"); }
        slots_.signal(static_cast<ssize_t>(capacity_));
        worker_thread_ = std::thread(&async_logger::worker_thread_func, this);
    }

    ~async_logger() override { close(); }

    /**
     * @brief Wait until everything enqueued before this call reached the destinations, then flush them
     *
     * Bounded by FLUSH_WAIT_TIMEOUT; a stop request ends the wait early.
     * Destinations are flushed in either case.
     */
    void flush(std::stop_token stop)
    {
        active_producers_.fetch_add(1);
        if (state_.load() == async_logger_state::running)
        {
            uint64_t my_seq = 0;
            {
                std::lock_guard lk(flush_mutex_);
                my_seq = ++flush_seq_;
                queue_.enqueue(queue_item{.kind = item_kind::flush_marker, .seq = my_seq});
            }
            leave_producer();

            std::unique_lock lk(flush_mutex_);
            bool done = flush_cv_.wait_for(lk, stop, FLUSH_WAIT_TIMEOUT, [&] { return flush_done_ >= my_seq; });
            if (!done && !stop.stop_requested())
            {
                report_internal_error("{}: flush timed out waiting for the queue to drain", category());
            }
        }
        else { leave_producer(); }

        flush_destinations(stop);
    }

    void flush() override { flush(std::stop_token{}); }

    std::future<void> flush_async(std::stop_token stop = {})
    {
        return std::async(std::launch::async, [this, stop = std::move(stop)] { flush(stop); });
    }

    void close() override
    {
        auto expected = async_logger_state::running;
        if (!state_.compare_exchange_strong(expected, async_logger_state::draining)) return;

        // Producers that saw running finish their enqueue before the shutdown marker goes in
        for (int active = active_producers_.load(); active > 0; active = active_producers_.load())
        {
            active_producers_.wait(active);
        }

        queue_.enqueue(queue_item{.kind = item_kind::shutdown});
        if (worker_thread_.joinable()) { worker_thread_.join(); }

        flush_destinations({});
        state_.store(async_logger_state::stopped);
    }

    std::future<void> close_async()
    {
        return std::async(std::launch::async, [this] { close(); });
    }

    async_logger_state state() const { return state_.load(); }

    stats get_stats() const
    {
        return stats{
            .enqueued      = enqueued_.load(std::memory_order_relaxed),
            .dropped       = dropped_.load(std::memory_order_relaxed),
            .direct_writes = direct_writes_.load(std::memory_order_relaxed),
            .queue_size    = queue_.size_approx(),
            .state         = state_.load(),
        };
    }

    size_t capacity() const { return capacity_; }

  protected:
    void dispatch(log_entry_ptr entry) override
    {
        active_producers_.fetch_add(1);
        if (state_.load() != async_logger_state::running)
        {
            leave_producer();
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        if (acquire_slot())
        {
            queue_.enqueue(queue_item{.kind = item_kind::entry, .entry = std::move(entry)});
            enqueued_.fetch_add(1, std::memory_order_relaxed);
        }
        else if (entry->level >= log_level::error)
        {
            direct_writes_.fetch_add(1, std::memory_order_relaxed);
            fan_out(entry);
        }
        else { dropped_.fetch_add(1, std::memory_order_relaxed); }

        leave_producer();
    }

  private:
    enum class item_kind : uint8_t
    {
        entry,
        flush_marker,
        shutdown,
    };

    struct queue_item
    {
        item_kind kind = item_kind::entry;
        log_entry_ptr entry;
        uint64_t seq = 0;
    };

    void leave_producer()
    {
        if (active_producers_.fetch_sub(1) == 1) { active_producers_.notify_all(); }
    }

    bool acquire_slot()
    {
        if (slots_.tryWait()) return true;
        auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(ENQUEUE_WAIT_TIMEOUT).count();
        return slots_.wait(static_cast<std::int64_t>(usecs));
    }

    void fan_out(const log_entry_ptr &entry)
    {
        std::vector<std::future<void>> pending;
        pending.reserve(destinations_.size());

        for (auto &dest : destinations_)
        {
            try
            {
                pending.push_back(dest->write_log_async(entry));
            }
            catch (const std::exception &e)
            {
                report_internal_error("{}: could not start write: {}", dest->name(), e.what());
            }
            catch (...)
            {
                report_internal_error("{}: could not start write: unknown exception", dest->name());
            }
        }

        for (auto &f : pending) { f.wait(); }
    }

    void flush_destinations(std::stop_token stop)
    {
        std::vector<std::future<void>> pending;
        pending.reserve(destinations_.size());

        for (auto &dest : destinations_)
        {
            try
            {
                pending.push_back(dest->flush_async(stop));
            }
            catch (const std::exception &e)
            {
                report_internal_error("{}: could not start flush: {}", dest->name(), e.what());
            }
            catch (...)
            {
                report_internal_error("{}: could not start flush: unknown exception", dest->name());
            }
        }

        for (auto &f : pending) { f.wait(); }
    }

    // Returns false once the shutdown marker has been seen
    bool process_item(queue_item &item, uint64_t &max_flush_seq)
    {
        switch (item.kind)
        {
        case item_kind::entry:
            slots_.signal();
            fan_out(item.entry);
            return true;
        case item_kind::flush_marker:
            if (item.seq > max_flush_seq) max_flush_seq = item.seq;
            return true;
        case item_kind::shutdown:
            return false;
        }
        return true;
    }

    /**
     * @brief Take everything currently visible in the queue
     *
     * Entries from other producer threads are not ordered against a marker,
     * so a marker is only acknowledged once the queue has been emptied.
     */
    bool drain_visible(moodycamel::ConsumerToken &token, uint64_t &max_flush_seq)
    {
        bool keep_running = true;
        queue_item item;
        while (queue_.try_dequeue(token, item))
        {
            if (!process_item(item, max_flush_seq)) keep_running = false;
        }
        return keep_running;
    }

    void acknowledge_flushes(uint64_t max_flush_seq)
    {
        if (max_flush_seq == 0) return;

        std::lock_guard lk(flush_mutex_);
        if (max_flush_seq > flush_done_) flush_done_ = max_flush_seq;
        flush_cv_.notify_all();
    }

    void worker_thread_func()
    {
        moodycamel::ConsumerToken token(queue_);
        bool keep_running = true;

        while (keep_running)
        {
            queue_item item;
            if (!queue_.wait_dequeue_timed(token, item, CONSUMER_POLL_INTERVAL)) continue;

            uint64_t max_flush_seq = 0;
            keep_running           = process_item(item, max_flush_seq);

            if (item.kind != item_kind::entry || !keep_running)
            {
                if (!drain_visible(token, max_flush_seq)) keep_running = false;
            }

            acknowledge_flushes(max_flush_seq);
        }

        // Drain remaining items on shutdown
        uint64_t max_flush_seq = 0;
        drain_visible(token, max_flush_seq);
        acknowledge_flushes(max_flush_seq);
    }

    std::vector<std::shared_ptr<async_log_destination>> destinations_;
    size_t capacity_;

    moodycamel::BlockingConcurrentQueue<queue_item> queue_;
    moodycamel::LightweightSemaphore slots_;

    std::atomic<async_logger_state> state_{async_logger_state::running};
    std::atomic<int> active_producers_{0};

    std::mutex flush_mutex_;
    std::condition_variable_any flush_cv_;
    uint64_t flush_seq_{0};  ///< Last flush marker handed out, guarded by flush_mutex_
    uint64_t flush_done_{0}; ///< Highest marker the consumer passed, guarded by flush_mutex_

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> direct_writes_{0};

    std::thread worker_thread_;
};

} // namespace sluice
