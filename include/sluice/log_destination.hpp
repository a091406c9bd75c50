/**
 * @file log_destination.hpp
 * @brief Destination contracts and the shared buffering/locking base
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A destination persists log entries somewhere (a terminal, a file, a
 * database). Two contracts exist:
 * - log_destination: synchronous, used by the blocking logger
 * - async_log_destination: future-returning, used by the async logger's
 *   consumer thread
 *
 * Neither contract lets a failure escape. A destination that cannot persist
 * an entry reports it through the diagnostic channel and drops the entry;
 * other destinations are unaffected.
 *
 * buffered_destination implements both contracts on top of a single
 * primitive, write_entry(), and supplies buffering and locking according to
 * destination_options. Calls made through the async contract are queued to
 * one writer thread per destination and run there one at a time, in the order
 * each calling thread submitted them.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "moodycamel/blockingconcurrentqueue.h"

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_error.hpp"
#include "log_diagnostics.hpp"

namespace sluice
{

/**
 * @brief Synchronous destination contract
 */
class log_destination
{
  public:
    virtual ~log_destination() = default;

    /// Persist or queue one entry. Never throws.
    virtual void write_log(const log_entry_ptr &entry) noexcept = 0;

    /// Persist everything queued so far. Never throws.
    virtual void flush() noexcept = 0;

    /// Final flush and resource release. Idempotent, never throws.
    virtual void close() noexcept = 0;

    /// Short human readable name used in diagnostics
    virtual std::string name() const = 0;
};

/**
 * @brief Asynchronous destination contract
 *
 * Returned futures complete when the operation is done and never carry an
 * exception. The destination must outlive every future it hands out.
 */
class async_log_destination
{
  public:
    virtual ~async_log_destination() = default;

    virtual std::future<void> write_log_async(log_entry_ptr entry) = 0;

    /// Stops early (keeping unwritten entries queued) once stop is requested
    virtual std::future<void> flush_async(std::stop_token stop = {}) = 0;

    virtual std::future<void> close_async() = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Buffering and locking behaviour of a destination
 */
struct destination_options
{
    write_mode mode         = write_mode::immediate;
    thread_safety safety    = thread_safety::thread_safe;
    size_t buffer_threshold = DEFAULT_BUFFER_THRESHOLD; ///< Only used in buffered mode
};

/**
 * @brief Base for destinations: buffering, locking and failure isolation
 *
 * Immediate mode persists each entry on arrival. Buffered mode appends to a
 * queue; when the queue reaches buffer_threshold the writer flushes inline.
 * Flushing swaps the queue out and persists the batch in enqueue order.
 *
 * With thread_safety::thread_safe, queue access and persistence are guarded
 * by an exclusive lock and concurrent flushes are serialised. With
 * not_thread_safe no lock is taken and the caller guarantees single-threaded
 * use of the synchronous contract. The async contract is always safe: its
 * writer thread is the only one touching the destination.
 *
 * The writer thread starts on the first async call and is joined by close().
 * If it cannot be started, or once the destination is closed, async calls run
 * on the calling thread and return a ready future.
 *
 * Derived classes implement write_entry() and optionally flush_output() and
 * release_resources(). Because release_resources() is virtual, every
 * concrete destination must call close() from its own destructor.
 */
class buffered_destination : public log_destination, public async_log_destination
{
  public:
    explicit buffered_destination(destination_options options) : options_(options)
    {
        if (options_.buffer_threshold == 0) { throw config_error("buffer threshold must be at least 1"); }
    }

    ~buffered_destination() override { stop_worker(); }

    buffered_destination(const buffered_destination &)            = delete;
    buffered_destination &operator=(const buffered_destination &) = delete;

    void write_log(const log_entry_ptr &entry) noexcept override
    {
        if (!entry) return;

        if (closed_.load(std::memory_order_acquire))
        {
            report_internal_error("{}: write after close, entry dropped", name());
            return;
        }

        if (options_.mode == write_mode::immediate)
        {
            auto lock = lock_flush();
            persist(*entry);
            finish_batch();
            return;
        }

        bool reached_threshold = false;
        {
            auto lock = lock_queue();
            queue_.push_back(entry);
            reached_threshold = queue_.size() >= options_.buffer_threshold;
        }

        if (reached_threshold) { flush_impl({}); }
    }

    void flush() noexcept override { flush_impl({}); }

    void close() noexcept override
    {
        bool expected = false;
        if (closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            flush_impl({});

            auto lock = lock_flush();
            release_resources();
        }

        stop_worker();
    }

    std::future<void> write_log_async(log_entry_ptr entry) override
    {
        return submit(destination_task{.kind = task_kind::write, .entry = std::move(entry)});
    }

    std::future<void> flush_async(std::stop_token stop = {}) override
    {
        return submit(destination_task{.kind = task_kind::flush, .stop = std::move(stop)});
    }

    std::future<void> close_async() override { return submit(destination_task{.kind = task_kind::close}); }

    std::string name() const override = 0;

    const destination_options &options() const { return options_; }

    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    /// Entries queued and not yet persisted
    size_t pending() const
    {
        if (options_.safety == thread_safety::thread_safe)
        {
            std::shared_lock lock(queue_mutex_);
            return queue_.size();
        }
        return queue_.size();
    }

    /// Entries write_entry() rejected or threw on
    uint64_t failed_writes() const { return failed_writes_.load(std::memory_order_relaxed); }

  protected:
    /// Persist one entry. May throw; exceptions are converted into a failure result.
    virtual write_result write_entry(const log_entry &entry) = 0;

    /// Called after every immediate write and after each flushed batch
    virtual write_result flush_output() { return write_result::success(); }

    /// Release files, handles or connections. Called once, from close().
    virtual void release_resources() noexcept {}

  private:
    enum class task_kind : uint8_t
    {
        write,
        flush,
        close,
        stop, ///< Wakes the writer thread so it can exit
    };

    struct destination_task
    {
        task_kind kind = task_kind::stop;
        log_entry_ptr entry;
        std::stop_token stop;
        std::promise<void> done;
    };

    std::future<void> submit(destination_task task)
    {
        auto done = task.done.get_future();
        {
            std::lock_guard lock(worker_mutex_);
            if (!worker_stopped_.load(std::memory_order_acquire) && start_worker() && tasks_.enqueue(std::move(task)))
            {
                return done;
            }
        }

        run_task(task);
        return done;
    }

    // Caller holds worker_mutex_
    bool start_worker()
    {
        if (worker_thread_.joinable()) return true;
        try
        {
            worker_thread_ = std::thread(&buffered_destination::worker_thread_func, this);
            return true;
        }
        catch (const std::system_error &e)
        {
            report_internal_error("{}: could not start writer thread, writing on the caller: {}", name(), e.what());
            return false;
        }
    }

    /// Tasks submitted before this call still run; later ones run on the caller
    void stop_worker() noexcept
    {
        {
            std::lock_guard lock(worker_mutex_);
            if (!worker_stopped_.exchange(true, std::memory_order_acq_rel) && worker_thread_.joinable())
            {
                // A failed wake-up only delays the exit until the next poll
                if (!tasks_.enqueue(destination_task{})) { report_internal_error("could not wake destination writer thread"); }
            }
        }

        // Closed from a task on the writer thread itself: the thread exits after draining
        if (worker_id_.load(std::memory_order_acquire) == std::this_thread::get_id()) return;

        std::lock_guard join_lock(join_mutex_);
        if (worker_thread_.joinable()) { worker_thread_.join(); }
    }

    void run_task(destination_task &task)
    {
        switch (task.kind)
        {
        case task_kind::write: write_log(task.entry); break;
        case task_kind::flush: flush_impl(task.stop); break;
        case task_kind::close: close(); break;
        case task_kind::stop: break;
        }
        task.done.set_value();
    }

    void worker_thread_func()
    {
        worker_id_.store(std::this_thread::get_id(), std::memory_order_release);

        destination_task task;
        while (true)
        {
            if (tasks_.wait_dequeue_timed(task, CONSUMER_POLL_INTERVAL) && task.kind != task_kind::stop)
            {
                run_task(task);
                continue;
            }

            if (!worker_stopped_.load(std::memory_order_acquire)) continue;

            // Drain what was submitted before the stop
            while (tasks_.try_dequeue(task)) { run_task(task); }
            break;
        }
    }

    std::unique_lock<std::shared_mutex> lock_queue()
    {
        if (options_.safety == thread_safety::thread_safe) return std::unique_lock(queue_mutex_);
        return std::unique_lock(queue_mutex_, std::defer_lock);
    }

    std::unique_lock<std::mutex> lock_flush()
    {
        if (options_.safety == thread_safety::thread_safe) return std::unique_lock(flush_mutex_);
        return std::unique_lock(flush_mutex_, std::defer_lock);
    }

    void flush_impl(std::stop_token stop) noexcept
    {
        auto flush_lock = lock_flush();

        std::vector<log_entry_ptr> batch;
        {
            auto lock = lock_queue();
            batch.swap(queue_);
        }

        size_t written = 0;
        for (; written < batch.size(); ++written)
        {
            if (stop.stop_requested()) break;
            persist(*batch[written]);
        }

        if (written < batch.size())
        {
            auto lock = lock_queue();
            queue_.insert(queue_.begin(), batch.begin() + written, batch.end());
        }

        if (written > 0) { finish_batch(); }
    }

    void persist(const log_entry &entry) noexcept
    {
        write_result result;
        try
        {
            result = write_entry(entry);
        }
        catch (const std::exception &e)
        {
            result = write_result::failure(e.what());
        }
        catch (...)
        {
            result = write_result::failure("unknown exception");
        }

        if (!result)
        {
            failed_writes_.fetch_add(1, std::memory_order_relaxed);
            report_internal_error("{}: failed to write entry: {}", name(), result.error);
        }
    }

    void finish_batch() noexcept
    {
        write_result result;
        try
        {
            result = flush_output();
        }
        catch (const std::exception &e)
        {
            result = write_result::failure(e.what());
        }
        catch (...)
        {
            result = write_result::failure("unknown exception");
        }

        if (!result) { report_internal_error("{}: failed to flush output: {}", name(), result.error); }
    }

    destination_options options_;
    std::vector<log_entry_ptr> queue_;
    mutable std::shared_mutex queue_mutex_;
    std::mutex flush_mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> failed_writes_{0};

    moodycamel::BlockingConcurrentQueue<destination_task> tasks_;
    std::mutex worker_mutex_; ///< Guards starting the writer thread and worker_stopped_ transitions
    std::mutex join_mutex_;
    std::atomic<bool> worker_stopped_{false};
    std::atomic<std::thread::id> worker_id_{};
    std::thread worker_thread_;
};

} // namespace sluice
