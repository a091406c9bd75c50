/**
 * @file test_helpers.hpp
 * @brief Capturing destinations and temp-file fixtures shared by the tests
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "log_destination.hpp"
#include "log_diagnostics.hpp"

namespace sluice_test
{

using namespace sluice;

/**
 * @brief Destination that keeps every persisted entry in memory
 */
class memory_destination : public buffered_destination
{
  public:
    explicit memory_destination(destination_options options = {}, std::string label = "memory")
        : buffered_destination(options), label_(std::move(label))
    {
    }

    ~memory_destination() override { close(); }

    std::string name() const override { return label_; }

    std::vector<log_entry_ptr> entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::vector<std::string> messages() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        for (auto &e : entries_) { result.push_back(e->message); }
        return result;
    }

    size_t count() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    int batches() const { return batches_.load(); }
    bool released() const { return released_.load(); }

    /// Delay applied to every write, to widen race windows
    void set_write_delay(std::chrono::microseconds delay) { delay_ = delay; }

  protected:
    write_result write_entry(const log_entry &entry) override
    {
        if (delay_.count() > 0) { std::this_thread::sleep_for(delay_); }
        std::lock_guard lock(mutex_);
        entries_.push_back(std::make_shared<const log_entry>(entry));
        return write_result::success();
    }

    write_result flush_output() override
    {
        batches_.fetch_add(1);
        return write_result::success();
    }

    void release_resources() noexcept override { released_.store(true); }

  private:
    std::string label_;
    mutable std::mutex mutex_;
    std::vector<log_entry_ptr> entries_;
    std::atomic<int> batches_{0};
    std::atomic<bool> released_{false};
    std::chrono::microseconds delay_{0};
};

enum class failure_kind
{
    result,        ///< write_entry returns a failure
    exception,     ///< write_entry throws a std::runtime_error
    non_exception, ///< write_entry throws something that is not a std::exception
};

/**
 * @brief Destination whose writes always fail
 */
class failing_destination : public buffered_destination
{
  public:
    explicit failing_destination(failure_kind kind = failure_kind::result)
        : buffered_destination(destination_options{}), kind_(kind)
    {
    }

    ~failing_destination() override { close(); }

    std::string name() const override { return "failing"; }

    int attempts() const { return attempts_.load(); }

  protected:
    write_result write_entry(const log_entry &) override
    {
        attempts_.fetch_add(1);
        switch (kind_)
        {
        case failure_kind::exception: throw std::runtime_error("disk on fire");
        case failure_kind::non_exception: throw 42;
        case failure_kind::result: break;
        }
        return write_result::failure("device unavailable");
    }

  private:
    failure_kind kind_;
    std::atomic<int> attempts_{0};
};

/**
 * @brief Destination that records its writer threads and notices overlapping calls
 *
 * Meant for not_thread_safe setups: any two write_entry/flush_output calls
 * running at the same time set overlapped().
 */
class thread_tracking_destination : public buffered_destination
{
  public:
    explicit thread_tracking_destination(destination_options options = {}) : buffered_destination(options) {}

    ~thread_tracking_destination() override { close(); }

    std::string name() const override { return "tracking"; }

    std::set<std::thread::id> writer_threads() const
    {
        std::lock_guard lock(mutex_);
        return threads_;
    }

    size_t count() const
    {
        std::lock_guard lock(mutex_);
        return count_;
    }

    bool overlapped() const { return overlapped_.load(); }

    void set_write_delay(std::chrono::microseconds delay) { delay_ = delay; }

  protected:
    write_result write_entry(const log_entry &) override
    {
        call_guard guard(*this);
        if (delay_.count() > 0) { std::this_thread::sleep_for(delay_); }

        std::lock_guard lock(mutex_);
        threads_.insert(std::this_thread::get_id());
        ++count_;
        return write_result::success();
    }

    write_result flush_output() override
    {
        call_guard guard(*this);
        return write_result::success();
    }

  private:
    struct call_guard
    {
        explicit call_guard(thread_tracking_destination &dest) : dest_(dest)
        {
            if (dest_.in_call_.fetch_add(1) > 0) { dest_.overlapped_.store(true); }
        }
        ~call_guard() { dest_.in_call_.fetch_sub(1); }

        thread_tracking_destination &dest_;
    };

    mutable std::mutex mutex_;
    std::set<std::thread::id> threads_;
    size_t count_ = 0;
    std::atomic<int> in_call_{0};
    std::atomic<bool> overlapped_{false};
    std::chrono::microseconds delay_{0};
};

/**
 * @brief Capture diagnostic channel output for the lifetime of the object
 */
class diagnostics_capture
{
  public:
    diagnostics_capture()
    {
        previous_ = set_diagnostic_handler(
            [this](std::string_view line)
            {
                std::lock_guard lock(mutex_);
                lines_.emplace_back(line);
            });
    }

    ~diagnostics_capture() { set_diagnostic_handler(std::move(previous_)); }

    diagnostics_capture(const diagnostics_capture &)            = delete;
    diagnostics_capture &operator=(const diagnostics_capture &) = delete;

    std::vector<std::string> lines() const
    {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    bool contains(std::string_view needle) const
    {
        std::lock_guard lock(mutex_);
        for (auto &l : lines_)
        {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

  private:
    diagnostic_handler previous_;
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

/**
 * @brief Unique scratch directory removed on destruction
 */
class temp_dir
{
  public:
    temp_dir()
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("sluice_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~temp_dir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_dir(const temp_dir &)            = delete;
    temp_dir &operator=(const temp_dir &) = delete;

    std::string file(const std::string &name) const { return (path_ / name).string(); }
    const std::filesystem::path &path() const { return path_; }

  private:
    std::filesystem::path path_;
};

inline std::vector<std::string> read_lines(const std::string &path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) { lines.push_back(line); }
    return lines;
}

inline std::string read_file(const std::string &path)
{
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Build an entry without going through a logger
inline log_entry_ptr make_entry(std::string message, log_level level = log_level::info, std::string category = "test")
{
    auto entry       = std::make_shared<log_entry>();
    entry->timestamp = log_clock::now();
    entry->level     = level;
    entry->category  = std::move(category);
    entry->message   = std::move(message);
    return entry;
}

} // namespace sluice_test
