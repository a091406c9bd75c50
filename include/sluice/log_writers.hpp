/**
 * @file log_writers.hpp
 * @brief Low level output writers used by the stream destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>

#include "log_types.hpp"
#include "log_error.hpp"

namespace sluice
{

/**
 * @brief Reject paths no file can be created at
 * @throws config_error on an empty path, a path without a file name or an embedded NUL
 */
inline void validate_log_path(const std::string &path)
{
    if (path.empty()) { throw config_error("log file path must not be empty"); }
    if (path.find('\0') != std::string::npos) { throw config_error("log file path contains a NUL character"); }
    if (!std::filesystem::path(path).has_filename()) { throw config_error("log file path has no file name: " + path); }
}

/**
 * @brief Create the parent directory of path if it does not exist
 * @throws sink_init_error when the directory cannot be created
 */
inline void ensure_parent_directory(const std::string &path)
{
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) { throw sink_init_error("Failed to create log directory " + parent.string() + ": " + ec.message()); }
}

/**
 * @brief Writes byte ranges to a file descriptor
 *
 * Either opens (and owns) a file, or wraps an existing descriptor such as
 * STDOUT_FILENO. Writes loop until the full range is written, retrying on
 * EINTR.
 */
class file_writer
{
  public:
    /**
     * @param filename File to open; the parent directory is created first
     * @param append Keep existing content instead of truncating
     * @throws config_error for an invalid path, sink_init_error when the file cannot be opened
     */
    file_writer(const std::string &filename, bool append) : filename_(filename), close_fd_(true)
    {
        validate_log_path(filename);
        ensure_parent_directory(filename);

        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (append ? O_APPEND : O_TRUNC);
        fd_       = ::open(filename.c_str(), flags, 0644);
        if (fd_ < 0) { throw sink_init_error("Failed to open log file: " + filename + ": " + std::strerror(errno)); }
    }

    explicit file_writer(int fd, bool close_fd = false) : fd_(fd), close_fd_(close_fd) {}

    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;

    file_writer(file_writer &&other) noexcept
        : filename_(std::move(other.filename_)), fd_(std::exchange(other.fd_, -1)), close_fd_(other.close_fd_)
    {
    }

    ~file_writer() { close(); }

    /**
     * @brief Write the whole range
     * @return Failure with the errno text when a write fails
     */
    write_result write(std::string_view data) const
    {
        if (fd_ < 0) { return write_result::failure("writer is closed"); }

        size_t total_written = 0;
        while (total_written < data.size())
        {
            ssize_t written = ::write(fd_, data.data() + total_written, data.size() - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                return write_result::failure(fmt::format("write to {} failed: {}", describe(), std::strerror(errno)));
            }
            total_written += static_cast<size_t>(written);
        }
        return write_result::success();
    }

    void close() noexcept
    {
        if (close_fd_ && fd_ >= 0) { ::close(fd_); }
        fd_ = -1;
    }

    int fd() const { return fd_; }
    const std::string &filename() const { return filename_; }

  private:
    std::string describe() const { return filename_.empty() ? fmt::format("fd {}", fd_) : filename_; }

    std::string filename_; ///< File name, empty for wrapped descriptors
    int fd_{-1};           ///< File descriptor
    bool close_fd_{false}; ///< Whether to close fd on destruction
};

} // namespace sluice
