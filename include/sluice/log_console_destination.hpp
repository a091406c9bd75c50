/**
 * @file log_console_destination.hpp
 * @brief Destination writing plain text lines to a terminal or descriptor
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string>
#include <unistd.h>

#include "log_destination.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace sluice
{

struct console_options
{
    int fd          = STDOUT_FILENO; ///< Descriptor to write to, not owned
    bool use_colors = true;          ///< ANSI colour by level
};

/**
 * @brief Writes "[timestamp] [CODE] category: message" lines to stdout
 *
 * Colours follow log_level_colors: trace, debug and info are uncoloured, warn
 * yellow, error red, critical bold red.
 *
 * @code
 * auto console = std::make_shared<console_destination>(
 *     destination_options{.mode = write_mode::immediate},
 *     console_options{.fd = STDERR_FILENO, .use_colors = false});
 * @endcode
 */
class console_destination : public buffered_destination
{
  public:
    explicit console_destination(destination_options options = {}, console_options console = {})
        : buffered_destination(options), writer_(console.fd, false)
    {
        formatter_.use_color = console.use_colors;
    }

    ~console_destination() override { close(); }

    std::string name() const override { return fmt::format("console(fd {})", writer_.fd()); }

  protected:
    write_result write_entry(const log_entry &entry) override { return writer_.write(formatter_.format(entry)); }

  private:
    file_writer writer_;
    text_formatter formatter_;
};

} // namespace sluice
