/**
 * @file log_file_destinations.hpp
 * @brief Plain text and JSON-lines file destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string>

#include "log_destination.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace sluice
{

struct file_options
{
    std::string path;    ///< Target file; parent directories are created
    bool append = false; ///< Keep existing content instead of truncating
};

/**
 * @brief Common base for destinations that append one formatted line per entry
 *
 * The file is opened in the constructor; any problem there is thrown,
 * never deferred to the first write.
 */
template <typename Formatter> class formatted_file_destination : public buffered_destination
{
  public:
    formatted_file_destination(destination_options options, const file_options &file)
        : buffered_destination(options), writer_(file.path, file.append)
    {
    }

    const std::string &path() const { return writer_.filename(); }

  protected:
    write_result write_entry(const log_entry &entry) override { return writer_.write(formatter_.format(entry)); }

    void release_resources() noexcept override { writer_.close(); }

    file_writer writer_;
    Formatter formatter_;
};

/**
 * @brief One plain text line per entry, same layout as the console without colour
 */
class text_file_destination : public formatted_file_destination<text_formatter>
{
  public:
    text_file_destination(destination_options options, const file_options &file)
        : formatted_file_destination(options, file)
    {
    }

    ~text_file_destination() override { close(); }

    std::string name() const override { return "text(" + path() + ")"; }
};

/**
 * @brief One compact JSON object per line
 *
 * See json_formatter for the field layout.
 */
class json_file_destination : public formatted_file_destination<json_formatter>
{
  public:
    json_file_destination(destination_options options, const file_options &file)
        : formatted_file_destination(options, file)
    {
    }

    ~json_file_destination() override { close(); }

    std::string name() const override { return "json(" + path() + ")"; }
};

} // namespace sluice
