/**
 * @file log_error.hpp
 * @brief Error types raised while building and operating the pipeline
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Configuration and initialisation problems surface as exceptions at build
 * time. Per-entry delivery problems never throw past a destination; they are
 * carried as write_result and reported on the diagnostic channel.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sluice
{

/// Invalid configuration: missing destinations, bad paths, bad sizes, unknown names
class config_error : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

/// A destination could not be initialised (file or database could not be opened)
class sink_init_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Outcome of persisting one entry
 */
struct write_result
{
    bool ok = true;
    std::string error;

    static write_result success() { return {}; }
    static write_result failure(std::string what) { return {false, std::move(what)}; }

    explicit operator bool() const { return ok; }
};

} // namespace sluice
