/**
 * @file log_version.hpp
 * @brief Version information for the sluice logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace sluice
{

// Set by the build from the project version
#ifndef SLUICE_VERSION_STRING
    #define SLUICE_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = SLUICE_VERSION_STRING;

} // namespace sluice
