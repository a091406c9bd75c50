/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * sluice is header-only; fmt follows suit so consumers never link a
 * separate fmt library. Chrono support is pulled in for timestamp rendering.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>
