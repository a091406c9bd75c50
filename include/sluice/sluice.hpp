/**
 * @file sluice.hpp
 * @brief Structured logging pipeline: loggers, scopes and destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Including this header pulls in the whole library.
 *
 * @code
 * #include <sluice/sluice.hpp>
 *
 * int main()
 * {
 *     auto factory = sluice::logger_configuration{}.add_console().add_sqlite("logs/app.db").build();
 *     auto log     = factory->create_logger("main");
 *
 *     auto scope = log->begin_scope({{"RequestId", "r-17"}});
 *     log->info("User {UserId} signed in from {Ip}", 42, "10.0.0.1");
 *
 *     factory->close();
 * }
 * @endcode
 */
#pragma once

#include "log_version.hpp"
#include "log_types.hpp"
#include "log_error.hpp"
#include "log_diagnostics.hpp"
#include "log_value.hpp"
#include "log_exception.hpp"
#include "log_entry.hpp"
#include "log_template.hpp"
#include "log_scope.hpp"
#include "log_destination.hpp"
#include "log_writers.hpp"
#include "log_formatters.hpp"
#include "log_console_destination.hpp"
#include "log_file_destinations.hpp"
#include "sqlite_connection.hpp"
#include "sqlite_connection_pool.hpp"
#include "log_sqlite_destination.hpp"
#include "log_logger.hpp"
#include "log_async_logger.hpp"
#include "log_factory.hpp"
#include "log_configuration.hpp"
