/**
 * @file log_exception.hpp
 * @brief Captured exception information attached to log entries
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <typeinfo>
#include <cxxabi.h>

#include "log_types.hpp"

namespace sluice
{

inline std::string demangle_type_name(const char *mangled)
{
    int status      = 0;
    char *demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && demangled != nullptr)
    {
        std::string result(demangled);
        std::free(demangled);
        return result;
    }
    return mangled;
}

/**
 * @brief Snapshot of an exception and its chain of causes
 *
 * The snapshot owns plain strings only, so entries holding it can outlive the
 * exception object and be handed across threads freely.
 */
struct log_exception_info
{
    std::string type;
    std::string message;
    std::string stack_trace;                        ///< Empty unless supplied by the caller
    std::shared_ptr<const log_exception_info> inner; ///< Cause, or null at the end of the chain

    /**
     * @brief Render the exception chain as text
     *
     * Format: "Type: message", the stack text on following lines, and each
     * cause prefixed with " ---> ".
     */
    std::string to_string() const
    {
        std::string out = fmt::format("{}: {}", type, message);
        if (inner) { out += fmt::format(" ---> {}", inner->to_string()); }
        if (!stack_trace.empty())
        {
            out += '\n';
            out += stack_trace;
        }
        return out;
    }
};

/**
 * @brief Capture an exception, walking causes attached with std::throw_with_nested
 * @param e The exception to capture
 * @param stack_trace Optional stack text for the outermost exception
 */
inline std::shared_ptr<const log_exception_info> capture_exception(const std::exception &e, std::string stack_trace = {})
{
    auto info         = std::make_shared<log_exception_info>();
    info->type        = demangle_type_name(typeid(e).name());
    info->message     = e.what();
    info->stack_trace = std::move(stack_trace);

    try
    {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception &cause)
    {
        info->inner = capture_exception(cause);
    }
    catch (...)
    {
        auto unknown     = std::make_shared<log_exception_info>();
        unknown->type    = "unknown";
        unknown->message = "non-standard exception";
        info->inner      = std::move(unknown);
    }

    return info;
}

/**
 * @brief Capture from an exception_ptr, typically std::current_exception()
 * @return Captured info, or null when ptr is empty
 */
inline std::shared_ptr<const log_exception_info> capture_exception(std::exception_ptr ptr)
{
    if (!ptr) return nullptr;

    try
    {
        std::rethrow_exception(ptr);
    }
    catch (const std::exception &e)
    {
        return capture_exception(e);
    }
    catch (...)
    {
        auto unknown     = std::make_shared<log_exception_info>();
        unknown->type    = "unknown";
        unknown->message = "non-standard exception";
        return unknown;
    }
}

} // namespace sluice
