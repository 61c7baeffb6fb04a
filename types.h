/**
 * @file qbm/route/types.h
 * @brief Core type definitions for the route grouping module.
 *
 * This file defines the method tokens recognised by the registration table,
 * the default request method list, and the function signatures used for
 * handlers, error handlers and lifecycle hooks.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Route
 */
#pragma once

#include <exception>   // For std::exception
#include <functional>  // For std::function
#include <optional>    // For std::optional
#include <string>      // For std::string
#include <vector>      // For std::vector

namespace qb::route {
    class Context;

    /**
     * @brief HTTP method tokens as they are stored in the registration table.
     *
     * Methods are plain upper-case tokens rather than an enum so that an application
     * can be configured with extension methods (e.g. WebDAV's `PROPFIND`).
     */
    namespace method {
        constexpr const char *GET = "GET";
        constexpr const char *HEAD = "HEAD";
        constexpr const char *POST = "POST";
        constexpr const char *PUT = "PUT";
        constexpr const char *DEL = "DELETE"; ///< DELETE method.
        constexpr const char *CONNECT = "CONNECT";
        constexpr const char *OPTIONS = "OPTIONS";
        constexpr const char *TRACE = "TRACE";
        constexpr const char *PATCH = "PATCH";

        /**
         * @brief Pseudo method of middleware registrations.
         * A `USE` registration matches every configured request method.
         */
        constexpr const char *USE = "USE";
    } // namespace method

    /** @brief Ordered list of method tokens. */
    using Methods = std::vector<std::string>;

    /**
     * @brief The request methods an application recognises unless configured otherwise.
     * @return GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH in that order.
     */
    [[nodiscard]] inline Methods default_request_methods() {
        return {method::GET, method::HEAD, method::POST, method::PUT, method::DEL,
                method::CONNECT, method::OPTIONS, method::TRACE, method::PATCH};
    }

    /**
     * @brief Signature of route handlers and middleware.
     *
     * Primary handlers and middleware share one signature; the execution chain that
     * decides how control passes between them lives outside this module.
     */
    using Handler = std::function<void(Context &ctx)>;

    /**
     * @brief Signature of an application error handler.
     * @param ctx The context of the failed request.
     * @param error The error raised while handling it.
     */
    using ErrorHandler = std::function<void(Context &ctx, const std::exception &error)>;

    /**
     * @brief Outcome of a lifecycle hook.
     * `std::nullopt` means the hook accepted the event; a message rejects it.
     */
    using HookStatus = std::optional<std::string>;
} // namespace qb::route
