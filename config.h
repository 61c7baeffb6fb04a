/**
 * @file qbm/route/config.h
 * @brief Application configuration and static serving options.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Route
 */
#pragma once

#include <chrono>
#include <utility>
#include <string>
#include <vector>

#include "./types.h"

namespace qb::route {

/**
 * @brief Configuration of an `Application`.
 *
 * The configuration stays mutable for the application's whole life; operations that
 * depend on it (e.g. `Group::all`) read it at call time.
 */
class Config {
private:
    std::string  _app_name;
    Methods      _request_methods = default_request_methods();
    bool         _case_sensitive  = false; ///< Keep letter case in route patterns
    bool         _strict_routing  = false; ///< Keep trailing slashes in route patterns
    ErrorHandler _error_handler;           ///< Explicitly configured handler, may be empty

public:
    /**
     * @brief Handler used when no error handler was configured.
     * Sets status 500 (or keeps an error status already set) and writes the error message as body.
     */
    static void default_error_handler(Context &ctx, const std::exception &error);

    Config() = default;

    /**
     * @brief Set the application name
     * @param name Name used in logs
     * @return Reference to this config object
     */
    Config &app_name(std::string name);

    /**
     * @brief Set the request methods the application recognises
     * @param methods Upper-case method tokens, in stack order
     * @return Reference to this config object
     */
    Config &request_methods(Methods methods);

    /**
     * @brief Make route patterns case sensitive
     * @param enabled true to keep "/Foo" and "/foo" distinct
     * @return Reference to this config object
     */
    Config &case_sensitive(bool enabled);

    /**
     * @brief Make route patterns strict about trailing slashes
     * @param enabled true to keep "/foo" and "/foo/" distinct
     * @return Reference to this config object
     */
    Config &strict_routing(bool enabled);

    /**
     * @brief Set the application error handler
     * @param handler Handler invoked for errors raised under this application
     * @return Reference to this config object
     */
    Config &error_handler(ErrorHandler handler);

    const std::string &app_name() const;
    const Methods &request_methods() const;
    bool case_sensitive() const;
    bool strict_routing() const;

    /**
     * @brief Get the effective error handler
     * @return The configured handler, or `default_error_handler` when none was set
     */
    ErrorHandler error_handler() const;

    /**
     * @brief Check whether an error handler was set explicitly
     * @return true if `error_handler(ErrorHandler)` was called with a non-empty handler
     */
    bool has_error_handler() const;
};

/**
 * @brief Options of a static file registration.
 *
 * They are recorded with the registration and handed to the static file server
 * of the host; this module does not serve files itself.
 */
class StaticOptions {
public:
    bool                      compress   = false; ///< Serve pre-compressed variants
    bool                      byte_range = false; ///< Honour Range requests
    bool                      browse     = false; ///< Allow directory listing
    bool                      download   = false; ///< Send files as attachments
    std::string               index      = "index.html";
    std::chrono::milliseconds cache_duration{10000}; ///< Inactive file handler expiry
    int                       max_age = 0;           ///< Cache-Control max-age in seconds, 0 disables it

    StaticOptions &with_compress(bool enabled) {
        compress = enabled;
        return *this;
    }

    StaticOptions &with_byte_range(bool enabled) {
        byte_range = enabled;
        return *this;
    }

    StaticOptions &with_browse(bool enabled) {
        browse = enabled;
        return *this;
    }

    StaticOptions &with_download(bool enabled) {
        download = enabled;
        return *this;
    }

    StaticOptions &with_index(std::string file_name) {
        index = std::move(file_name);
        return *this;
    }

    StaticOptions &with_cache_duration(std::chrono::milliseconds duration) {
        cache_duration = duration;
        return *this;
    }

    StaticOptions &with_max_age(int seconds) {
        max_age = seconds;
        return *this;
    }
};

} // namespace qb::route
