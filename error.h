/**
 * @file qbm/route/error.h
 * @brief Defines the error raised by invalid route and group setup.
 *
 * Every misuse of the registration API (an unusable `use` argument, an unknown
 * method, a route without handlers, naming with no route to name) and every hook
 * rejection aborts the current call with a `SetupError`. These are programmer
 * errors: a host application is expected to let them abort startup, or to catch
 * them at its setup boundary to report them.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Route
 */
#pragma once

#include <stdexcept> // For std::logic_error
#include <string>    // For std::string

namespace qb::route {
    /**
     * @brief Fatal error raised while building routes and groups.
     */
    class SetupError : public std::logic_error {
    public:
        /** @brief Category of setup failure. */
        enum class Kind {
            INVALID_USE_ARGUMENT, ///< A `use` argument was null or otherwise unusable.
            INVALID_METHOD,       ///< A method is neither `USE` nor a configured request method.
            MISSING_HANDLER,      ///< A route was registered with no handler and no middleware.
            NO_ROUTE_TO_NAME,     ///< A route name was given before any route was registered.
            INVALID_STATIC_ROOT,  ///< A static entry was registered without a root.
            HOOK_FAILED           ///< A lifecycle hook rejected the operation.
        };

        SetupError(Kind kind, const std::string &message)
            : std::logic_error(message), _kind(kind) {
        }

        [[nodiscard]] Kind kind() const noexcept {
            return _kind;
        }

    private:
        Kind _kind;
    };

    /**
     * @brief Returns the upper-case name of a `SetupError::Kind`, for logs and messages.
     */
    [[nodiscard]] inline const char *to_string(SetupError::Kind kind) noexcept {
        switch (kind) {
            case SetupError::Kind::INVALID_USE_ARGUMENT: return "INVALID_USE_ARGUMENT";
            case SetupError::Kind::INVALID_METHOD:       return "INVALID_METHOD";
            case SetupError::Kind::MISSING_HANDLER:      return "MISSING_HANDLER";
            case SetupError::Kind::NO_ROUTE_TO_NAME:     return "NO_ROUTE_TO_NAME";
            case SetupError::Kind::INVALID_STATIC_ROOT:  return "INVALID_STATIC_ROOT";
            case SetupError::Kind::HOOK_FAILED:          return "HOOK_FAILED";
        }
        return "UNKNOWN";
    }
} // namespace qb::route
