/**
 * @file qbm/route/routing/route.h
 * @brief Defines the Route record stored in an application's registration table.
 *
 * A registration call produces one `Route` per HTTP method it covers. The record keeps
 * both the path as composed by the caller and the pattern a dispatcher matches against,
 * the parameter names found in that pattern, and the ordered handler chain.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <cstddef>     // For std::size_t
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

#include "../types.h"

namespace qb::route {
    class Group;

    /**
     * @brief A registered route, middleware or static entry for a single method.
     */
    struct Route {
        std::string method;  ///< Upper-case method token (never `USE`; middleware is expanded per method).
        std::string name;    ///< Fully qualified route name, empty until named.
        std::string path;    ///< Absolute path as composed at registration time.
        std::string pattern; ///< Match form of `path` (case folding and trailing slash policy applied).
        std::vector<std::string> params; ///< Parameter names found in `pattern`, in order.
        std::vector<Handler> handlers;   ///< Middleware first, then the primary handler if any.

        bool use = false;       ///< Registered through `use` or as group middleware.
        bool mount = false;     ///< Copied from a mounted sub-application.
        bool star = false;      ///< Pattern is exactly "/*".
        bool root = false;      ///< Pattern is exactly "/".
        bool is_static = false; ///< Registered through `statics`.

        /** @brief Position in the application's registration order. */
        std::size_t position = 0;

        /**
         * @brief Group the route was registered on.
         * Non-owning; `nullptr` for routes registered through a `Registering` builder.
         * Groups are owned by their application, which outlives its routes.
         */
        const Group *group = nullptr;
    };

    /**
     * @brief Extracts the parameter names of a route pattern.
     *
     * - ":id" and ":id?" → "id" (a "-" or "." ends the name, so ":from-:to" → "from", "to")
     * - each "*" → "*1", "*2", ...
     * - each "+" → "+1", "+2", ...
     *
     * A parameter marker preceded by a backslash is treated as a literal character.
     *
     * @param pattern The route pattern.
     * @return The parameter names in their order of appearance.
     */
    [[nodiscard]] std::vector<std::string> parse_route_params(std::string_view pattern);
} // namespace qb::route
