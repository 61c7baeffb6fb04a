/**
 * @file qbm/route/routing/path.h
 * @brief Path composition helpers used to build group prefixes and route paths.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <string>      // For std::string
#include <string_view> // For std::string_view

namespace qb::route {
    /**
     * @brief Removes leading and trailing slashes from a path segment.
     *
     * - "/users" → "users"
     * - "users/" → "users"
     * - "//users//" → "users"
     * - "/" → ""
     *
     * @param segment The path segment to normalize.
     * @return The segment without leading/trailing slashes.
     */
    [[nodiscard]] std::string_view trim_slashes(std::string_view segment) noexcept;

    /**
     * @brief Composes a parent prefix and a child path into an absolute path.
     *
     * The result always starts with exactly one "/", never ends with "/" unless it is
     * the root path, and never holds more than one "/" at the seam between parent and child:
     * - parent="/api", child="/v1" → "/api/v1"
     * - parent="/api/", child="v1" → "/api/v1"
     * - parent="/api", child="" → "/api"
     * - parent="", child="users" → "/users"
     * - parent="/", child="/" → "/"
     *
     * Any input is accepted; composing is associative, so
     * `compose_path(compose_path(a, b), c) == compose_path(a, compose_path(b, c))`.
     *
     * @param parent The parent prefix (may be empty, may have a trailing slash).
     * @param child The child path (may be empty, may have a leading slash).
     * @return The normalized absolute path.
     */
    [[nodiscard]] std::string compose_path(std::string_view parent, std::string_view child);

    /**
     * @brief Builds the pattern form of a route path, the form a dispatcher matches against.
     * @param path Absolute route path.
     * @param case_sensitive When false, the pattern is lower-cased.
     * @param strict_routing When false, trailing slashes are trimmed (except for the root path).
     * @return The route pattern.
     */
    [[nodiscard]] std::string route_pattern(std::string_view path, bool case_sensitive, bool strict_routing);
} // namespace qb::route
