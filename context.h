/**
 * @file qbm/route/context.h
 * @brief Defines the Context handed to route handlers and error handlers.
 *
 * The `Context` carries the request method and path, the path parameters bound by
 * the dispatcher, the response status and body a handler produces, and a map of
 * arbitrary per-request values. Request dispatching itself is performed by the
 * host server; this module only needs a concrete type for handler signatures.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Route
 */
#pragma once

#include <any>       // For std::any (locals)
#include <optional>  // For std::optional
#include <string>    // For std::string
#include <utility>   // For std::move

#include <qb/system/container/unordered_map.h> // For qb::unordered_map

namespace qb::route {
    struct Route;

    /**
     * @brief Per-request state visible to handlers.
     */
    class Context {
    public:
        /** @brief Map type for per-request values set by middleware. */
        using LocalsMap = qb::unordered_map<std::string, std::any>;
        /** @brief Map type for path parameters, keyed by parameter name. */
        using ParamsMap = qb::unordered_map<std::string, std::string>;

    private:
        std::string _method;
        std::string _path;
        const Route *_route = nullptr; ///< Route being executed, owned by the application.
        ParamsMap _params;
        int _status = 200;
        std::string _body;
        LocalsMap _locals;

    public:
        Context(std::string method, std::string path)
            : _method(std::move(method)), _path(std::move(path)) {
        }

        [[nodiscard]] const std::string &method() const noexcept { return _method; }
        [[nodiscard]] const std::string &path() const noexcept { return _path; }

        /** @brief The matched route, or `nullptr` before matching. */
        [[nodiscard]] const Route *route() const noexcept { return _route; }
        void set_route(const Route *route) noexcept { _route = route; }

        /**
         * @brief Returns a path parameter bound by the dispatcher.
         * @param name Parameter name as listed in `Route::params` (e.g. "id", "*1").
         * @param default_value Returned when the parameter is not bound.
         */
        [[nodiscard]] std::string param(const std::string &name, const std::string &default_value = "") const {
            auto it = _params.find(name);
            return it != _params.end() ? it->second : default_value;
        }

        void set_param(const std::string &name, std::string value) {
            _params[name] = std::move(value);
        }

        [[nodiscard]] int status() const noexcept { return _status; }
        Context &status(int code) noexcept {
            _status = code;
            return *this;
        }

        [[nodiscard]] const std::string &body() const noexcept { return _body; }
        std::string &body() noexcept { return _body; }

        /**
         * @brief Stores a per-request value.
         * @param key Lookup key.
         * @param value Value to store, replaces any previous value for `key`.
         */
        template<typename T>
        void set(const std::string &key, T value) {
            _locals[key] = std::move(value);
        }

        /**
         * @brief Retrieves a per-request value.
         * @return The value if `key` exists and holds a `T`, `std::nullopt` otherwise.
         */
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const {
            auto it = _locals.find(key);
            if (it == _locals.end()) {
                return std::nullopt;
            }
            if (const T *value = std::any_cast<T>(&it->second)) {
                return *value;
            }
            return std::nullopt;
        }

        [[nodiscard]] bool has(const std::string &key) const noexcept {
            return _locals.count(key) > 0;
        }
    };
} // namespace qb::route
