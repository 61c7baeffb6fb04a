/**
 * @file qbm/route/routing/registering.h
 * @brief Defines the Registering builder, a chainable registrar bound to one path.
 *
 * `Registering` lets several methods be registered on the same path without repeating it,
 * and nests: `route(sub)` returns a builder for the composed path. Registrations made
 * through a builder are not owned by any group, so a route name given afterwards is used
 * as-is.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <string> // For std::string
#include <vector> // For std::vector

#include "../types.h"

namespace qb::route {
    class Application;

    /**
     * @brief Chainable registrar bound to an absolute path.
     *
     * @code
     * app->route("/users/:id")
     *     .get(show_user)
     *     .put(update_user, {require_auth})
     *     .route("/avatar")
     *         .get(show_avatar);
     * @endcode
     */
    class Registering {
        Application *_app;
        std::string _path;

    public:
        Registering(Application &app, std::string path);

        /** @brief The absolute path this builder registers under. */
        [[nodiscard]] const std::string &path() const noexcept { return _path; }

        /**
         * @brief Registers `handler` for several methods on the bound path.
         * @throws SetupError `INVALID_METHOD` or `MISSING_HANDLER`.
         */
        Registering &add(const Methods &methods, Handler handler, std::vector<Handler> middleware = {});

        Registering &get(Handler handler, std::vector<Handler> middleware = {});
        Registering &head(Handler handler, std::vector<Handler> middleware = {});
        Registering &post(Handler handler, std::vector<Handler> middleware = {});
        Registering &put(Handler handler, std::vector<Handler> middleware = {});
        Registering &del(Handler handler, std::vector<Handler> middleware = {});
        Registering &connect(Handler handler, std::vector<Handler> middleware = {});
        Registering &options(Handler handler, std::vector<Handler> middleware = {});
        Registering &trace(Handler handler, std::vector<Handler> middleware = {});
        Registering &patch(Handler handler, std::vector<Handler> middleware = {});

        /** @brief Registers for every configured request method, read at call time. */
        Registering &all(Handler handler, std::vector<Handler> middleware = {});

        /** @brief Registers middleware (`USE`) on the bound path. */
        Registering &use(std::vector<Handler> handlers);

        /** @brief Names the latest route of the application. @see Application::name */
        Registering &name(const std::string &name);

        /** @brief Returns a builder for `path` composed under this builder's path. */
        [[nodiscard]] Registering route(const std::string &path) const;
    };
} // namespace qb::route
