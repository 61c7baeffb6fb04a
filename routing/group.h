/**
 * @file qbm/route/routing/group.h
 * @brief Defines the Group class, a sub-router scoped to a path prefix.
 *
 * A `Group` composes every path it is given with its own prefix and forwards the
 * resulting registration to its owning `Application`. Groups nest: `group()` creates a
 * child whose prefix is composed from the parent's, and whose name is composed from
 * the parent's name when the child names itself.
 *
 * Groups are created and owned by their application; callers only ever hold references.
 * Apart from `name()`, which takes the application lock when a group names itself, the
 * registration API is meant for a single-threaded setup phase: concurrent calls on the
 * same group must be coordinated by the caller.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <memory>  // For std::shared_ptr
#include <string>  // For std::string
#include <utility> // For std::forward
#include <variant> // For std::variant
#include <vector>  // For std::vector

#include "../config.h"
#include "../types.h"
#include "./hooks.h"

namespace qb::route {
    class Application;
    class Registering;

    /**
     * @brief One argument of `Group::use`.
     *
     * - `std::string`: the prefix to register under, relative to the group (empty: the group itself).
     * - `std::vector<std::string>`: several prefixes, each receiving the same handlers.
     * - `std::shared_ptr<Application>`: a sub-application to mount.
     * - `Handler`: a middleware handler, appended in order.
     */
    using UseArgument = std::variant<std::string, std::vector<std::string>, std::shared_ptr<Application>, Handler>;

    /**
     * @brief A sub-router rooted at a path prefix.
     *
     * Every registration method returns the group itself so calls can be chained:
     * @code
     * auto app = qb::route::Application::create();
     * auto &api = app->group("/api").name("api.");
     * api.get("/users", list_users).name("users")   // route named "api.users"
     *    .post("/users", create_user, {require_auth});
     * @endcode
     */
    class Group {
        friend class Application;

    private:
        Application *_app;           ///< Owning application, outlives the group.
        const Group *_parent;        ///< Group this one was created from, `nullptr` for the root group.
        std::string _prefix;         ///< Normalized absolute prefix, never changes.
        std::string _name;           ///< Fully qualified group name, empty until the group names itself.
        bool _any_route_defined = false; ///< Set once anything is registered directly on this group.

        Group(Application &app, const Group *parent, std::string prefix);

        void mark_route_defined() noexcept {
            _any_route_defined = true;
        }

        void mount(const std::string &prefix, const std::shared_ptr<Application> &sub_app);

    public:
        Group(const Group &) = delete;
        Group &operator=(const Group &) = delete;

        [[nodiscard]] const std::string &prefix() const noexcept { return _prefix; }

        /** @brief The fully qualified group name, empty while the group is unnamed. */
        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        /** @brief True once a route, middleware, static entry or mount was registered directly on this group. */
        [[nodiscard]] bool any_route_defined() const noexcept { return _any_route_defined; }

        [[nodiscard]] const Group *parent() const noexcept { return _parent; }

        [[nodiscard]] Application &app() const noexcept { return *_app; }

        /** @brief Copies the current state of the group, as handed to group hooks. */
        [[nodiscard]] GroupSnapshot snapshot() const;

        /**
         * @brief Names the group itself, or the route registered last.
         *
         * Before anything was registered on this group, the group names itself: its name
         * becomes the parent's name followed by `name` (no separator is inserted) and the
         * application's `on_group_name` hooks run, all under the application lock.
         * Afterwards, the call names the application's latest route instead.
         *
         * @param name The name, or name suffix.
         * @return Reference to this group for chaining.
         * @throws SetupError `HOOK_FAILED` if a group name hook rejects the name (the name
         *         stays assigned), `NO_ROUTE_TO_NAME` if there is no route to name.
         */
        Group &name(const std::string &name);

        /**
         * @brief Registers middleware, or mounts a sub-application.
         *
         * Arguments are classified by kind (see `UseArgument`). When several prefixes are
         * given, the collected handlers are registered under each of them; a single prefix
         * or none registers under that prefix or the group itself. If a sub-application is
         * given, it is mounted under the first resolved prefix and nothing else is
         * registered by this call.
         *
         * @code
         * grp.use(logger);
         * grp.use("/admin", require_auth, audit);
         * grp.use(std::vector<std::string>{"/a", "/b"}, rate_limit);
         * grp.use("/billing", billing_app);
         * @endcode
         *
         * @return Reference to this group for chaining.
         * @throws SetupError `INVALID_USE_ARGUMENT` for a null handler or sub-application,
         *         `MISSING_HANDLER` when neither a handler nor a sub-application is given.
         */
        Group &use(std::vector<UseArgument> args);

        template<typename... Args>
        Group &use(Args &&... args) {
            std::vector<UseArgument> arguments;
            arguments.reserve(sizeof...(Args));
            (arguments.emplace_back(std::forward<Args>(args)), ...);
            return use(std::move(arguments));
        }

        /**
         * @brief Registers a route for several methods.
         * @param methods Method tokens, case insensitive.
         * @param path Path relative to the group, empty for the group prefix itself.
         * @param handler Primary handler.
         * @param middleware Handlers run before `handler`, in order.
         * @return Reference to this group for chaining.
         * @throws SetupError `INVALID_METHOD` for a method the application does not recognise.
         */
        Group &add(const Methods &methods, const std::string &path, Handler handler,
                   std::vector<Handler> middleware = {});

        /** @brief Registers a GET route. @see add */
        Group &get(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a HEAD route. @see add */
        Group &head(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a POST route. @see add */
        Group &post(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a PUT route. @see add */
        Group &put(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a DELETE route. @see add */
        Group &del(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a CONNECT route. @see add */
        Group &connect(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers an OPTIONS route. @see add */
        Group &options(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a TRACE route. @see add */
        Group &trace(const std::string &path, Handler handler, std::vector<Handler> middleware = {});
        /** @brief Registers a PATCH route. @see add */
        Group &patch(const std::string &path, Handler handler, std::vector<Handler> middleware = {});

        /**
         * @brief Registers a route for every request method the application is configured with.
         * The method list is read from the application configuration at call time.
         */
        Group &all(const std::string &path, Handler handler, std::vector<Handler> middleware = {});

        /**
         * @brief Registers a static file entry.
         * @param prefix Path relative to the group under which files are served.
         * @param root Directory (or file) to serve.
         * @param options Serving options handed to the static file server.
         * @return Reference to this group for chaining.
         */
        Group &static_files(const std::string &prefix, const std::string &root, StaticOptions options = {});

        /**
         * @brief Creates a nested group.
         * @param prefix Prefix relative to this group.
         * @param handlers Middleware registered at the nested prefix, owned by this group.
         * @return Reference to the new group, owned by the application.
         * @throws SetupError `HOOK_FAILED` if a group hook rejects the new group; the group is discarded.
         */
        [[nodiscard]] Group &group(const std::string &prefix, std::vector<Handler> handlers = {});

        /**
         * @brief Returns a builder bound to a path relative to this group.
         * Nothing is registered until one of the builder's methods is called.
         */
        [[nodiscard]] Registering route(const std::string &path) const;
    };
} // namespace qb::route
