/**
 * @file qbm/route/routing/application.h
 * @brief Defines the Application, owner of the registration table, hooks and groups.
 *
 * The `Application` is the single authority of one routing tree:
 * - it owns every `Group` created from its root group, for its whole lifetime;
 * - it owns the registration table: every route, middleware and static entry,
 *   one `Route` per method, in registration order;
 * - it owns the hooks run while routes and groups are built, and the lock that makes
 *   group naming atomic with respect to the rest of the application;
 * - it records the sub-applications mounted into it and resolves which error handler
 *   covers a given path.
 *
 * Applications are shared (`std::shared_ptr`) so that one can be mounted into another.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <cstddef>  // For std::size_t
#include <map>      // For std::map (mounted applications, sorted by path)
#include <memory>   // For std::shared_ptr, std::unique_ptr
#include <mutex>    // For std::mutex
#include <optional> // For std::optional
#include <string>   // For std::string
#include <utility>  // For std::forward, std::move
#include <vector>   // For std::vector

#include <qb/json.h>                           // For qb::json (routes document)
#include <qb/system/container/unordered_map.h> // For qb::unordered_map (error handlers)

#include "../config.h"
#include "../types.h"
#include "./group.h"
#include "./hooks.h"
#include "./registering.h"
#include "./route.h"

namespace qb::route {
    /**
     * @brief A static file registration, as handed to the host's static file server.
     */
    struct StaticEntry {
        std::string path; ///< Absolute path under which files are served.
        std::string root; ///< Directory (or file) to serve.
        StaticOptions options;
    };

    /**
     * @brief Owner of a routing tree and its registration table.
     *
     * @code
     * auto app = qb::route::Application::create(qb::route::Config().app_name("shop"));
     * app->hooks().on_group_name([](const qb::route::GroupSnapshot &grp) -> qb::route::HookStatus {
     *     if (grp.name.empty()) return "groups must be named";
     *     return std::nullopt;
     * });
     * auto &v1 = app->group("/api/v1").name("v1.");
     * v1.get("/orders/:id", get_order).name("order");
     * app->use("/billing", billing_app); // mount
     * @endcode
     */
    class Application {
        friend class Group;

    public:
        /** @brief Path-to-application map of mounted sub-applications. */
        using MountedApps = std::map<std::string, std::shared_ptr<Application> >;

    private:
        Config _config;
        Hooks _hooks;
        mutable std::mutex _mutex; ///< Guards the registration table, names and mount records.

        std::vector<std::unique_ptr<Group> > _groups; ///< `_groups[0]` is the root group.
        std::vector<std::unique_ptr<Route> > _routes; ///< Registration order.
        Route *_latest_route = nullptr;
        std::size_t _handlers_count = 0;
        std::vector<StaticEntry> _statics;

        MountedApps _mounted;
        std::string _mount_path;
        qb::unordered_map<std::string, ErrorHandler> _error_handlers; ///< Mount path → sub-app handler.

        /** @brief Returns the lock shared by group naming and table updates. */
        [[nodiscard]] std::mutex &mutex() const noexcept { return _mutex; }

        /**
         * @brief Upper-cases and validates a method token.
         * @throws SetupError `INVALID_METHOD` if the token is neither `USE` nor configured.
         */
        [[nodiscard]] std::string checked_method(const std::string &method) const;

        /** @brief Builds a route record for `path` with this application's pattern policy. */
        [[nodiscard]] std::unique_ptr<Route> make_route(const std::string &method, const std::string &path) const;

        /**
         * @brief Appends a route to the table, makes it the latest route and runs `on_route`
         *        hooks unless the route is a mounted copy.
         */
        void add_route(std::unique_ptr<Route> route);

        /** @brief Creates a group under `parent`, runs `on_group` hooks, then takes ownership. */
        Group &create_group(const Group *parent, std::string prefix);

        /** @brief True if `target` is mounted in this application, directly or through its sub-applications. */
        [[nodiscard]] bool reaches(const Application *target) const;

        [[noreturn]] void hook_failed(HookPoint point, const std::string &message) const;

    public:
        explicit Application(Config config = {});

        Application(const Application &) = delete;
        Application &operator=(const Application &) = delete;

        /** @brief Creates a shared application. */
        [[nodiscard]] static std::shared_ptr<Application> create(Config config = {});

        /**
         * @brief The live configuration.
         * Changes apply to subsequent registrations; `all()` reads the request method
         * list at each call.
         */
        [[nodiscard]] Config &config() noexcept { return _config; }
        [[nodiscard]] const Config &config() const noexcept { return _config; }

        [[nodiscard]] Hooks &hooks() noexcept { return _hooks; }
        [[nodiscard]] const Hooks &hooks() const noexcept { return _hooks; }

        /** @brief The root group, prefix "/". */
        [[nodiscard]] Group &root() noexcept { return *_groups.front(); }

        // --- Registration table (sink) ---

        /**
         * @brief Registers a route or middleware entry.
         *
         * Methods are upper-cased. A `USE` entry is expanded into one route per configured
         * request method, flagged `use`. An empty path is "/", a missing leading "/" is added.
         *
         * @param methods Method tokens.
         * @param path Absolute path.
         * @param group Owner group, `nullptr` for builder registrations.
         * @param handler Primary handler, may be empty for middleware.
         * @param middleware Handlers run before `handler`, in order.
         * @throws SetupError `INVALID_METHOD`, `MISSING_HANDLER`, or `HOOK_FAILED` from `on_route` hooks.
         */
        void register_route(const Methods &methods, const std::string &path, const Group *group,
                            Handler handler, std::vector<Handler> middleware = {});

        /**
         * @brief Registers a static file entry, with GET and HEAD routes flagged `is_static`.
         */
        void register_static(const std::string &path, const std::string &root, StaticOptions options = {});

        /**
         * @brief Names the most recently registered route.
         *
         * Every route sharing the latest route's path receives the name when its method is
         * the latest route's method, when the latest route is middleware, or when it is the
         * HEAD counterpart of a GET route. The owner group's name is prepended.
         *
         * @throws SetupError `NO_ROUTE_TO_NAME` if nothing was registered yet,
         *         `HOOK_FAILED` if an `on_name` hook rejects the name.
         */
        Application &name(const std::string &name);

        /**
         * @brief Mounts a sub-application: copies its registration table under `path`.
         *
         * Applications the sub-application mounted itself are recorded under their composed
         * paths. Routes registered on the sub-application afterwards are not copied.
         *
         * Nothing is copied or recorded when the mount is rejected.
         *
         * @throws SetupError `INVALID_USE_ARGUMENT` when mounting an application into itself or
         *         into one of its own sub-applications (a mount cycle), `INVALID_METHOD` when a
         *         sub-application route uses a method this application is not configured with,
         *         `HOOK_FAILED` if one of the sub-application's `on_mount` hooks fails.
         */
        void mount(const std::string &path, const std::shared_ptr<Application> &sub_app);

        // --- Introspection ---

        /** @brief Routes per configured request method, in registration order. */
        [[nodiscard]] std::vector<std::vector<Route> > stack() const;

        /**
         * @brief All routes in registration order.
         * @param filter_use Skip middleware entries.
         */
        [[nodiscard]] std::vector<Route> routes(bool filter_use = false) const;

        /** @brief The first route with this name, if any. */
        [[nodiscard]] std::optional<Route> route_by_name(const std::string &name) const;

        /** @brief The most recently registered route, if any. */
        [[nodiscard]] std::optional<Route> latest_route() const;

        /** @brief Number of handlers over all routes. */
        [[nodiscard]] std::size_t handlers_count() const;

        [[nodiscard]] std::vector<StaticEntry> statics() const;

        /** @brief Sub-applications mounted into this one, by absolute mount path. */
        [[nodiscard]] MountedApps mounted() const;

        /** @brief Path this application is mounted at in its parent, empty if not mounted. */
        [[nodiscard]] std::string mount_path() const;

        /**
         * @brief Resolves the error handler covering a request path.
         *
         * The longest mount path that covers `path` and whose sub-application configured an
         * error handler wins; otherwise this application's handler applies.
         */
        [[nodiscard]] ErrorHandler error_handler(const std::string &path) const;

        /**
         * @brief Describes the registration table as JSON.
         * @return An array of `{"method", "name", "path", "params"}` objects, middleware excluded.
         */
        [[nodiscard]] qb::json routes_document() const;

        // --- Root group facade ---

        /** @see Group::use */
        template<typename... Args>
        Group &use(Args &&... args) {
            return root().use(std::forward<Args>(args)...);
        }

        /** @see Group::group */
        [[nodiscard]] Group &group(const std::string &prefix, std::vector<Handler> handlers = {}) {
            return root().group(prefix, std::move(handlers));
        }

        /** @see Group::route */
        [[nodiscard]] Registering route(const std::string &path) {
            return root().route(path);
        }

        Group &add(const Methods &methods, const std::string &path, Handler handler,
                   std::vector<Handler> middleware = {}) {
            return root().add(methods, path, std::move(handler), std::move(middleware));
        }

        Group &get(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().get(path, std::move(handler), std::move(middleware));
        }

        Group &head(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().head(path, std::move(handler), std::move(middleware));
        }

        Group &post(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().post(path, std::move(handler), std::move(middleware));
        }

        Group &put(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().put(path, std::move(handler), std::move(middleware));
        }

        Group &del(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().del(path, std::move(handler), std::move(middleware));
        }

        Group &connect(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().connect(path, std::move(handler), std::move(middleware));
        }

        Group &options(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().options(path, std::move(handler), std::move(middleware));
        }

        Group &trace(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().trace(path, std::move(handler), std::move(middleware));
        }

        Group &patch(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().patch(path, std::move(handler), std::move(middleware));
        }

        Group &all(const std::string &path, Handler handler, std::vector<Handler> middleware = {}) {
            return root().all(path, std::move(handler), std::move(middleware));
        }

        Group &static_files(const std::string &prefix, const std::string &root_dir, StaticOptions options = {}) {
            return root().static_files(prefix, root_dir, std::move(options));
        }
    };
} // namespace qb::route
