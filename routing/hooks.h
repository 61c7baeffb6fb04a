/**
 * @file qbm/route/routing/hooks.h
 * @brief Defines the lifecycle hooks an application runs while routes and groups are built.
 *
 * Hooks run synchronously, in registration order, before the triggering call returns.
 * A hook rejects an event by returning a message; the first rejection stops the
 * remaining hooks of that point and is turned into a `SetupError` by the caller.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <functional> // For std::function
#include <string>     // For std::string
#include <vector>     // For std::vector

#include "../types.h"
#include "./route.h"

namespace qb::route {
    class Application;

    /**
     * @brief Points of the setup lifecycle where hooks can be attached.
     */
    enum class HookPoint {
        ON_ROUTE,      ///< A route was added to the registration table (mounted copies excluded).
        ON_NAME,       ///< The latest route was named.
        ON_GROUP,      ///< A group was created by `Group::group`.
        ON_GROUP_NAME, ///< A group named itself.
        ON_MOUNT       ///< The application was mounted into a parent application.
    };

    /** @brief Returns the name of a hook point, e.g. "OnGroupName". */
    [[nodiscard]] const char *to_string(HookPoint point) noexcept;

    /**
     * @brief Value copy of a group's state, handed to group hooks.
     */
    struct GroupSnapshot {
        std::string prefix;
        std::string name;
        bool any_route_defined = false;
        bool has_parent = false;
        std::string parent_name; ///< Empty when the group has no parent or the parent is unnamed.
    };

    /**
     * @brief Ordered hook lists of one application.
     */
    class Hooks {
    public:
        using RouteHook = std::function<HookStatus(const Route &route)>;
        using GroupHook = std::function<HookStatus(const GroupSnapshot &group)>;
        using MountHook = std::function<HookStatus(Application &parent)>;

    private:
        std::vector<RouteHook> _on_route;
        std::vector<RouteHook> _on_name;
        std::vector<GroupHook> _on_group;
        std::vector<GroupHook> _on_group_name;
        std::vector<MountHook> _on_mount;

    public:
        /** @brief Adds a hook run for every route added to the table. Null hooks are ignored. */
        Hooks &on_route(RouteHook hook);
        /**
         * @brief Adds a hook run after the latest route was named.
         * @warning Runs while the application lock is held. The lock is not recursive:
         *          the hook must not call back into the application (`name`, `routes`,
         *          `latest_route`, registrations, ...).
         */
        Hooks &on_name(RouteHook hook);
        /** @brief Adds a hook run for every group created by `Group::group`. */
        Hooks &on_group(GroupHook hook);
        /**
         * @brief Adds a hook run when a group names itself.
         * @warning Runs while the application lock is held. The lock is not recursive:
         *          the hook must not call back into the application or name a group.
         */
        Hooks &on_group_name(GroupHook hook);
        /** @brief Adds a hook run when this application is mounted, with the parent application. */
        Hooks &on_mount(MountHook hook);

        [[nodiscard]] HookStatus execute_on_route(const Route &route) const;
        [[nodiscard]] HookStatus execute_on_name(const Route &route) const;
        [[nodiscard]] HookStatus execute_on_group(const GroupSnapshot &group) const;
        [[nodiscard]] HookStatus execute_on_group_name(const GroupSnapshot &group) const;
        [[nodiscard]] HookStatus execute_on_mount(Application &parent) const;

        /** @brief Removes every hook. */
        void clear() noexcept;
    };
} // namespace qb::route
