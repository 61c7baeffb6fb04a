/**
 * @file qbm/route/route.h
 * @brief Main interface of the qb route module.
 *
 * Single include point for building hierarchical routing trees:
 *
 * - `Application`: owner of the registration table, hooks and groups
 * - `Group`: sub-router scoped to a path prefix, with nested groups and dual-mode naming
 * - `Registering`: chainable registrar bound to one path
 * - `Hooks`: lifecycle callbacks run while routes and groups are built
 * - `Config` and `StaticOptions`: application and static file settings
 * - `Context`: the request context handed to route handlers
 *
 * @code
 * #include <qbm/route/route.h>
 *
 * auto app = qb::route::Application::create();
 * auto &api = app->group("/api").name("api.");
 * api.get("/users/:id", show_user).name("user.show"); // route "api.user.show"
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Route
 */
#ifndef QB_MODULE_ROUTE_H_
#define QB_MODULE_ROUTE_H_

#include "./types.h"
#include "./error.h"
#include "./config.h"
#include "./context.h"

#include "./routing/path.h"
#include "./routing/route.h"
#include "./routing/hooks.h"
#include "./routing/group.h"
#include "./routing/registering.h"
#include "./routing/application.h"

/**
 * @namespace qb::route
 * @brief Hierarchical route groups, route naming and sub-application mounting.
 */

#endif // QB_MODULE_ROUTE_H_
