#include "./application.h"

#include <algorithm>
#include <cctype>

#include "../error.h"
#include "../logger.h"
#include "./path.h"

namespace qb::route {

namespace {

std::string
absolute_path(const std::string &path) {
    if (path.empty())
        return "/";
    if (path.front() != '/')
        return "/" + path;
    return path;
}

bool
covers(const std::string &prefix, const std::string &path) noexcept {
    if (prefix == "/" || path == prefix)
        return true;
    return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
           path[prefix.size()] == '/';
}

} // namespace

Application::Application(Config config)
    : _config(std::move(config)) {
    _groups.push_back(std::unique_ptr<Group>(new Group(*this, nullptr, "/")));
}

std::shared_ptr<Application>
Application::create(Config config) {
    return std::make_shared<Application>(std::move(config));
}

void
Application::hook_failed(HookPoint point, const std::string &message) const {
    LOG_ROUTE_ERROR(to_string(point) << " hook failed: " << message);
    throw SetupError(SetupError::Kind::HOOK_FAILED, std::string(to_string(point)) + " hook failed: " + message);
}

std::string
Application::checked_method(const std::string &method) const {
    std::string upper(method);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == method::USE)
        return upper;

    const auto &methods = _config.request_methods();
    if (std::find(methods.begin(), methods.end(), upper) == methods.end()) {
        LOG_ROUTE_ERROR("add: invalid http method " << upper);
        throw SetupError(SetupError::Kind::INVALID_METHOD, "add: invalid http method " + upper);
    }
    return upper;
}

std::unique_ptr<Route>
Application::make_route(const std::string &method, const std::string &path) const {
    auto route = std::make_unique<Route>();
    route->method = method;
    route->path = path;
    route->pattern = route_pattern(path, _config.case_sensitive(), _config.strict_routing());
    route->params = parse_route_params(path);
    route->star = route->pattern == "/*";
    route->root = route->pattern == "/";
    return route;
}

void
Application::add_route(std::unique_ptr<Route> route) {
    Route *added = route.get();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        route->position = _routes.size();
        _routes.push_back(std::move(route));
        _latest_route = added;
    }
    LOG_ROUTE_DEBUG("added " << added->method << " " << added->path
                    << (added->use ? " (use)" : "") << (added->mount ? " (mount)" : ""));

    if (added->mount)
        return;
    if (auto status = _hooks.execute_on_route(*added))
        hook_failed(HookPoint::ON_ROUTE, *status);
}

void
Application::register_route(const Methods &methods, const std::string &path, const Group *group,
                            Handler handler, std::vector<Handler> middleware) {
    const auto raw_path = absolute_path(path);

    std::vector<Handler> handlers = std::move(middleware);
    if (handler)
        handlers.push_back(std::move(handler));
    if (handlers.empty()) {
        LOG_ROUTE_ERROR("missing handler/middleware in route: " << raw_path);
        throw SetupError(SetupError::Kind::MISSING_HANDLER, "missing handler/middleware in route: " + raw_path);
    }
    if (std::any_of(handlers.begin(), handlers.end(), [](const Handler &h) { return !h; })) {
        LOG_ROUTE_ERROR("empty handler in route: " << raw_path);
        throw SetupError(SetupError::Kind::MISSING_HANDLER, "empty handler in route: " + raw_path);
    }

    Methods checked;
    checked.reserve(methods.size());
    for (const auto &m : methods)
        checked.push_back(checked_method(m));

    for (const auto &m : checked) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _handlers_count += handlers.size();
        }

        if (m != method::USE) {
            auto route = make_route(m, raw_path);
            route->handlers = handlers;
            route->group = group;
            add_route(std::move(route));
            continue;
        }

        // Copy: a hook may reconfigure the application while we iterate.
        const Methods request_methods = _config.request_methods();
        for (const auto &request_method : request_methods) {
            auto route = make_route(request_method, raw_path);
            route->handlers = handlers;
            route->group = group;
            route->use = true;
            add_route(std::move(route));
        }
    }
}

void
Application::register_static(const std::string &path, const std::string &root, StaticOptions options) {
    const auto raw_path = absolute_path(path);
    if (root.empty()) {
        LOG_ROUTE_ERROR("static: root cannot be empty for " << raw_path);
        throw SetupError(SetupError::Kind::INVALID_STATIC_ROOT, "static: root cannot be empty for " + raw_path);
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _statics.push_back(StaticEntry{raw_path, root, std::move(options)});
        ++_handlers_count;
    }
    LOG_ROUTE_DEBUG("static " << raw_path << " -> " << root);

    // HEAD first so that the GET route is the latest and naming covers both
    for (const char *m : {method::HEAD, method::GET}) {
        auto route = make_route(m, raw_path);
        route->is_static = true;
        add_route(std::move(route));
    }
}

Application &
Application::name(const std::string &name) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_latest_route) {
        LOG_ROUTE_ERROR("name: no route registered to receive name '" << name << "'");
        throw SetupError(SetupError::Kind::NO_ROUTE_TO_NAME, "name: no route registered to receive name '" + name + "'");
    }

    const Route &latest = *_latest_route;
    for (auto &route : _routes) {
        const bool method_matches = route->method == latest.method || latest.use ||
                                    (latest.method == method::GET && route->method == method::HEAD);
        if (route->path == latest.path && method_matches)
            route->name = route->group ? route->group->name() + name : name;
    }
    LOG_ROUTE_DEBUG("named " << latest.method << " " << latest.path << " '" << latest.name << "'");

    if (auto status = _hooks.execute_on_name(latest))
        hook_failed(HookPoint::ON_NAME, *status);
    return *this;
}

Group &
Application::create_group(const Group *parent, std::string prefix) {
    std::unique_ptr<Group> group(new Group(*this, parent, std::move(prefix)));
    if (auto status = _hooks.execute_on_group(group->snapshot()))
        hook_failed(HookPoint::ON_GROUP, *status);

    LOG_ROUTE_DEBUG("group " << group->prefix() << " created");
    std::lock_guard<std::mutex> lock(_mutex);
    _groups.push_back(std::move(group));
    return *_groups.back();
}

bool
Application::reaches(const Application *target) const {
    std::vector<std::shared_ptr<Application> > pending;
    std::vector<const Application *> visited{this};
    for (const auto &entry : mounted())
        pending.push_back(entry.second);

    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();
        if (current.get() == target)
            return true;
        if (std::find(visited.begin(), visited.end(), current.get()) != visited.end())
            continue;
        visited.push_back(current.get());
        for (const auto &entry : current->mounted())
            pending.push_back(entry.second);
    }
    return false;
}

void
Application::mount(const std::string &path, const std::shared_ptr<Application> &sub_app) {
    if (!sub_app) {
        LOG_ROUTE_ERROR("mount: null sub-application");
        throw SetupError(SetupError::Kind::INVALID_USE_ARGUMENT, "mount: sub-application cannot be null");
    }
    const auto mount_path = compose_path(path, "");
    if (sub_app.get() == this) {
        LOG_ROUTE_ERROR("mount: application mounted into itself at " << mount_path);
        throw SetupError(SetupError::Kind::INVALID_USE_ARGUMENT,
                         "mount: an application cannot be mounted into itself");
    }
    // Mounted applications are held by shared_ptr: a cycle would never be released.
    if (sub_app->reaches(this)) {
        LOG_ROUTE_ERROR("mount: " << mount_path << " would create a mount cycle");
        throw SetupError(SetupError::Kind::INVALID_USE_ARGUMENT,
                         "mount: " + mount_path + " would create a mount cycle");
    }

    std::vector<Route> sub_routes;
    std::vector<StaticEntry> sub_statics;
    MountedApps sub_mounted;
    qb::unordered_map<std::string, ErrorHandler> sub_error_handlers;
    std::size_t sub_handlers_count;
    {
        std::lock_guard<std::mutex> lock(sub_app->_mutex);
        sub_routes.reserve(sub_app->_routes.size());
        for (const auto &route : sub_app->_routes)
            sub_routes.push_back(*route);
        sub_statics = sub_app->_statics;
        sub_mounted = sub_app->_mounted;
        sub_error_handlers = sub_app->_error_handlers;
        sub_handlers_count = sub_app->_handlers_count;
    }

    const auto &methods = _config.request_methods();
    for (const auto &sub_route : sub_routes) {
        if (std::find(methods.begin(), methods.end(), sub_route.method) == methods.end()) {
            LOG_ROUTE_ERROR("mount: invalid http method " << sub_route.method << " in route "
                            << sub_route.path << " mounted at " << mount_path);
            throw SetupError(SetupError::Kind::INVALID_METHOD,
                             "mount: invalid http method " + sub_route.method + " in route " +
                                 sub_route.path + " mounted at " + mount_path);
        }
    }

    for (auto &sub_route : sub_routes) {
        auto route = make_route(sub_route.method, compose_path(mount_path, sub_route.path));
        route->name = std::move(sub_route.name);
        route->handlers = std::move(sub_route.handlers);
        route->use = sub_route.use;
        route->is_static = sub_route.is_static;
        route->group = sub_route.group;
        route->mount = true;
        add_route(std::move(route));
    }

    std::vector<std::pair<std::shared_ptr<Application>, std::string> > mount_paths;
    mount_paths.emplace_back(sub_app, mount_path);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _handlers_count += sub_handlers_count;
        for (auto &entry : sub_statics) {
            entry.path = compose_path(mount_path, entry.path);
            _statics.push_back(std::move(entry));
        }

        _mounted[mount_path] = sub_app;
        for (const auto &[sub_path, nested] : sub_mounted) {
            if (nested == sub_app || nested.get() == this)
                continue;
            auto full_path = compose_path(mount_path, sub_path);
            _mounted[full_path] = nested;
            mount_paths.emplace_back(nested, std::move(full_path));
        }

        if (sub_app->config().has_error_handler())
            _error_handlers[mount_path] = sub_app->config().error_handler();
        for (const auto &[sub_path, handler] : sub_error_handlers)
            _error_handlers[compose_path(mount_path, sub_path)] = handler;
    }
    for (auto &[app, full_path] : mount_paths) {
        std::lock_guard<std::mutex> lock(app->_mutex);
        app->_mount_path = std::move(full_path);
    }
    LOG_ROUTE_INFO("mounted " << (sub_app->config().app_name().empty() ? "application" : sub_app->config().app_name())
                   << " at " << mount_path << " (" << sub_routes.size() << " routes)");

    if (auto status = sub_app->hooks().execute_on_mount(*this))
        hook_failed(HookPoint::ON_MOUNT, *status);
}

std::vector<std::vector<Route> >
Application::stack() const {
    std::lock_guard<std::mutex> lock(_mutex);
    const auto &methods = _config.request_methods();
    std::vector<std::vector<Route> > result(methods.size());
    for (const auto &route : _routes) {
        auto it = std::find(methods.begin(), methods.end(), route->method);
        if (it != methods.end())
            result[static_cast<std::size_t>(it - methods.begin())].push_back(*route);
    }
    return result;
}

std::vector<Route>
Application::routes(bool filter_use) const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<Route> result;
    result.reserve(_routes.size());
    for (const auto &route : _routes) {
        if (filter_use && route->use)
            continue;
        result.push_back(*route);
    }
    return result;
}

std::optional<Route>
Application::route_by_name(const std::string &name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &route : _routes) {
        if (route->name == name)
            return *route;
    }
    return std::nullopt;
}

std::optional<Route>
Application::latest_route() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_latest_route)
        return std::nullopt;
    return *_latest_route;
}

std::size_t
Application::handlers_count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _handlers_count;
}

std::vector<StaticEntry>
Application::statics() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _statics;
}

Application::MountedApps
Application::mounted() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mounted;
}

std::string
Application::mount_path() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mount_path;
}

ErrorHandler
Application::error_handler(const std::string &path) const {
    std::lock_guard<std::mutex> lock(_mutex);
    const std::string *best = nullptr;
    ErrorHandler handler;
    for (const auto &[prefix, candidate] : _error_handlers) {
        if (covers(prefix, path) && (!best || prefix.size() > best->size())) {
            best = &prefix;
            handler = candidate;
        }
    }
    return best ? handler : _config.error_handler();
}

qb::json
Application::routes_document() const {
    qb::json document = qb::json::array();
    for (const auto &route : routes(true)) {
        qb::json entry = qb::json::object();
        entry["method"] = route.method;
        entry["name"] = route.name;
        entry["path"] = route.path;
        entry["params"] = route.params;
        document.push_back(std::move(entry));
    }
    return document;
}

} // namespace qb::route
