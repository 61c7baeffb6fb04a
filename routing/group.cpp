#include "./group.h"

#include <mutex>
#include <variant>

#include "../error.h"
#include "../logger.h"
#include "./application.h"
#include "./path.h"
#include "./registering.h"

namespace qb::route {

namespace {

// Buckets of a `use` call, filled by one pass over its arguments.
struct UseBuckets {
    std::string prefix;
    std::vector<std::string> prefixes;
    std::shared_ptr<Application> sub_app;
    std::vector<Handler> handlers;

    void operator()(std::string &&value) { prefix = std::move(value); }
    void operator()(std::vector<std::string> &&value) { prefixes = std::move(value); }

    void operator()(std::shared_ptr<Application> &&value) {
        if (!value) {
            LOG_ROUTE_ERROR("use: null sub-application argument");
            throw SetupError(SetupError::Kind::INVALID_USE_ARGUMENT,
                             "use: invalid argument of type std::shared_ptr<qb::route::Application> (null)");
        }
        sub_app = std::move(value);
    }

    void operator()(Handler &&value) {
        if (!value) {
            LOG_ROUTE_ERROR("use: empty handler argument");
            throw SetupError(SetupError::Kind::INVALID_USE_ARGUMENT,
                             "use: invalid argument of type qb::route::Handler (empty)");
        }
        handlers.push_back(std::move(value));
    }
};

} // namespace

Group::Group(Application &app, const Group *parent, std::string prefix)
    : _app(&app), _parent(parent), _prefix(std::move(prefix)) {
}

GroupSnapshot
Group::snapshot() const {
    GroupSnapshot snapshot;
    snapshot.prefix = _prefix;
    snapshot.name = _name;
    snapshot.any_route_defined = _any_route_defined;
    snapshot.has_parent = _parent != nullptr;
    if (_parent)
        snapshot.parent_name = _parent->_name;
    return snapshot;
}

Group &
Group::name(const std::string &name) {
    if (_any_route_defined) {
        _app->name(name);
        return *this;
    }

    std::lock_guard<std::mutex> lock(_app->mutex());
    _name = _parent ? _parent->_name + name : name;
    LOG_ROUTE_DEBUG("group " << _prefix << " named '" << _name << "'");

    if (auto status = _app->hooks().execute_on_group_name(snapshot()))
        _app->hook_failed(HookPoint::ON_GROUP_NAME, *status);
    return *this;
}

Group &
Group::use(std::vector<UseArgument> args) {
    UseBuckets buckets;
    for (auto &arg : args)
        std::visit([&buckets](auto &&value) { buckets(std::move(value)); }, std::move(arg));

    if (buckets.prefixes.empty())
        buckets.prefixes.push_back(buckets.prefix);

    for (const auto &prefix : buckets.prefixes) {
        if (buckets.sub_app) {
            mount(prefix, buckets.sub_app);
            mark_route_defined();
            return *this;
        }
        _app->register_route({method::USE}, compose_path(_prefix, prefix), this, nullptr, buckets.handlers);
    }

    mark_route_defined();
    return *this;
}

void
Group::mount(const std::string &prefix, const std::shared_ptr<Application> &sub_app) {
    _app->mount(compose_path(_prefix, prefix), sub_app);
}

Group &
Group::add(const Methods &methods, const std::string &path, Handler handler, std::vector<Handler> middleware) {
    _app->register_route(methods, compose_path(_prefix, path), this, std::move(handler), std::move(middleware));
    mark_route_defined();
    return *this;
}

Group &
Group::get(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::GET}, path, std::move(handler), std::move(middleware));
}

Group &
Group::head(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::HEAD}, path, std::move(handler), std::move(middleware));
}

Group &
Group::post(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::POST}, path, std::move(handler), std::move(middleware));
}

Group &
Group::put(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::PUT}, path, std::move(handler), std::move(middleware));
}

Group &
Group::del(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::DEL}, path, std::move(handler), std::move(middleware));
}

Group &
Group::connect(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::CONNECT}, path, std::move(handler), std::move(middleware));
}

Group &
Group::options(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::OPTIONS}, path, std::move(handler), std::move(middleware));
}

Group &
Group::trace(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::TRACE}, path, std::move(handler), std::move(middleware));
}

Group &
Group::patch(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add({method::PATCH}, path, std::move(handler), std::move(middleware));
}

Group &
Group::all(const std::string &path, Handler handler, std::vector<Handler> middleware) {
    return add(_app->config().request_methods(), path, std::move(handler), std::move(middleware));
}

Group &
Group::static_files(const std::string &prefix, const std::string &root, StaticOptions options) {
    _app->register_static(compose_path(_prefix, prefix), root, std::move(options));
    mark_route_defined();
    return *this;
}

Group &
Group::group(const std::string &prefix, std::vector<Handler> handlers) {
    const auto full_prefix = compose_path(_prefix, prefix);
    if (!handlers.empty())
        _app->register_route({method::USE}, full_prefix, this, nullptr, std::move(handlers));

    return _app->create_group(this, full_prefix);
}

Registering
Group::route(const std::string &path) const {
    return Registering(*_app, compose_path(_prefix, path));
}

} // namespace qb::route
