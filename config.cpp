#include "./config.h"
#include "./context.h"

namespace qb::route {

void
Config::default_error_handler(Context &ctx, const std::exception &error) {
    if (ctx.status() < 400)
        ctx.status(500);
    ctx.body() = error.what();
}

Config &
Config::app_name(std::string name) {
    _app_name = std::move(name);
    return *this;
}

Config &
Config::request_methods(Methods methods) {
    _request_methods = std::move(methods);
    return *this;
}

Config &
Config::case_sensitive(bool enabled) {
    _case_sensitive = enabled;
    return *this;
}

Config &
Config::strict_routing(bool enabled) {
    _strict_routing = enabled;
    return *this;
}

Config &
Config::error_handler(ErrorHandler handler) {
    _error_handler = std::move(handler);
    return *this;
}

const std::string &
Config::app_name() const {
    return _app_name;
}

const Methods &
Config::request_methods() const {
    return _request_methods;
}

bool
Config::case_sensitive() const {
    return _case_sensitive;
}

bool
Config::strict_routing() const {
    return _strict_routing;
}

ErrorHandler
Config::error_handler() const {
    if (_error_handler)
        return _error_handler;
    return &Config::default_error_handler;
}

bool
Config::has_error_handler() const {
    return static_cast<bool>(_error_handler);
}

} // namespace qb::route
