#include "./registering.h"

#include <utility>

#include "./application.h"
#include "./path.h"

namespace qb::route {

Registering::Registering(Application &app, std::string path)
    : _app(&app), _path(std::move(path)) {
}

Registering &
Registering::add(const Methods &methods, Handler handler, std::vector<Handler> middleware) {
    _app->register_route(methods, _path, nullptr, std::move(handler), std::move(middleware));
    return *this;
}

Registering &
Registering::get(Handler handler, std::vector<Handler> middleware) {
    return add({method::GET}, std::move(handler), std::move(middleware));
}

Registering &
Registering::head(Handler handler, std::vector<Handler> middleware) {
    return add({method::HEAD}, std::move(handler), std::move(middleware));
}

Registering &
Registering::post(Handler handler, std::vector<Handler> middleware) {
    return add({method::POST}, std::move(handler), std::move(middleware));
}

Registering &
Registering::put(Handler handler, std::vector<Handler> middleware) {
    return add({method::PUT}, std::move(handler), std::move(middleware));
}

Registering &
Registering::del(Handler handler, std::vector<Handler> middleware) {
    return add({method::DEL}, std::move(handler), std::move(middleware));
}

Registering &
Registering::connect(Handler handler, std::vector<Handler> middleware) {
    return add({method::CONNECT}, std::move(handler), std::move(middleware));
}

Registering &
Registering::options(Handler handler, std::vector<Handler> middleware) {
    return add({method::OPTIONS}, std::move(handler), std::move(middleware));
}

Registering &
Registering::trace(Handler handler, std::vector<Handler> middleware) {
    return add({method::TRACE}, std::move(handler), std::move(middleware));
}

Registering &
Registering::patch(Handler handler, std::vector<Handler> middleware) {
    return add({method::PATCH}, std::move(handler), std::move(middleware));
}

Registering &
Registering::all(Handler handler, std::vector<Handler> middleware) {
    return add(_app->config().request_methods(), std::move(handler), std::move(middleware));
}

Registering &
Registering::use(std::vector<Handler> handlers) {
    _app->register_route({method::USE}, _path, nullptr, nullptr, std::move(handlers));
    return *this;
}

Registering &
Registering::name(const std::string &name) {
    _app->name(name);
    return *this;
}

Registering
Registering::route(const std::string &path) const {
    return Registering(*_app, compose_path(_path, path));
}

} // namespace qb::route
