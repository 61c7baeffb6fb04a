#include "./hooks.h"

#include <utility>

namespace qb::route {

namespace {

template<typename HookList, typename Arg>
HookStatus
run_hooks(const HookList &hooks, Arg &arg) {
    for (const auto &hook : hooks) {
        if (auto status = hook(arg))
            return status;
    }
    return std::nullopt;
}

template<typename HookList, typename Hook>
void
append_hook(HookList &hooks, Hook hook) {
    if (hook)
        hooks.push_back(std::move(hook));
}

} // namespace

const char *
to_string(HookPoint point) noexcept {
    switch (point) {
        case HookPoint::ON_ROUTE:      return "OnRoute";
        case HookPoint::ON_NAME:       return "OnName";
        case HookPoint::ON_GROUP:      return "OnGroup";
        case HookPoint::ON_GROUP_NAME: return "OnGroupName";
        case HookPoint::ON_MOUNT:      return "OnMount";
    }
    return "Unknown";
}

Hooks &
Hooks::on_route(RouteHook hook) {
    append_hook(_on_route, std::move(hook));
    return *this;
}

Hooks &
Hooks::on_name(RouteHook hook) {
    append_hook(_on_name, std::move(hook));
    return *this;
}

Hooks &
Hooks::on_group(GroupHook hook) {
    append_hook(_on_group, std::move(hook));
    return *this;
}

Hooks &
Hooks::on_group_name(GroupHook hook) {
    append_hook(_on_group_name, std::move(hook));
    return *this;
}

Hooks &
Hooks::on_mount(MountHook hook) {
    append_hook(_on_mount, std::move(hook));
    return *this;
}

HookStatus
Hooks::execute_on_route(const Route &route) const {
    return run_hooks(_on_route, route);
}

HookStatus
Hooks::execute_on_name(const Route &route) const {
    return run_hooks(_on_name, route);
}

HookStatus
Hooks::execute_on_group(const GroupSnapshot &group) const {
    return run_hooks(_on_group, group);
}

HookStatus
Hooks::execute_on_group_name(const GroupSnapshot &group) const {
    return run_hooks(_on_group_name, group);
}

HookStatus
Hooks::execute_on_mount(Application &parent) const {
    return run_hooks(_on_mount, parent);
}

void
Hooks::clear() noexcept {
    _on_route.clear();
    _on_name.clear();
    _on_group.clear();
    _on_group_name.clear();
    _on_mount.clear();
}

} // namespace qb::route
