#include "./path.h"

#include <algorithm>
#include <cctype>

namespace qb::route {

std::string_view
trim_slashes(std::string_view segment) noexcept {
    while (!segment.empty() && segment.front() == '/')
        segment.remove_prefix(1);
    while (!segment.empty() && segment.back() == '/')
        segment.remove_suffix(1);
    return segment;
}

std::string
compose_path(std::string_view parent, std::string_view child) {
    const auto normalized_parent = trim_slashes(parent);
    const auto normalized_child  = trim_slashes(child);

    std::string result;
    result.reserve(normalized_parent.size() + normalized_child.size() + 2);
    result += '/';
    result.append(normalized_parent.data(), normalized_parent.size());
    if (!normalized_child.empty()) {
        if (!normalized_parent.empty())
            result += '/';
        result.append(normalized_child.data(), normalized_child.size());
    }
    return result;
}

std::string
route_pattern(std::string_view path, bool case_sensitive, bool strict_routing) {
    std::string pattern(path);
    if (pattern.empty() || pattern.front() != '/')
        pattern.insert(pattern.begin(), '/');
    if (!case_sensitive) {
        std::transform(pattern.begin(), pattern.end(), pattern.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    if (!strict_routing) {
        while (pattern.size() > 1 && pattern.back() == '/')
            pattern.pop_back();
    }
    return pattern;
}

} // namespace qb::route
