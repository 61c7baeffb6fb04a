#include "./route.h"

namespace qb::route {

namespace {

bool
ends_param_name(char c) noexcept {
    return c == '/' || c == '-' || c == '.' || c == '?' || c == ':' || c == '*' || c == '+' || c == '\\';
}

} // namespace

std::vector<std::string>
parse_route_params(std::string_view pattern) {
    std::vector<std::string> params;
    int                      wildcards = 0;
    int                      pluses    = 0;

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            ++i; // escaped marker, keep it literal
            continue;
        }
        if (c == '*') {
            params.push_back("*" + std::to_string(++wildcards));
        } else if (c == '+') {
            params.push_back("+" + std::to_string(++pluses));
        } else if (c == ':') {
            std::size_t end = i + 1;
            while (end < pattern.size() && !ends_param_name(pattern[end]))
                ++end;
            if (end > i + 1)
                params.emplace_back(pattern.substr(i + 1, end - i - 1));
            i = end - 1;
        }
    }
    return params;
}

} // namespace qb::route
