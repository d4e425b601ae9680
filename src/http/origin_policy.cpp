#include "http/origin_policy.hpp"

#include <array>
#include <cctype>

namespace pokeme::http {

namespace {

bool is_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<std::string> allowed_origin(const std::string& origin) {
    static const std::array<std::string, 2> kLoopbackPrefixes = {
        "http://127.0.0.1", "http://localhost"};

    for (const auto& prefix : kLoopbackPrefixes) {
        if (origin.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const std::string rest = origin.substr(prefix.size());
        if (rest.empty()) {
            return origin;
        }
        // Anything but ":<digits>" (e.g. "localhost.evil.com") is a different host.
        if (rest[0] == ':' && is_port(rest.substr(1))) {
            return origin;
        }
    }
    return std::nullopt;
}

}  // namespace pokeme::http
