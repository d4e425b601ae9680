#pragma once

#include <optional>
#include <string>

namespace pokeme::http {

// Returns the origin to echo in Access-Control-Allow-Origin, or nullopt when
// the origin is not a loopback host. Accepted: http://127.0.0.1[:port] and
// http://localhost[:port].
std::optional<std::string> allowed_origin(const std::string& origin);

}  // namespace pokeme::http
