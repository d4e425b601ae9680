#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include "client/broker_api.hpp"
#include "core/errors/broker_errors.hpp"

namespace pokeme::client {

struct LaunchOptions {
    std::filesystem::path executable;  // binary that understands `serve --port N`
    std::uint16_t port = 9131;
    int readiness_attempts = 50;
    std::chrono::milliseconds readiness_interval{100};
};

// Starts a detached broker unless `api` already answers a health check.
// Returns true when a broker is reachable afterwards.
core::errors::Result<bool> ensure_broker(BrokerApi& api, const LaunchOptions& options);

// Path of the running binary, from /proc/self/exe.
core::errors::Result<std::filesystem::path> current_executable();

}  // namespace pokeme::client
