#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pokeme::core::config {

constexpr std::uint16_t kDefaultPort = 9131;

// Caps applied by the broker. Text caps count characters, not bytes.
struct Limits {
    std::size_t max_body_bytes = 64 * 1024;
    std::size_t max_question = 2000;
    std::size_t max_context = 5000;
    std::size_t max_agent = 100;
    std::size_t max_task = 200;
    std::size_t max_command = 2000;
    std::size_t max_answer = 10000;
    std::size_t max_pending = 100;
    std::chrono::seconds answered_retention{300};
};

struct BrokerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = kDefaultPort;  // 0 binds an ephemeral port
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(600)};
    std::chrono::milliseconds watchdog_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds socket_timeout{std::chrono::seconds(5)};
    Limits limits;
};

struct ClientConfig {
    std::uint16_t port = kDefaultPort;
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
};

}  // namespace pokeme::core::config
