#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "core/config/broker_config.hpp"
#include "core/errors/broker_errors.hpp"
#include "protocol/request.hpp"

namespace pokeme::app::cli {

    enum class CommandKind {
        Serve,
        Ask,
        Permit,
        Status,
        Answer,
        Approve,
        Deny,
        Shutdown
    };

    // Validated command line
    struct CliCommand {
        CommandKind kind = CommandKind::Status;
        std::uint16_t port = core::config::kDefaultPort;
        bool verbose = false;

        // serve
        std::chrono::seconds idle_timeout{600};

        // ask / permit
        protocol::NewRequest request;
        std::chrono::seconds timeout{300};

        // answer / approve / deny
        std::string request_id;
        std::string answer_text;
        std::string comment;
    };

    std::string usage();

    core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);
}
