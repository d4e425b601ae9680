#include <chrono>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "client/ask_flow.hpp"
#include "client/broker_client.hpp"
#include "client/launcher.hpp"
#include "core/config/broker_config.hpp"
#include "core/errors/broker_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/permission_answer.hpp"
#include "server/broker_server.hpp"
#include "store/request_store.hpp"

namespace {

using pokeme::app::cli::CliCommand;
using pokeme::app::cli::CommandKind;
using pokeme::core::errors::BrokerError;
using pokeme::core::errors::ErrorCategory;
using pokeme::core::errors::get_error;
using pokeme::core::errors::get_value;
using pokeme::core::errors::is_error;
namespace client = pokeme::client;

int report(const BrokerError& err) {
    std::cerr << "pokeme: " << err.message << std::endl;
    if (!err.hint.empty()) {
        std::cerr << "  " << err.hint << std::endl;
    }
    return err.category == ErrorCategory::Transport ? client::kExitUnavailable
                                                    : client::kExitFailure;
}

int run_serve(const CliCommand& cmd) {
    pokeme::core::logging::Logger::get().set_component("broker");

    pokeme::core::config::BrokerConfig config;
    config.port = cmd.port;
    config.idle_timeout = cmd.idle_timeout;

    pokeme::store::RequestStore store(config.limits);
    pokeme::server::BrokerServer server(config, store);
    auto bound = server.bind();
    if (is_error(bound)) {
        const auto& err = get_error(bound);
        POKEME_LOG_ERROR("Failed to start broker [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            POKEME_LOG_INFO("Hint: " + err.hint);
        }
        return client::kExitFailure;
    }

    server.run();
    return client::kExitOk;
}

int run_ask(const CliCommand& cmd) {
    pokeme::core::logging::Logger::get().set_component("ask");
    client::BrokerClient api(cmd.port);

    auto executable = client::current_executable();
    if (is_error(executable)) {
        return report(get_error(executable));
    }
    client::LaunchOptions launch;
    launch.executable = get_value(executable);
    launch.port = cmd.port;
    auto ready = client::ensure_broker(api, launch);
    if (is_error(ready)) {
        return report(get_error(ready));
    }

    auto submitted = api.submit(cmd.request);
    if (is_error(submitted)) {
        return report(get_error(submitted));
    }
    const std::string id = get_value(submitted);
    std::cerr << "pokeme: respond at " << api.base_url() << std::endl;

    const pokeme::core::config::ClientConfig defaults;
    auto answered = client::wait_for_answer(api, id, cmd.timeout, defaults.poll_interval);
    if (is_error(answered)) {
        std::cerr << "pokeme: " << get_error(answered).message << std::endl;
        return client::kExitFailure;
    }

    const auto outcome = client::classify(get_value(answered));
    switch (outcome.kind) {
        case client::OutcomeKind::Answered:
            std::cout << outcome.text << std::endl;
            break;
        case client::OutcomeKind::Approved:
            std::cerr << "pokeme: approved" << std::endl;
            if (!outcome.comment.empty()) {
                std::cout << outcome.comment << std::endl;
            }
            break;
        case client::OutcomeKind::Denied:
            std::cerr << "pokeme: denied" << std::endl;
            if (!outcome.comment.empty()) {
                std::cerr << "pokeme: " << outcome.comment << std::endl;
            }
            break;
    }
    return client::exit_code_for(outcome);
}

int run_status(const CliCommand& cmd) {
    client::BrokerClient api(cmd.port);
    if (!api.health()) {
        std::cout << "No pokeme server running." << std::endl;
        return client::kExitOk;
    }

    auto pending = api.fetch_pending();
    if (is_error(pending)) {
        return report(get_error(pending));
    }
    const auto& requests = get_value(pending);
    if (requests.empty()) {
        std::cout << "No pending requests." << std::endl;
        return client::kExitOk;
    }

    const auto now = std::chrono::system_clock::now();
    for (const auto& request : requests) {
        const auto age =
            std::chrono::duration_cast<std::chrono::seconds>(now - request.created_at).count();
        std::cout << "  [" << request.agent.value_or("unknown") << "] (" << age
                  << "s ago) " << request.question;
        if (request.command) {
            std::cout << " $ " << request.command.value();
        }
        std::cout << "  {" << request.id << "}" << std::endl;
    }
    return client::kExitOk;
}

int run_answer(const CliCommand& cmd) {
    std::string text = cmd.answer_text;
    if (cmd.kind == CommandKind::Approve || cmd.kind == CommandKind::Deny) {
        pokeme::protocol::PermissionAnswer permission;
        permission.decision = cmd.kind == CommandKind::Approve
                                  ? pokeme::protocol::PermissionDecision::Approved
                                  : pokeme::protocol::PermissionDecision::Denied;
        permission.comment = cmd.comment;
        text = pokeme::protocol::encode_permission_answer(
            permission, pokeme::core::config::Limits{}.max_answer);
    }

    client::BrokerClient api(cmd.port);
    auto answered = api.submit_answer(cmd.request_id, text);
    if (is_error(answered)) {
        return report(get_error(answered));
    }
    std::cout << "ok" << std::endl;
    return client::kExitOk;
}

int run_shutdown(const CliCommand& cmd) {
    client::BrokerClient api(cmd.port);
    if (!api.health()) {
        std::cout << "No pokeme server running." << std::endl;
        return client::kExitOk;
    }
    // The broker may close the socket before the reply is written.
    auto stopped = api.request_shutdown();
    if (is_error(stopped)) {
        POKEME_LOG_DEBUG("shutdown reply lost: " + get_error(stopped).message);
    }
    return client::kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = pokeme::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        const auto& err = get_error(parsed);
        POKEME_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint << std::endl;
        }
        return client::kExitUsage;
    }

    const auto& cmd = get_value(parsed);
    if (cmd.verbose) {
        pokeme::core::logging::Logger::get().set_min_level(
            pokeme::core::logging::LogLevel::DEBUG);
    }

    switch (cmd.kind) {
        case CommandKind::Serve:
            return run_serve(cmd);
        case CommandKind::Ask:
        case CommandKind::Permit:
            return run_ask(cmd);
        case CommandKind::Status:
            return run_status(cmd);
        case CommandKind::Answer:
        case CommandKind::Approve:
        case CommandKind::Deny:
            return run_answer(cmd);
        case CommandKind::Shutdown:
            return run_shutdown(cmd);
    }
    return client::kExitUsage;
}
