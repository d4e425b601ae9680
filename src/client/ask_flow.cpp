#include "client/ask_flow.hpp"

#include <algorithm>
#include <thread>
#include "core/logging/logger.hpp"
#include "protocol/permission_answer.hpp"

namespace pokeme::client {

using core::errors::BrokerError;
using core::errors::ErrorCategory;

core::errors::Result<protocol::Request> wait_for_answer(
    BrokerApi& api, const std::string& id, const std::chrono::milliseconds timeout,
    const std::chrono::milliseconds poll_interval) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        auto status = api.fetch_status(id);
        if (core::errors::is_error(status)) {
            POKEME_LOG_DEBUG("wait_for_answer: poll failed: " +
                             core::errors::get_error(status).message);
        } else if (core::errors::get_value(status).status ==
                   protocol::RequestStatus::Answered) {
            return core::errors::get_value(status);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        std::this_thread::sleep_for(std::min(poll_interval, remaining));
    }

    return BrokerError{ErrorCategory::Timeout, "timed out waiting for answer",
                       "poll_timeout"};
}

AskOutcome classify(const protocol::Request& answered) {
    AskOutcome outcome;
    outcome.text = answered.answer.value_or("");
    if (answered.request_type != protocol::RequestType::Permission) {
        return outcome;
    }

    // Anything but an explicit approval keeps the command from running.
    auto decoded = protocol::decode_permission_answer(outcome.text);
    if (core::errors::is_error(decoded)) {
        POKEME_LOG_WARN("Permission answer is not a decision, treating as denial: " +
                        core::errors::get_error(decoded).message);
        outcome.kind = OutcomeKind::Denied;
        outcome.comment = outcome.text;
        return outcome;
    }

    const auto& permission = core::errors::get_value(decoded);
    outcome.kind = permission.decision == protocol::PermissionDecision::Approved
                       ? OutcomeKind::Approved
                       : OutcomeKind::Denied;
    outcome.comment = permission.comment;
    return outcome;
}

int exit_code_for(const AskOutcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Denied:
            return kExitDenied;
        case OutcomeKind::Answered:
        case OutcomeKind::Approved:
        default:
            return kExitOk;
    }
}

}  // namespace pokeme::client
