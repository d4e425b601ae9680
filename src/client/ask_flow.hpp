#pragma once

#include <chrono>
#include <string>
#include "client/broker_api.hpp"
#include "core/errors/broker_errors.hpp"
#include "protocol/request.hpp"

namespace pokeme::client {

enum class OutcomeKind {
    Answered,   // plain question, `text` is the answer
    Approved,   // permission granted
    Denied      // permission refused
};

struct AskOutcome {
    OutcomeKind kind = OutcomeKind::Answered;
    std::string text;
    std::string comment;
};

// Process exit codes of the caller CLI.
enum ExitCode : int {
    kExitOk = 0,
    kExitFailure = 1,   // timeout or request failure
    kExitUsage = 2,
    kExitDenied = 3,
    kExitUnavailable = 4
};

// Polls the request's status every `poll_interval` until it is answered or
// `timeout` elapses. Errors while polling are retried; the broker is never
// told that the caller gave up.
core::errors::Result<protocol::Request> wait_for_answer(
    BrokerApi& api, const std::string& id, std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll_interval);

// A permission answer that does not decode as a decision is a denial, with
// the raw answer as the comment.
AskOutcome classify(const protocol::Request& answered);

int exit_code_for(const AskOutcome& outcome);

}  // namespace pokeme::client
