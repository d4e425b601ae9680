#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/broker_errors.hpp"
#include "protocol/request.hpp"

namespace pokeme::protocol {

struct AnswerBody {
    std::string id;
    std::string answer;
};

double to_unix_seconds(Timestamp ts);
Timestamp from_unix_seconds(double seconds);

nlohmann::json request_to_json(const Request& request);
core::errors::Result<Request> request_from_json(const nlohmann::json& payload);

nlohmann::json new_request_to_json(const NewRequest& request);

// Body of POST /api/ask. Only "question" is checked here; the store owns the
// permission/command rule.
core::errors::Result<NewRequest> parse_ask_body(const nlohmann::json& body);

// Body of POST /api/answer.
core::errors::Result<AnswerBody> parse_answer_body(const nlohmann::json& body);

}  // namespace pokeme::protocol
