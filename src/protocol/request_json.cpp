#include "protocol/request_json.hpp"

#include <chrono>
#include <optional>

namespace pokeme::protocol {

using core::errors::BrokerError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json optional_to_json(const std::optional<std::string>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

// Present-but-not-a-string counts as absent.
std::optional<std::string> optional_string(const json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

double to_unix_seconds(const Timestamp ts) {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

Timestamp from_unix_seconds(const double seconds) {
    const auto since_epoch = std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(seconds));
    return Timestamp(since_epoch);
}

json request_to_json(const Request& request) {
    json payload;
    payload["id"] = request.id;
    payload["question"] = request.question;
    payload["context"] = optional_to_json(request.context);
    payload["agent"] = optional_to_json(request.agent);
    payload["task"] = optional_to_json(request.task);
    payload["request_type"] = to_string(request.request_type);
    payload["command"] = optional_to_json(request.command);
    payload["status"] = to_string(request.status);
    payload["answer"] = optional_to_json(request.answer);
    payload["created_at"] = to_unix_seconds(request.created_at);
    payload["answered_at"] = request.answered_at.has_value()
                                 ? json(to_unix_seconds(request.answered_at.value()))
                                 : json(nullptr);
    return payload;
}

core::errors::Result<Request> request_from_json(const json& payload) {
    if (!payload.is_object()) {
        return BrokerError{ErrorCategory::Transport,
                           "Request record is not a JSON object.",
                           "bad_response"};
    }

    const auto id = optional_string(payload, "id");
    const auto question = optional_string(payload, "question");
    const auto status_text = optional_string(payload, "status");
    if (!id || !question || !status_text) {
        return BrokerError{ErrorCategory::Transport,
                           "Request record is missing id, question or status.",
                           "bad_response"};
    }

    const auto status = parse_request_status(status_text.value());
    if (!status) {
        return BrokerError{ErrorCategory::Transport,
                           "Unknown request status: " + status_text.value(),
                           "bad_response"};
    }

    Request request;
    request.id = id.value();
    request.question = question.value();
    request.context = optional_string(payload, "context");
    request.agent = optional_string(payload, "agent");
    request.task = optional_string(payload, "task");
    request.command = optional_string(payload, "command");
    request.answer = optional_string(payload, "answer");
    request.status = status.value();

    const auto type_text = optional_string(payload, "request_type");
    if (type_text) {
        const auto type = parse_request_type(type_text.value());
        if (type) {
            request.request_type = type.value();
        }
    }

    const auto created_it = payload.find("created_at");
    if (created_it != payload.end() && created_it->is_number()) {
        request.created_at = from_unix_seconds(created_it->get<double>());
    }
    const auto answered_it = payload.find("answered_at");
    if (answered_it != payload.end() && answered_it->is_number()) {
        request.answered_at = from_unix_seconds(answered_it->get<double>());
    }
    return request;
}

json new_request_to_json(const NewRequest& request) {
    json payload;
    payload["question"] = request.question;
    if (request.context) payload["context"] = request.context.value();
    if (request.agent) payload["agent"] = request.agent.value();
    if (request.task) payload["task"] = request.task.value();
    payload["request_type"] = to_string(request.request_type);
    if (request.command) payload["command"] = request.command.value();
    return payload;
}

core::errors::Result<NewRequest> parse_ask_body(const json& body) {
    if (!body.is_object()) {
        return BrokerError{ErrorCategory::Validation, "missing question",
                           "missing_question"};
    }

    const auto question = optional_string(body, "question");
    if (!question) {
        return BrokerError{ErrorCategory::Validation, "missing question",
                           "missing_question"};
    }

    NewRequest request;
    request.question = question.value();
    request.context = optional_string(body, "context");
    request.agent = optional_string(body, "agent");
    request.task = optional_string(body, "task");
    request.command = optional_string(body, "command");

    const auto type_text = optional_string(body, "request_type");
    if (type_text) {
        const auto type = parse_request_type(type_text.value());
        if (!type) {
            return BrokerError{ErrorCategory::Validation,
                               "invalid request_type: " + type_text.value(),
                               "invalid_request_type",
                               "Use \"question\" or \"permission\"."};
        }
        request.request_type = type.value();
    }
    return request;
}

core::errors::Result<AnswerBody> parse_answer_body(const json& body) {
    if (!body.is_object()) {
        return BrokerError{ErrorCategory::Validation, "missing id or answer",
                           "missing_fields"};
    }

    const auto id = optional_string(body, "id");
    const auto answer = optional_string(body, "answer");
    if (!id || !answer) {
        return BrokerError{ErrorCategory::Validation, "missing id or answer",
                           "missing_fields"};
    }
    return AnswerBody{id.value(), answer.value()};
}

}  // namespace pokeme::protocol
