#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace pokeme::protocol {

enum class RequestType {
    Question,
    Permission
};

enum class RequestStatus {
    Pending,
    Answered
};

using Timestamp = std::chrono::system_clock::time_point;

// Caller-supplied fields of a new request. The store assigns everything else.
struct NewRequest {
    std::string question;
    std::optional<std::string> context;
    std::optional<std::string> agent;
    std::optional<std::string> task;
    RequestType request_type = RequestType::Question;
    std::optional<std::string> command;  // required for Permission
};

struct Request {
    std::string id;
    std::string question;
    std::optional<std::string> context;
    std::optional<std::string> agent;
    std::optional<std::string> task;
    RequestType request_type = RequestType::Question;
    std::optional<std::string> command;
    RequestStatus status = RequestStatus::Pending;
    std::optional<std::string> answer;
    Timestamp created_at{};
    std::optional<Timestamp> answered_at;
};

inline std::string to_string(const RequestType type) {
    switch (type) {
        case RequestType::Question:
            return "question";
        case RequestType::Permission:
            return "permission";
        default:
            return "unknown";
    }
}

inline std::string to_string(const RequestStatus status) {
    switch (status) {
        case RequestStatus::Pending:
            return "pending";
        case RequestStatus::Answered:
            return "answered";
        default:
            return "unknown";
    }
}

inline std::optional<RequestType> parse_request_type(const std::string& text) {
    if (text == "question") {
        return RequestType::Question;
    }
    if (text == "permission") {
        return RequestType::Permission;
    }
    return std::nullopt;
}

inline std::optional<RequestStatus> parse_request_status(const std::string& text) {
    if (text == "pending") {
        return RequestStatus::Pending;
    }
    if (text == "answered") {
        return RequestStatus::Answered;
    }
    return std::nullopt;
}

}  // namespace pokeme::protocol
