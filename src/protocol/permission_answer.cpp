#include "protocol/permission_answer.hpp"

#include <nlohmann/json.hpp>
#include "core/text/utf8.hpp"

namespace pokeme::protocol {

using core::errors::BrokerError;
using core::errors::ErrorCategory;
using nlohmann::json;

std::string to_string(const PermissionDecision decision) {
    switch (decision) {
        case PermissionDecision::Approved:
            return "approved";
        case PermissionDecision::Denied:
            return "denied";
        default:
            return "unknown";
    }
}

std::string encode_permission_answer(const PermissionAnswer& answer) {
    json payload;
    payload["decision"] = to_string(answer.decision);
    payload["comment"] = answer.comment;
    return payload.dump();
}

std::string encode_permission_answer(const PermissionAnswer& answer,
                                     const std::size_t max_chars) {
    PermissionAnswer fitted = answer;
    std::string encoded = encode_permission_answer(fitted);
    std::size_t length = core::text::count_chars(encoded);
    // Escaping can make one comment character cost several encoded ones.
    while (length > max_chars && !fitted.comment.empty()) {
        const std::size_t overflow = length - max_chars;
        const std::size_t comment_chars = core::text::count_chars(fitted.comment);
        const std::size_t keep = comment_chars > overflow ? comment_chars - overflow : 0;
        fitted.comment = core::text::truncate_chars(fitted.comment, keep);
        encoded = encode_permission_answer(fitted);
        length = core::text::count_chars(encoded);
    }
    return encoded;
}

core::errors::Result<PermissionAnswer> decode_permission_answer(
    const std::string& text) {
    const json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return BrokerError{ErrorCategory::Validation,
                           "Permission answer is not a JSON object.",
                           "invalid_permission_answer"};
    }

    const auto decision_it = payload.find("decision");
    if (decision_it == payload.end() || !decision_it->is_string()) {
        return BrokerError{ErrorCategory::Validation,
                           "Permission answer has no decision.",
                           "invalid_permission_answer"};
    }

    PermissionAnswer answer;
    const auto decision = decision_it->get<std::string>();
    if (decision == "approved") {
        answer.decision = PermissionDecision::Approved;
    } else if (decision == "denied") {
        answer.decision = PermissionDecision::Denied;
    } else {
        return BrokerError{ErrorCategory::Validation,
                           "Unknown permission decision: " + decision,
                           "invalid_permission_answer"};
    }

    const auto comment_it = payload.find("comment");
    if (comment_it != payload.end() && comment_it->is_string()) {
        answer.comment = comment_it->get<std::string>();
    }
    return answer;
}

}  // namespace pokeme::protocol
