#pragma once

#include <cstddef>
#include <string>
#include "core/errors/broker_errors.hpp"

namespace pokeme::protocol {

enum class PermissionDecision {
    Approved,
    Denied
};

// A permission request is answered with this payload, serialized to JSON text
// and stored as the request's answer string.
struct PermissionAnswer {
    PermissionDecision decision = PermissionDecision::Denied;
    std::string comment;
};

std::string to_string(PermissionDecision decision);

std::string encode_permission_answer(const PermissionAnswer& answer);

// Same encoding, with the comment shortened until the result fits in
// `max_chars` characters. The store truncates longer answers, which would
// leave a payload that no longer decodes.
std::string encode_permission_answer(const PermissionAnswer& answer,
                                     std::size_t max_chars);

core::errors::Result<PermissionAnswer> decode_permission_answer(
    const std::string& text);

}  // namespace pokeme::protocol
