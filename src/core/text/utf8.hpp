#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace pokeme::core::text {

// Cuts `value` to at most `max_chars` UTF-8 code points. Continuation bytes
// (10xxxxxx) never start a character, so the cut always lands on a boundary.
inline std::string truncate_chars(const std::string& value, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const auto byte = static_cast<unsigned char>(value[i]);
        if ((byte & 0xC0) == 0x80) {
            continue;
        }
        if (chars == max_chars) {
            return value.substr(0, i);
        }
        ++chars;
    }
    return value;
}

inline std::optional<std::string> truncate_chars(
    const std::optional<std::string>& value, std::size_t max_chars) {
    if (!value.has_value()) {
        return std::nullopt;
    }
    return truncate_chars(value.value(), max_chars);
}

inline std::size_t count_chars(const std::string& value) {
    std::size_t chars = 0;
    for (const char c : value) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++chars;
        }
    }
    return chars;
}

}  // namespace pokeme::core::text
