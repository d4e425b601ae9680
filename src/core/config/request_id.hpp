#pragma once
#include <cstddef>
#include <string>
#include <random>
#include <sstream>

namespace pokeme::core::config {

    constexpr std::size_t kRequestIdLength = 12;

    // Generates a 12-character lowercase hex request ID
    inline std::string generate_request_id() {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (std::size_t i = 0; i < kRequestIdLength; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Accepts exactly ^[0-9a-f]{12}$. Ids are checked before any lookup so a
    // path-like string never reaches the store.
    inline bool is_valid_request_id(const std::string& id) {
        if (id.size() != kRequestIdLength) {
            return false;
        }
        for (const char c : id) {
            const bool digit = c >= '0' && c <= '9';
            const bool hex_lower = c >= 'a' && c <= 'f';
            if (!digit && !hex_lower) {
                return false;
            }
        }
        return true;
    }

} // namespace pokeme::core::config
