#pragma once
#include <string>
#include <variant>

namespace pokeme::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,        // E.g., User provided an invalid CLI flag
        Validation,   // E.g., Request body is missing "question"
        NotFound,     // E.g., Unknown route or request id
        Backpressure, // E.g., Pending capacity is exhausted
        Timeout,      // E.g., Nobody answered before the caller's deadline
        Transport,    // E.g., Broker is not listening or replied garbage
        Internal      // E.g., C++ logic bug or socket setup failure
    };

    // The standardized error payload
    struct BrokerError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a BrokerError.
    template <typename T>
    using Result = std::variant<T, BrokerError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BrokerError>(result);
    }

    template <typename T>
    const BrokerError& get_error(const Result<T>& result) {
        return std::get<BrokerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // 3. HTTP mapping used by the protocol layer
    inline int http_status_for(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation:   return 400;
            case ErrorCategory::NotFound:     return 404;
            case ErrorCategory::Backpressure: return 429;
            default:                          return 500;
        }
    }

    inline ErrorCategory category_for_http_status(int status) {
        switch (status) {
            case 400: return ErrorCategory::Validation;
            case 404: return ErrorCategory::NotFound;
            case 429: return ErrorCategory::Backpressure;
            default:  return ErrorCategory::Transport;
        }
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "input";
            case ErrorCategory::Validation:   return "validation";
            case ErrorCategory::NotFound:     return "not_found";
            case ErrorCategory::Backpressure: return "backpressure";
            case ErrorCategory::Timeout:      return "timeout";
            case ErrorCategory::Transport:    return "transport";
            case ErrorCategory::Internal:     return "internal";
            default:                          return "unknown";
        }
    }

} // namespace pokeme::core::errors
