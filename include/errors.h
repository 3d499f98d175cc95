#pragma once

#include <string>

namespace avatar_tutor {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    InputRejected,        ///< Empty, duplicate, or turn-in-progress input
    StreamFailure,        ///< Model stream failed mid-turn
    RendererSignalError,  ///< Out-of-order or duplicate completion callback
    NetworkError,
    HttpStatus,           ///< Backend answered with a non-success status
    ParseError,
    InvalidState,
    Timeout,
    Cancelled             ///< Consumer abandoned the stream
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;
    long http_status = 0;  ///< Set for HttpStatus errors

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    explicit operator bool() const { return is_error(); }
};

const char* error_type_name(ErrorType type);

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_http_error(long status, const std::string& message) {
    Error e(ErrorType::HttpStatus, message);
    e.http_status = status;
    return e;
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_cancelled_error(const std::string& message = "Stream abandoned by consumer") {
    return Error(ErrorType::Cancelled, message);
}

} // namespace avatar_tutor
