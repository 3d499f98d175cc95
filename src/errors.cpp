#include "errors.h"

namespace avatar_tutor {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::InputRejected: return "input_rejected";
        case ErrorType::StreamFailure: return "stream_failure";
        case ErrorType::RendererSignalError: return "renderer_signal_error";
        case ErrorType::NetworkError: return "network_error";
        case ErrorType::HttpStatus: return "http_status";
        case ErrorType::ParseError: return "parse_error";
        case ErrorType::InvalidState: return "invalid_state";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace avatar_tutor
