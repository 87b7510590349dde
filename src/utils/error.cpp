#include "dcmx/error.hpp"
#include <sstream>

namespace dcmx {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";

        case ErrorCode::NetworkConnectionFailed: return "Connection failed";
        case ErrorCode::NetworkTimeout: return "Network timeout";

        case ErrorCode::StorageNotFound: return "Not found in storage";
        case ErrorCode::StorageReadFailed: return "Storage read failed";
        case ErrorCode::StorageWriteFailed: return "Storage write failed";
        case ErrorCode::StorageCorrupted: return "Storage corrupted";

        case ErrorCode::ContentHashMismatch: return "Content hash mismatch";
        case ErrorCode::ContentTooLarge: return "Content too large";

        case ErrorCode::ProtocolInvalidMessage: return "Invalid protocol message";
        case ErrorCode::ProtocolSelfConnection: return "Connection to self";

        case ErrorCode::ServiceAlreadyRunning: return "Service already running";
        case ErrorCode::ServiceBindFailed: return "Failed to bind service";

        case ErrorCode::DeserializationFailed: return "Deserialization failed";
        case ErrorCode::InvalidFormat: return "Invalid format";

        default: return "Unknown error code";
    }
}

bool is_not_found(ErrorCode code) {
    return code == ErrorCode::StorageNotFound;
}

bool is_peer_unreachable(ErrorCode code) {
    return code == ErrorCode::NetworkConnectionFailed ||
           code == ErrorCode::NetworkTimeout;
}

bool is_storage_failure(ErrorCode code) {
    return code == ErrorCode::StorageReadFailed ||
           code == ErrorCode::StorageWriteFailed ||
           code == ErrorCode::StorageCorrupted;
}

bool is_protocol_violation(ErrorCode code) {
    return code == ErrorCode::ProtocolInvalidMessage ||
           code == ErrorCode::ProtocolSelfConnection;
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace dcmx
