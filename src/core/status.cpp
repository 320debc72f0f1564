#include <novelforge/core/status.hpp>

namespace novelforge {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::VALIDATION: return "VALIDATION";
        case ErrorCode::REFERENCE: return "REFERENCE";
        case ErrorCode::STORAGE: return "STORAGE";
        case ErrorCode::EMBEDDING: return "EMBEDDING";
        case ErrorCode::GENERATION_TIMEOUT: return "GENERATION_TIMEOUT";
        case ErrorCode::CONSISTENCY_BLOCKING: return "CONSISTENCY_BLOCKING";
        case ErrorCode::MISSING_NODE: return "MISSING_NODE";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::PROVIDER: return "PROVIDER";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::CORRUPTION: return "CORRUPTION";
    }
    return "UNKNOWN";
}

std::string Status::to_string() const {
    if (success) return "OK";
    std::string out = error_code_name(code);
    if (!error.empty()) {
        out += ": ";
        out += error;
    }
    if (transient) {
        out += " (transient)";
    }
    return out;
}

} // namespace novelforge
