/*
 * NovelForge C++ - Status
 *
 * Result of a fallible operation. Values come back through out-parameters;
 * the Status says whether they are valid and, if not, what kind of failure
 * happened and whether retrying could help.
 */
#ifndef novelforge_CORE_STATUS_HPP
#define novelforge_CORE_STATUS_HPP

#include <string>

namespace novelforge {

enum class ErrorCode {
    OK = 0,
    VALIDATION,            // Malformed request or payload
    REFERENCE,             // Dangling cross-reference in memory metadata
    STORAGE,               // Persistence failure
    EMBEDDING,             // Embedding provider failure or dimension mismatch
    GENERATION_TIMEOUT,    // Provider call exceeded its deadline
    CONSISTENCY_BLOCKING,  // Blocking findings survived all retries
    MISSING_NODE,          // Edge endpoint absent
    NOT_FOUND,
    PROVIDER,              // Non-timeout provider failure
    CANCELLED,
    CORRUPTION             // Irrecoverable storage corruption
};

const char* error_code_name(ErrorCode code);

struct Status {
    bool success;
    ErrorCode code;
    std::string error;
    bool transient;        // Retrying the same call may succeed

    Status() : success(true), code(ErrorCode::OK), transient(false) {}

    bool ok() const { return success; }

    static Status ok_status() {
        return Status();
    }

    static Status fail(ErrorCode code, const std::string& error) {
        Status s;
        s.success = false;
        s.code = code;
        s.error = error;
        return s;
    }

    static Status transient_failure(ErrorCode code, const std::string& error) {
        Status s = fail(code, error);
        s.transient = true;
        return s;
    }

    // "STORAGE: disk I/O error"
    std::string to_string() const;
};

} // namespace novelforge

#endif // novelforge_CORE_STATUS_HPP
