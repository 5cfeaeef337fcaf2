#pragma once
#include <stdexcept>
#include <string>

namespace helm::kernel {

enum class ErrorKind {
    VALIDATION,        // malformed or out-of-range caller input
    NOT_FOUND,         // unknown process/envelope/interrupt/session id
    QUOTA_EXCEEDED,    // quota or rate-limit breach
    STATE_TRANSITION,  // disallowed state change
    INTERNAL,          // unexpected failure, including recovered exceptions
    CANCELLED,
    TIMEOUT
};

// Stable category tag reported to callers, e.g. "INVALID_ARGUMENT"
const char* error_code(ErrorKind kind);
const char* error_kind_to_string(ErrorKind kind);

class KernelError : public std::runtime_error {
public:
    KernelError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* code() const { return error_code(kind_); }

private:
    ErrorKind kind_;
};

KernelError validation_error(const std::string& message);
KernelError not_found_error(const std::string& what, const std::string& id);
KernelError quota_error(const std::string& message);
KernelError transition_error(const std::string& message);
KernelError internal_error(const std::string& message);

} // namespace helm::kernel
