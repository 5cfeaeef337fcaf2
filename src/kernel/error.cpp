#include "kernel/error.hpp"

namespace helm::kernel {

const char* error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:       return "INVALID_ARGUMENT";
        case ErrorKind::NOT_FOUND:        return "NOT_FOUND";
        case ErrorKind::QUOTA_EXCEEDED:   return "RESOURCE_EXHAUSTED";
        case ErrorKind::STATE_TRANSITION: return "FAILED_PRECONDITION";
        case ErrorKind::INTERNAL:         return "INTERNAL";
        case ErrorKind::CANCELLED:        return "CANCELLED";
        case ErrorKind::TIMEOUT:          return "DEADLINE_EXCEEDED";
    }
    return "INTERNAL";
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:       return "validation";
        case ErrorKind::NOT_FOUND:        return "not_found";
        case ErrorKind::QUOTA_EXCEEDED:   return "quota_exceeded";
        case ErrorKind::STATE_TRANSITION: return "state_transition";
        case ErrorKind::INTERNAL:         return "internal";
        case ErrorKind::CANCELLED:        return "cancelled";
        case ErrorKind::TIMEOUT:          return "timeout";
    }
    return "internal";
}

KernelError validation_error(const std::string& message) {
    return KernelError(ErrorKind::VALIDATION, message);
}

KernelError not_found_error(const std::string& what, const std::string& id) {
    return KernelError(ErrorKind::NOT_FOUND, what + " not found: " + id);
}

KernelError quota_error(const std::string& message) {
    return KernelError(ErrorKind::QUOTA_EXCEEDED, message);
}

KernelError transition_error(const std::string& message) {
    return KernelError(ErrorKind::STATE_TRANSITION, message);
}

KernelError internal_error(const std::string& message) {
    return KernelError(ErrorKind::INTERNAL, message);
}

} // namespace helm::kernel
