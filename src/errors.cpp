#include "errors.hpp"
#include <utility>

namespace glmextract {

const char* failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Transport: return "transport";
        case FailureKind::HttpStatus: return "http_status";
        case FailureKind::MalformedResponse: return "malformed_response";
        case FailureKind::Cancelled: return "cancelled";
    }
    return "transport";
}

InferenceRuntimeError::InferenceRuntimeError(const std::string& what,
                                             FailureKind kind,
                                             long status_code,
                                             std::string cause)
    : std::runtime_error(what), kind_(kind),
      status_code_(status_code), cause_(std::move(cause)) {}

bool InferenceRuntimeError::is_transient() const {
    switch (kind_) {
        case FailureKind::Transport:
            return true;
        case FailureKind::HttpStatus:
            return status_code_ == 408 || status_code_ == 429 || status_code_ >= 500;
        case FailureKind::MalformedResponse:
        case FailureKind::Cancelled:
            return false;
    }
    return false;
}

} // namespace glmextract
