#pragma once
#include <stdexcept>
#include <string>

namespace glmextract {

// Missing or invalid credentials/configuration. Raised at construction time.
class InferenceConfigError : public std::invalid_argument {
public:
    explicit InferenceConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Model id did not match any registered provider pattern.
class NoProviderFound : public std::invalid_argument {
public:
    explicit NoProviderFound(const std::string& model_id)
        : std::invalid_argument("No provider registered for " + model_id),
          model_id_(model_id) {}

    const std::string& model_id() const { return model_id_; }

private:
    std::string model_id_;
};

enum class FailureKind { Transport, HttpStatus, MalformedResponse, Cancelled };

const char* failure_kind_to_string(FailureKind kind);

// Any failure during one request/response cycle. Timeouts are reported as
// Transport failures with the transport's message as cause.
class InferenceRuntimeError : public std::runtime_error {
public:
    InferenceRuntimeError(const std::string& what,
                          FailureKind kind,
                          long status_code = 0,
                          std::string cause = "");

    FailureKind kind() const { return kind_; }
    long status_code() const { return status_code_; }
    const std::string& cause() const { return cause_; }

    // Transport failures, 408, 429 and 5xx are worth retrying; everything
    // else (auth, malformed request or body, cancellation) is not.
    bool is_transient() const;

private:
    FailureKind kind_;
    long status_code_;
    std::string cause_;
};

} // namespace glmextract
