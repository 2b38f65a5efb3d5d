#pragma once
#include "extraction.hpp"
#include "http.hpp"
#include "inference_client.hpp"
#include "schema.hpp"
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace glmextract {

class AdmissionGate;

// Per-call generation parameters. Unset sampling fields are left out of the
// request; temperature falls back to the provider's temperature.
struct InferenceParams {
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<double> top_p;
    std::optional<double> frequency_penalty;
    std::optional<double> presence_penalty;
    AdmissionGate* gate = nullptr; // optional admission control for the batch
};

struct ProviderOptions {
    std::string model_id;
    std::string api_key;
    std::string base_url;          // empty = provider default
    double temperature = 0.0;
    TlsVerification tls;           // verifies unless explicitly disabled
    long timeout_seconds = 60;
    TransportFactory transport_factory; // empty = libcurl
};

// A model id bound to credentials, a transport and an optional schema.
//
// Unconfigured until the first non-blocking inference creates the persistent
// transport (Active). close() returns to Unconfigured and may be called in
// either state. A future returned by infer_async() stays valid after the
// provider is destroyed: the batch owns its transport reference and request
// state.
class Provider {
public:
    virtual ~Provider();

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    // Blocking: private transport, torn down before returning.
    std::vector<InferenceResult> infer(const std::vector<std::string>& prompts,
                                       const InferenceParams& params = {});

    // Non-blocking: persistent transport shared across calls.
    std::future<std::vector<InferenceResult>> infer_async(const std::vector<std::string>& prompts,
                                                          const InferenceParams& params = {});

    // Attach a schema, or clear it with std::nullopt. Never merges.
    void apply_schema(const std::optional<SchemaConstraint>& schema);

    std::optional<SchemaConstraint> schema() const;
    bool structured_output() const;
    nlohmann::json response_schema() const;

    bool is_active() const { return client_.has_transport(); }
    void close() { client_.close(); }

    const std::string& model_id() const { return options_.model_id; }
    const std::string& base_url() const { return base_url_; }
    double temperature() const { return options_.temperature; }
    const TlsVerification& tls() const { return options_.tls; }
    long timeout_seconds() const { return options_.timeout_seconds; }

    virtual std::string provider_name() const = 0;

    // Whether the endpoint can be asked for strict JSON output.
    virtual bool supports_strict_schema() const { return true; }

protected:
    // Throws InferenceConfigError when the api key or model id is missing.
    Provider(ProviderOptions options, const std::string& default_base_url);

    // Request function for one batch. It performs one request/response cycle
    // per call, throws InferenceRuntimeError, and must not refer back to the
    // provider: it may run after the provider is gone.
    virtual RequestFn make_sender(const InferenceParams& params, bool json_mode) const = 0;

    const std::string& api_key() const { return options_.api_key; }

private:
    RequestFn make_request(const InferenceParams& params) const;

    ProviderOptions options_;
    std::string base_url_;

    mutable std::mutex schema_mutex_;
    std::optional<SchemaConstraint> schema_;
    ProviderSchemaConfig schema_config_;

    InferenceClient client_;
};

} // namespace glmextract
