#include "provider.hpp"
#include "errors.hpp"

namespace glmextract {

static std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

Provider::Provider(ProviderOptions options, const std::string& default_base_url)
    : options_(std::move(options)),
      base_url_(strip_trailing_slashes(options_.base_url.empty() ? default_base_url
                                                                 : options_.base_url)),
      client_(TransportOptions{options_.tls, options_.timeout_seconds},
              options_.transport_factory) {
    if (options_.api_key.empty()) {
        throw InferenceConfigError(
            "API key required. Set it in the config file, the environment or ProviderOptions::api_key.");
    }
    if (options_.model_id.empty()) {
        throw InferenceConfigError("Model id required");
    }
    if (base_url_.empty()) {
        throw InferenceConfigError("Base URL required for model " + options_.model_id);
    }
    if (options_.timeout_seconds <= 0) {
        throw InferenceConfigError("Timeout must be positive");
    }
}

Provider::~Provider() {
    client_.close();
}

void Provider::apply_schema(const std::optional<SchemaConstraint>& schema) {
    std::lock_guard<std::mutex> lock(schema_mutex_);
    schema_ = schema;
    if (schema) {
        schema_config_ = schema->to_provider_config();
    } else {
        schema_config_ = ProviderSchemaConfig{};
    }
}

std::optional<SchemaConstraint> Provider::schema() const {
    std::lock_guard<std::mutex> lock(schema_mutex_);
    return schema_;
}

bool Provider::structured_output() const {
    std::lock_guard<std::mutex> lock(schema_mutex_);
    return schema_config_.structured_output;
}

nlohmann::json Provider::response_schema() const {
    std::lock_guard<std::mutex> lock(schema_mutex_);
    return schema_config_.response_schema;
}

RequestFn Provider::make_request(const InferenceParams& params) const {
    // Schema state is captured once per batch so a concurrent apply_schema()
    // never changes a batch halfway.
    bool json_mode = structured_output() && supports_strict_schema();
    return make_sender(params, json_mode);
}

std::vector<InferenceResult> Provider::infer(const std::vector<std::string>& prompts,
                                             const InferenceParams& params) {
    return client_.run_blocking(prompts, make_request(params), params.gate);
}

std::future<std::vector<InferenceResult>> Provider::infer_async(
    const std::vector<std::string>& prompts, const InferenceParams& params) {
    return client_.run_async(prompts, make_request(params), params.gate);
}

} // namespace glmextract
