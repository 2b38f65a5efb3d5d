#include "openai.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace glmextract {

void register_openai_provider(ProviderRegistry& registry) {
    auto factory = [](const ProviderOptions& options) {
        return std::make_unique<OpenAIProvider>(options);
    };
    registry.register_provider("^gpt-", 10, "openai", factory);
    registry.register_provider("^o[0-9]", 10, "openai", factory);
}

OpenAIProvider::OpenAIProvider(ProviderOptions options)
    : OpenAIProvider(std::move(options), kOpenAIDefaultBaseUrl) {}

OpenAIProvider::OpenAIProvider(ProviderOptions options, const std::string& default_base_url)
    : Provider(std::move(options), default_base_url) {}

json OpenAIProvider::build_request(const ChatEndpoint& endpoint,
                                   const std::string& prompt,
                                   const InferenceParams& params,
                                   bool json_mode) {
    json request;
    request["model"] = endpoint.model_id;
    request["messages"] = json::array({{{"role", "user"}, {"content", prompt}}});
    request["temperature"] = params.temperature.value_or(endpoint.temperature);

    // Optional sampling parameters pass through verbatim.
    if (params.max_tokens) request["max_tokens"] = *params.max_tokens;
    if (params.top_p) request["top_p"] = *params.top_p;
    if (params.frequency_penalty) request["frequency_penalty"] = *params.frequency_penalty;
    if (params.presence_penalty) request["presence_penalty"] = *params.presence_penalty;

    if (json_mode) {
        request["response_format"] = {{"type", "json_object"}};
    }
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key()},
        {"Content-Type", "application/json"}
    };
}

std::vector<ScoredOutput> OpenAIProvider::parse_response(const ChatEndpoint& endpoint,
                                                         const HttpResponse& response) {
    const std::string& name = endpoint.provider_name;
    if (response.status_code == 0) {
        throw InferenceRuntimeError(name + " request failed: " + response.error,
                                    FailureKind::Transport, 0, response.error);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw InferenceRuntimeError(name + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body,
            FailureKind::HttpStatus, response.status_code, response.body);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw InferenceRuntimeError(name + " returned invalid JSON: " + e.what(),
                                    FailureKind::MalformedResponse,
                                    response.status_code, e.what());
    }

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            return {ScoredOutput{1.0, choice["message"]["content"].get<std::string>()}};
        }
    }

    throw InferenceRuntimeError(name + " response has no choices[0].message.content",
                                FailureKind::MalformedResponse,
                                response.status_code, response.body);
}

ChatEndpoint OpenAIProvider::endpoint() const {
    return {provider_name(), chat_completions_url(), build_headers(),
            model_id(), temperature(), timeout_seconds()};
}

RequestFn OpenAIProvider::make_sender(const InferenceParams& params, bool json_mode) const {
    auto ep = std::make_shared<const ChatEndpoint>(endpoint());
    return [ep, params, json_mode](HttpClient& http, const std::string& prompt) {
        json request = build_request(*ep, prompt, params, json_mode);
        std::string body = request.dump(-1, ' ', false, json::error_handler_t::replace);
        auto response = http.post(ep->url, body, ep->headers, ep->timeout_seconds);
        return parse_response(*ep, response);
    };
}

} // namespace glmextract
