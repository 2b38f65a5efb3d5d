#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace glmextract {

class ProviderRegistry;

// Everything one chat-completions request needs, copied out of the provider
// when a batch starts.
struct ChatEndpoint {
    std::string provider_name;
    std::string url;
    std::vector<Header> headers;
    std::string model_id;
    double temperature = 0.0;
    long timeout_seconds = 60;
};

// OpenAI-style chat completions: POST {base_url}/chat/completions with a
// bearer token, answer read from choices[0].message.content.
class OpenAIProvider : public Provider {
public:
    explicit OpenAIProvider(ProviderOptions options);

    std::string provider_name() const override { return "openai"; }

    std::string chat_completions_url() const { return base_url() + "/chat/completions"; }

protected:
    OpenAIProvider(ProviderOptions options, const std::string& default_base_url);

    static nlohmann::json build_request(const ChatEndpoint& endpoint,
                                        const std::string& prompt,
                                        const InferenceParams& params,
                                        bool json_mode);
    virtual std::vector<Header> build_headers() const;
    static std::vector<ScoredOutput> parse_response(const ChatEndpoint& endpoint,
                                                    const HttpResponse& response);

    ChatEndpoint endpoint() const;

    RequestFn make_sender(const InferenceParams& params, bool json_mode) const override;
};

constexpr const char* kOpenAIDefaultBaseUrl = "https://api.openai.com/v1";

void register_openai_provider(ProviderRegistry& registry);

} // namespace glmextract
