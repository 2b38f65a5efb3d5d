#pragma once
#include "openai.hpp"
#include <string>

namespace glmextract {

// GLM models behind an OpenAI-compatible ChatCompletions endpoint.
class GlmProvider : public OpenAIProvider {
public:
    explicit GlmProvider(ProviderOptions options);

    std::string provider_name() const override { return "glm"; }
};

constexpr const char* kGlmDefaultBaseUrl = "https://open.bigmodel.cn/api/paas/v4";

void register_glm_provider(ProviderRegistry& registry);

} // namespace glmextract
