#include "glm.hpp"
#include "../plugin.hpp"

namespace glmextract {

void register_glm_provider(ProviderRegistry& registry) {
    registry.register_provider("^glm-", 10, "glm", [](const ProviderOptions& options) {
        return std::make_unique<GlmProvider>(options);
    });
}

GlmProvider::GlmProvider(ProviderOptions options)
    : OpenAIProvider(std::move(options), kGlmDefaultBaseUrl) {}

} // namespace glmextract
