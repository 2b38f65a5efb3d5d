#pragma once
#include "provider.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace glmextract {

// Factory: construct a provider from fully resolved options.
using ProviderFactory = std::function<std::unique_ptr<Provider>(const ProviderOptions& options)>;

struct ProviderDescriptor {
    std::string pattern;   // regex source, e.g. "^glm-"
    std::regex regex;
    int priority = 0;      // higher wins
    std::string name;      // provider name, e.g. "glm"
    ProviderFactory factory;
    size_t order = 0;      // registration order, earlier wins ties
};

// Maps model ids to provider implementations by regex pattern + priority.
// Owned by the application's composition root and passed to callers.
// All methods are thread-safe.
class ProviderRegistry {
public:
    ProviderRegistry() = default;

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    // Returns false (and changes nothing) when the same pattern is already
    // registered for the same provider name. Throws std::invalid_argument
    // for an invalid regex.
    bool register_provider(const std::string& pattern, int priority,
                           const std::string& name, ProviderFactory factory);

    // Register the built-in providers. Runs once per registry no matter how
    // often or from how many threads it is called.
    void load_builtin_providers();

    // Highest priority match; equal priorities resolve to the earliest
    // registration. Throws NoProviderFound. Never constructs a provider.
    ProviderDescriptor resolve(const std::string& model_id) const;

    // Resolve by options.model_id, then construct.
    std::unique_ptr<Provider> create_provider(const ProviderOptions& options) const;

    // Construct by provider name, bypassing pattern matching.
    std::unique_ptr<Provider> create_provider_by_name(const std::string& name,
                                                      const ProviderOptions& options) const;

    // Query
    std::vector<std::string> provider_names() const;
    std::vector<ProviderDescriptor> descriptors() const;
    bool has_provider(const std::string& name) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<ProviderDescriptor> entries_;
    size_t next_order_ = 0;
    std::once_flag builtins_once_;
};

} // namespace glmextract
