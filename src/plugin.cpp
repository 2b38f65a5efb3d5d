#include "plugin.hpp"
#include "errors.hpp"
#include "providers/glm.hpp"
#include "providers/openai.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace glmextract {

bool ProviderRegistry::register_provider(const std::string& pattern, int priority,
                                         const std::string& name, ProviderFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Provider factory for " + name + " is empty");
    }

    std::regex compiled;
    try {
        compiled = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid provider pattern '" + pattern + "': " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.pattern == pattern && entry.name == name) return false;
    }
    entries_.push_back({pattern, std::move(compiled), priority, name,
                        std::move(factory), next_order_++});
    return true;
}

void ProviderRegistry::load_builtin_providers() {
    std::call_once(builtins_once_, [this]() {
        register_glm_provider(*this);
        register_openai_provider(*this);
    });
}

ProviderDescriptor ProviderRegistry::resolve(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProviderDescriptor* best = nullptr;
    for (const auto& entry : entries_) {
        if (!std::regex_search(model_id, entry.regex)) continue;
        // entries_ is in registration order, so a strict comparison keeps
        // the earliest entry among equal priorities.
        if (!best || entry.priority > best->priority) {
            best = &entry;
        }
    }
    if (!best) {
        throw NoProviderFound(model_id);
    }
    return *best;
}

std::unique_ptr<Provider> ProviderRegistry::create_provider(const ProviderOptions& options) const {
    ProviderDescriptor descriptor = resolve(options.model_id);
    std::cerr << "[registry] " << options.model_id << " -> " << descriptor.name
              << " (pattern " << descriptor.pattern << ")\n";
    return descriptor.factory(options);
}

std::unique_ptr<Provider> ProviderRegistry::create_provider_by_name(
    const std::string& name, const ProviderOptions& options) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&name](const ProviderDescriptor& entry) { return entry.name == name; });
        if (it == entries_.end()) {
            throw NoProviderFound(name);
        }
        factory = it->factory;
    }
    return factory(options);
}

std::vector<std::string> ProviderRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

std::vector<ProviderDescriptor> ProviderRegistry::descriptors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool ProviderRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
        [&name](const ProviderDescriptor& entry) { return entry.name == name; });
}

size_t ProviderRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace glmextract
