#pragma once
#include "http.hpp"
#include "provider.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace glmextract {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct Config {
    std::string model = "glm-4";
    double temperature = 0.0;
    std::string base_url;  // Global override, applies to the resolved provider
    TlsVerification tls;   // "verify_ssl": true | false | "/path/to/ca.pem"
    long timeout_seconds = 60;
    uint32_t max_workers = 4;
    bool use_schema = true;

    std::unordered_map<std::string, ProviderEntry> providers;

    // Load from ~/.glmextract/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // Options for constructing the named provider with the configured model.
    ProviderOptions provider_options(const std::string& provider) const;
};

// Parse a verify_ssl value: bool, or a CA bundle path string. Strings
// "true"/"1" and "false"/"0" are accepted for environment overrides.
// Anything else keeps verification on.
TlsVerification tls_from_json(const nlohmann::json& value);
TlsVerification tls_from_string(const std::string& value);

} // namespace glmextract
