#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace glmextract {

nlohmann::json Config::defaults_json() {
    return {
        {"model", "glm-4"},
        {"temperature", 0.0},
        {"base_url", ""},
        {"verify_ssl", true},
        {"timeout_seconds", 60},
        {"max_workers", 4},
        {"use_schema", true},
        {"providers", {
            {"glm", {{"api_key", ""}, {"base_url", ""}}},
            {"openai", {{"api_key", ""}, {"base_url", ""}}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

TlsVerification tls_from_string(const std::string& value) {
    std::string v = trim(value);
    std::string key = v;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "false" || key == "0" || key == "no" || key == "off") {
        return TlsVerification::disabled();
    }
    if (key.empty() || key == "true" || key == "1" || key == "yes" || key == "on") return {};

    std::error_code ec;
    if (!std::filesystem::exists(v, ec)) {
        std::cerr << "[config] WARNING: CA bundle " << v << " does not exist\n";
    }
    return TlsVerification::with_ca_bundle(v);
}

TlsVerification tls_from_json(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>() ? TlsVerification{} : TlsVerification::disabled();
    }
    if (value.is_string()) {
        return tls_from_string(value.get<std::string>());
    }
    return {};
}


Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.glmextract/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    // Parse JSON into Config struct
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("verify_ssl"))
        cfg.tls = tls_from_json(j["verify_ssl"]);
    if (j.contains("timeout_seconds") && j["timeout_seconds"].is_number_integer() &&
        j["timeout_seconds"].get<long>() > 0)
        cfg.timeout_seconds = j["timeout_seconds"].get<long>();
    if (j.contains("max_workers") && j["max_workers"].is_number_integer() &&
        j["max_workers"].get<long>() > 0)
        cfg.max_workers = j["max_workers"].get<uint32_t>();
    if (j.contains("use_schema") && j["use_schema"].is_boolean())
        cfg.use_schema = j["use_schema"].get<bool>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("GLM_API_KEY"))
        cfg.providers["glm"].api_key = v;
    if (const char* v = std::getenv("GLM_BASE_URL"))
        cfg.providers["glm"].base_url = v;
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENAI_BASE_URL"))
        cfg.providers["openai"].base_url = v;
    if (const char* v = std::getenv("GLMEXTRACT_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("BASE_URL"))
        cfg.base_url = v;
    if (const char* v = std::getenv("GLMEXTRACT_VERIFY_SSL"))
        cfg.tls = tls_from_string(v);

    if (!cfg.tls.verify) {
        std::cerr << "[config] WARNING: TLS certificate verification is disabled\n";
    }

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    if (!base_url.empty()) return base_url;
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

ProviderOptions Config::provider_options(const std::string& provider) const {
    ProviderOptions options;
    options.model_id = model;
    options.api_key = api_key_for(provider);
    options.base_url = base_url_for(provider);
    options.temperature = temperature;
    options.tls = tls;
    options.timeout_seconds = timeout_seconds;
    return options;
}

} // namespace glmextract
