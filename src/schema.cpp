#include "schema.hpp"
#include <utility>

using json = nlohmann::json;

namespace glmextract {

SchemaConstraint::SchemaConstraint(std::set<std::string> classes,
                                   std::set<std::string> attribute_keys)
    : classes_(std::move(classes)), attribute_keys_(std::move(attribute_keys)) {}

json SchemaConstraint::to_json() const {
    if (empty()) {
        return {
            {"type", "object"},
            {"properties", {
                {"extractions", {
                    {"type", "array"},
                    {"items", {{"type", "object"}}}
                }}
            }}
        };
    }

    json attribute_props = json::object();
    for (const auto& key : attribute_keys_) {
        attribute_props[key] = {{"type", "string"}};
    }

    json item = {
        {"type", "object"},
        {"properties", {
            {"extraction_class", {
                {"type", "string"},
                {"enum", json(std::vector<std::string>(classes_.begin(), classes_.end()))}
            }},
            {"extraction_text", {{"type", "string"}}},
            {"attributes", {
                {"type", "object"},
                {"properties", attribute_props},
                {"additionalProperties", false}
            }}
        }},
        {"required", json::array({"extraction_class", "extraction_text"})},
        {"additionalProperties", false}
    };

    return {
        {"type", "object"},
        {"properties", {
            {"extractions", {{"type", "array"}, {"items", item}}}
        }},
        {"required", json::array({"extractions"})},
        {"additionalProperties", false}
    };
}

ProviderSchemaConfig SchemaConstraint::to_provider_config() const {
    return {true, to_json()};
}

SchemaConstraint build_schema(const std::vector<ExampleAnnotation>& examples) {
    std::set<std::string> classes;
    std::set<std::string> attribute_keys;
    for (const auto& example : examples) {
        for (const auto& ext : example.extractions) {
            classes.insert(ext.extraction_class);
            for (const auto& [key, _] : ext.attributes) {
                attribute_keys.insert(key);
            }
        }
    }
    return SchemaConstraint(std::move(classes), std::move(attribute_keys));
}

std::vector<Extraction> find_ungrounded_extractions(const std::vector<ExampleAnnotation>& examples) {
    std::vector<Extraction> ungrounded;
    for (const auto& example : examples) {
        for (const auto& ext : example.extractions) {
            if (ext.extraction_text.empty() ||
                example.text.find(ext.extraction_text) == std::string::npos) {
                ungrounded.push_back(ext);
            }
        }
    }
    return ungrounded;
}

} // namespace glmextract
