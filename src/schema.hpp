#pragma once
#include "extraction.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace glmextract {

// Provider-side request fragment derived from a schema.
struct ProviderSchemaConfig {
    bool structured_output = false;
    nlohmann::json response_schema; // null when no schema is attached
};

// Structural constraint inferred from few-shot examples. Immutable once built.
class SchemaConstraint {
public:
    SchemaConstraint() = default;
    SchemaConstraint(std::set<std::string> classes, std::set<std::string> attribute_keys);

    const std::set<std::string>& classes() const { return classes_; }

    // Union over all classes; attributes are not scoped per class.
    const std::set<std::string>& attribute_keys() const { return attribute_keys_; }

    // True when no extraction class was observed; to_json() then yields the
    // permissive fallback shape.
    bool empty() const { return classes_.empty(); }

    // JSON-Schema-style shape of {"extractions": [...]}.
    nlohmann::json to_json() const;

    ProviderSchemaConfig to_provider_config() const;

    bool operator==(const SchemaConstraint& other) const {
        return classes_ == other.classes_ && attribute_keys_ == other.attribute_keys_;
    }

private:
    std::set<std::string> classes_;
    std::set<std::string> attribute_keys_;
};

// Scan every extraction of every example. Never fails: zero examples (or
// examples without extractions) produce the permissive fallback.
SchemaConstraint build_schema(const std::vector<ExampleAnnotation>& examples);

// Example extractions whose extraction_text does not occur verbatim in the
// example's text. Reported, never enforced by build_schema.
std::vector<Extraction> find_ungrounded_extractions(const std::vector<ExampleAnnotation>& examples);

} // namespace glmextract
