#pragma once
#include "extraction.hpp"
#include <nlohmann/json.hpp>

namespace glmextract {

// Shared JSON <-> Extraction conversion used by the prompt builder, the
// output parser and the CLI task loader.

inline Extraction extraction_from_json(const nlohmann::json& item) {
    Extraction ext;
    ext.extraction_class = item.value("extraction_class", "");
    ext.extraction_text = item.value("extraction_text", "");
    if (item.contains("attributes") && item["attributes"].is_object()) {
        for (const auto& [key, value] : item["attributes"].items()) {
            if (value.is_null()) continue;
            ext.attributes[key] = value.is_string() ? value.get<std::string>()
                                                    : value.dump();
        }
    }
    return ext;
}

inline nlohmann::json extraction_to_json(const Extraction& ext) {
    nlohmann::json item = {
        {"extraction_class", ext.extraction_class},
        {"extraction_text", ext.extraction_text}
    };
    if (!ext.attributes.empty()) {
        item["attributes"] = ext.attributes;
    }
    return item;
}

inline ExampleAnnotation example_from_json(const nlohmann::json& item) {
    ExampleAnnotation example;
    example.text = item.value("text", "");
    if (item.contains("extractions") && item["extractions"].is_array()) {
        for (const auto& e : item["extractions"]) {
            if (e.is_object()) example.extractions.push_back(extraction_from_json(e));
        }
    }
    return example;
}

inline nlohmann::json document_to_json(const AnnotatedDocument& doc) {
    nlohmann::json extractions = nlohmann::json::array();
    for (const auto& ext : doc.extractions) {
        extractions.push_back(extraction_to_json(ext));
    }
    return {
        {"document_id", doc.document_id},
        {"extractions", extractions}
    };
}

} // namespace glmextract
