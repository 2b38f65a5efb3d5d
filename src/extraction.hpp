#pragma once
#include <map>
#include <string>
#include <vector>

namespace glmextract {

// One labeled span of text plus its key/value attributes.
struct Extraction {
    std::string extraction_class;
    std::string extraction_text;
    std::map<std::string, std::string> attributes;
};

// A few-shot example: source text and the extractions expected from it.
// Each extraction_text is expected to be a verbatim substring of text.
struct ExampleAnnotation {
    std::string text;
    std::vector<Extraction> extractions;
};

// Raw model output for one prompt.
struct ScoredOutput {
    double score = 1.0;
    std::string output;
};

struct AnnotatedDocument {
    std::string document_id;
    std::string text;
    std::vector<Extraction> extractions;
};

} // namespace glmextract
