#pragma once
#include "errors.hpp"
#include "extraction.hpp"
#include "http.hpp"
#include "provider.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace glmextract {

class ProviderRegistry;

// Few-shot prompt: task description, each example with its JSON answer, then
// the target text. The model is asked to answer with {"extractions": [...]}.
std::string build_extraction_prompt(const std::string& description,
                                    const std::vector<ExampleAnnotation>& examples,
                                    const std::string& text);

// Parse model output into extractions. Accepts bare JSON or JSON inside a
// Markdown code fence, either {"extractions": [...]} or a bare array.
// Throws InferenceRuntimeError (MalformedResponse).
std::vector<Extraction> parse_extractions(const std::string& output);

// Split text into chunks of at most max_chars bytes that concatenate back to
// the original. A chunk ends after the last newline in range if there is one,
// else after the sentence end nearest the limit, else after the last
// whitespace. A hard cut never splits a UTF-8 sequence. max_chars 0 disables
// chunking, and short or empty text is a single chunk.
std::vector<std::string> chunk_text(const std::string& text, size_t max_chars);

struct ExtractionOptions {
    InferenceParams params;
    bool use_schema = true;   // attach the schema inferred from the examples
    size_t max_workers = 4;   // used when params.gate is not set
    // Independent passes over every document. Later passes only add
    // extractions whose (class, text) pair no earlier pass produced.
    size_t extraction_passes = 1;
    // Chunk size in bytes, one prompt per chunk. 0 sends each text whole.
    size_t max_char_buffer = 0;
};

struct DocumentResult {
    AnnotatedDocument document;
    std::optional<InferenceRuntimeError> error;

    bool ok() const { return !error.has_value(); }
};

// Run one non-blocking batch through an admission gate: one prompt per chunk
// per pass. A document's extractions are its chunks' results in order. A
// document fails only when every pass failed, and then carries the first
// error. Results are in input order; a failed document never discards the
// others.
std::vector<DocumentResult> extract_documents(Provider& provider,
                                              const std::string& description,
                                              const std::vector<ExampleAnnotation>& examples,
                                              const std::vector<std::string>& texts,
                                              const ExtractionOptions& options = {});

struct ExtractionRequest {
    std::string text;
    std::string prompt_description;
    std::vector<ExampleAnnotation> examples;
    std::string model_id;
    std::string api_key;
    std::string base_url;
    double temperature = 0.0;
    InferenceParams params;
    bool use_schema = true;
    size_t extraction_passes = 1;
    size_t max_char_buffer = 0;
    TlsVerification tls;
    TransportFactory transport_factory; // empty = libcurl
};

// Single-document extraction with a provider resolved from request.model_id.
// Throws NoProviderFound, InferenceConfigError or InferenceRuntimeError.
AnnotatedDocument extract(const ProviderRegistry& registry, const ExtractionRequest& request);

} // namespace glmextract
