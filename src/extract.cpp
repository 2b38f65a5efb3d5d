#include "extract.hpp"
#include "extraction_json.hpp"
#include "gate.hpp"
#include "plugin.hpp"
#include "schema.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace glmextract {

std::string build_extraction_prompt(const std::string& description,
                                    const std::vector<ExampleAnnotation>& examples,
                                    const std::string& text) {
    std::ostringstream ss;

    ss << trim(description) << "\n\n";
    ss << "Answer with a single JSON object of the form "
       << R"({"extractions": [{"extraction_class": "...", "extraction_text": "...", "attributes": {"key": "value"}}]}.)"
       << "\n"
       << "extraction_text must be copied verbatim from the input text. "
       << "List extractions in order of appearance.\n\n";

    if (!examples.empty()) {
        ss << "Examples\n";
        for (const auto& example : examples) {
            json answer = {{"extractions", json::array()}};
            for (const auto& ext : example.extractions) {
                answer["extractions"].push_back(extraction_to_json(ext));
            }
            ss << "Q: " << example.text << "\n";
            ss << "A: " << answer.dump(-1, ' ', false, json::error_handler_t::replace) << "\n\n";
        }
    }

    ss << "Q: " << text << "\n";
    ss << "A: ";
    return ss.str();
}

std::vector<Extraction> parse_extractions(const std::string& output) {
    std::string body = strip_code_fence(output);

    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        throw InferenceRuntimeError(std::string("Model output is not valid JSON: ") + e.what(),
                                    FailureKind::MalformedResponse, 0, output);
    }

    const json* items = nullptr;
    if (parsed.is_array()) {
        items = &parsed;
    } else if (parsed.is_object() && parsed.contains("extractions") &&
               parsed["extractions"].is_array()) {
        items = &parsed["extractions"];
    } else {
        throw InferenceRuntimeError("Model output has no \"extractions\" array",
                                    FailureKind::MalformedResponse, 0, output);
    }

    std::vector<Extraction> extractions;
    extractions.reserve(items->size());
    for (const auto& item : *items) {
        if (!item.is_object() ||
            !item.contains("extraction_class") || !item["extraction_class"].is_string() ||
            !item.contains("extraction_text") || !item["extraction_text"].is_string()) {
            throw InferenceRuntimeError("Malformed extraction item: " + item.dump(),
                                        FailureKind::MalformedResponse, 0, output);
        }
        extractions.push_back(extraction_from_json(item));
    }
    return extractions;
}

static bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Break position in (begin, limit] for the chunk starting at begin.
static size_t find_break(const std::string& text, size_t begin, size_t limit) {
    for (size_t p = limit; p > begin; --p) {
        if (text[p - 1] == '\n') return p;
    }

    static const char* const kWideStops[] = {"\xE3\x80\x82", "\xEF\xBC\x81", "\xEF\xBC\x9F"};
    for (size_t p = limit; p > begin; --p) {
        char c = text[p - 1];
        if ((c == '.' || c == '!' || c == '?') && (p == text.size() || is_space(text[p]))) {
            while (p < limit && is_space(text[p])) ++p;
            return p;
        }
        if (p >= begin + 3) {
            for (const char* stop : kWideStops) {
                if (text.compare(p - 3, 3, stop) == 0) return p;
            }
        }
    }

    for (size_t p = limit; p > begin; --p) {
        if (is_space(text[p - 1])) return p;
    }

    size_t p = limit;
    while (p > begin && is_continuation_byte(text[p])) --p;
    if (p == begin) {
        // A single character wider than the limit stays whole.
        p = limit;
        while (p < text.size() && is_continuation_byte(text[p])) ++p;
    }
    return p;
}

std::vector<std::string> chunk_text(const std::string& text, size_t max_chars) {
    if (max_chars == 0 || text.size() <= max_chars) return {text};

    std::vector<std::string> chunks;
    size_t begin = 0;
    while (text.size() - begin > max_chars) {
        size_t end = find_break(text, begin, begin + max_chars);
        chunks.push_back(text.substr(begin, end - begin));
        begin = end;
    }
    if (begin < text.size()) chunks.push_back(text.substr(begin));
    return chunks;
}

static const std::string& first_output(const InferenceResult& result) {
    const auto& outputs = result.value();
    if (outputs.empty()) {
        throw InferenceRuntimeError("Provider returned no output",
                                    FailureKind::MalformedResponse);
    }
    return outputs.front().output;
}

static void attach_schema(Provider& provider,
                          const std::vector<ExampleAnnotation>& examples,
                          bool use_schema) {
    if (use_schema) {
        provider.apply_schema(build_schema(examples));
    } else {
        provider.apply_schema(std::nullopt);
    }
}

namespace {

// Prompt layout for a batch: pass-major, then document, then chunk.
struct BatchPlan {
    std::vector<std::string> prompts;
    std::vector<size_t> first_chunk;  // per document, index within one pass
    std::vector<size_t> chunk_count;  // per document
    size_t per_pass = 0;
    size_t passes = 1;
};

BatchPlan plan_batch(const std::string& description,
                     const std::vector<ExampleAnnotation>& examples,
                     const std::vector<std::string>& texts,
                     size_t max_char_buffer, size_t passes) {
    BatchPlan plan;
    plan.passes = std::max<size_t>(passes, 1);

    std::vector<std::string> pass_prompts;
    for (const auto& text : texts) {
        auto chunks = chunk_text(text, max_char_buffer);
        plan.first_chunk.push_back(pass_prompts.size());
        plan.chunk_count.push_back(chunks.size());
        for (const auto& chunk : chunks) {
            pass_prompts.push_back(build_extraction_prompt(description, examples, chunk));
        }
    }
    plan.per_pass = pass_prompts.size();

    plan.prompts.reserve(plan.per_pass * plan.passes);
    for (size_t pass = 0; pass < plan.passes; ++pass) {
        plan.prompts.insert(plan.prompts.end(), pass_prompts.begin(), pass_prompts.end());
    }
    return plan;
}

DocumentResult assemble_document(const BatchPlan& plan, size_t index, const std::string& text,
                                 const std::vector<InferenceResult>& results) {
    DocumentResult doc;
    doc.document.document_id = "doc_" + generate_id();
    doc.document.text = text;

    std::set<std::pair<std::string, std::string>> seen;
    std::optional<InferenceRuntimeError> first_error;
    bool any_pass_ok = false;

    for (size_t pass = 0; pass < plan.passes; ++pass) {
        std::vector<Extraction> found;
        bool pass_ok = true;
        for (size_t c = 0; c < plan.chunk_count[index]; ++c) {
            const auto& result = results[pass * plan.per_pass + plan.first_chunk[index] + c];
            if (!result.ok()) {
                if (!first_error) first_error = result.error;
                pass_ok = false;
                break;
            }
            try {
                auto parsed = parse_extractions(first_output(result));
                found.insert(found.end(), parsed.begin(), parsed.end());
            } catch (const InferenceRuntimeError& e) {
                std::cerr << "[extract] Document " << (index + 1) << ": " << e.what() << "\n";
                if (!first_error) first_error = e;
                pass_ok = false;
                break;
            }
        }
        if (!pass_ok) continue;
        any_pass_ok = true;

        std::vector<std::pair<std::string, std::string>> keys;
        for (auto& ext : found) {
            auto key = std::make_pair(ext.extraction_class, ext.extraction_text);
            if (seen.count(key)) continue;
            keys.push_back(std::move(key));
            doc.document.extractions.push_back(std::move(ext));
        }
        seen.insert(keys.begin(), keys.end());
    }

    if (!any_pass_ok) doc.error = first_error;
    return doc;
}

std::vector<DocumentResult> assemble_documents(const BatchPlan& plan,
                                               const std::vector<std::string>& texts,
                                               const std::vector<InferenceResult>& results) {
    std::vector<DocumentResult> documents;
    documents.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        documents.push_back(assemble_document(plan, i, texts[i], results));
    }
    return documents;
}

} // namespace

std::vector<DocumentResult> extract_documents(Provider& provider,
                                              const std::string& description,
                                              const std::vector<ExampleAnnotation>& examples,
                                              const std::vector<std::string>& texts,
                                              const ExtractionOptions& options) {
    attach_schema(provider, examples, options.use_schema);

    BatchPlan plan = plan_batch(description, examples, texts, options.max_char_buffer,
                                options.extraction_passes);

    InferenceParams params = options.params;
    std::unique_ptr<AdmissionGate> local_gate;
    if (!params.gate) {
        local_gate = std::make_unique<AdmissionGate>(options.max_workers > 0 ? options.max_workers : 1);
        params.gate = local_gate.get();
    }

    std::cerr << "[extract] " << texts.size() << " document(s), " << plan.prompts.size()
              << " request(s) via " << provider.provider_name() << " ("
              << provider.model_id() << ")\n";

    auto results = provider.infer_async(plan.prompts, params).get();
    return assemble_documents(plan, texts, results);
}

AnnotatedDocument extract(const ProviderRegistry& registry, const ExtractionRequest& request) {
    ProviderOptions options;
    options.model_id = request.model_id;
    options.api_key = request.api_key;
    options.base_url = request.base_url;
    options.temperature = request.temperature;
    options.tls = request.tls;
    options.transport_factory = request.transport_factory;

    auto provider = registry.create_provider(options);
    attach_schema(*provider, request.examples, request.use_schema);

    std::vector<std::string> texts{request.text};
    BatchPlan plan = plan_batch(request.prompt_description, request.examples, texts,
                                request.max_char_buffer, request.extraction_passes);
    auto results = provider->infer(plan.prompts, request.params);

    DocumentResult doc = assemble_document(plan, 0, request.text, results);
    if (!doc.ok()) throw *doc.error;
    return doc.document;
}

} // namespace glmextract
