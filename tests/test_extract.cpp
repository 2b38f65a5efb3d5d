#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "errors.hpp"
#include "extract.hpp"
#include "extraction_json.hpp"
#include "plugin.hpp"
#include "providers/glm.hpp"
#include <atomic>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace glmextract;

// ── Helpers ─────────────────────────────────────────────────────

static std::vector<ExampleAnnotation> character_examples() {
    ExampleAnnotation ex;
    ex.text = "ROMEO. But soft! What light through yonder window breaks?";
    ex.extractions = {
        {"character", "ROMEO", {{"emotional_state", "wonder"}}},
        {"emotion", "But soft!", {{"feeling", "gentle awe"}}}
    };
    return {ex};
}

static std::string answer_for(const std::string& cls, const std::string& text) {
    json answer = {{"extractions", json::array({
        {{"extraction_class", cls}, {"extraction_text", text}}
    })}};
    return answer.dump();
}

static std::string answer_with(const std::vector<std::pair<std::string, std::string>>& items) {
    json answer = {{"extractions", json::array()}};
    for (const auto& item : items) {
        answer["extractions"].push_back(
            {{"extraction_class", item.first}, {"extraction_text", item.second}});
    }
    return answer.dump();
}

static std::string prompt_of(const std::string& body) {
    return json::parse(body)["messages"][0]["content"].get<std::string>();
}

static ProviderOptions glm_options(const MockTransportFactory& mock) {
    ProviderOptions options;
    options.model_id = "glm-4";
    options.api_key = "test-key";
    options.transport_factory = mock.factory();
    return options;
}

// ── build_extraction_prompt ─────────────────────────────────────

TEST_CASE("build_extraction_prompt: description, examples, then the target", "[extract]") {
    auto prompt = build_extraction_prompt("  Extract characters.  ", character_examples(),
                                          "JULIET. O Romeo!");

    REQUIRE(prompt.rfind("Extract characters.\n", 0) == 0);
    auto example_pos = prompt.find("Q: ROMEO. But soft!");
    auto target_pos = prompt.find("Q: JULIET. O Romeo!");
    REQUIRE(example_pos != std::string::npos);
    REQUIRE(target_pos != std::string::npos);
    REQUIRE(example_pos < target_pos);
    REQUIRE(prompt.find("\"extraction_class\":\"character\"") != std::string::npos);
    REQUIRE(prompt.substr(prompt.size() - 3) == "A: ");
}

TEST_CASE("build_extraction_prompt: no examples section without examples", "[extract]") {
    auto prompt = build_extraction_prompt("Find dates.", {}, "Due 2024-01-01");
    REQUIRE(prompt.find("Examples") == std::string::npos);
    REQUIRE(prompt.find("Q: Due 2024-01-01") != std::string::npos);
}

// ── parse_extractions ───────────────────────────────────────────

TEST_CASE("parse_extractions: object with extractions array", "[extract]") {
    auto exts = parse_extractions(R"({"extractions": [
        {"extraction_class": "character", "extraction_text": "JULIET",
         "attributes": {"state": "longing", "age": 13, "missing": null}}
    ]})");

    REQUIRE(exts.size() == 1);
    REQUIRE(exts[0].extraction_class == "character");
    REQUIRE(exts[0].extraction_text == "JULIET");
    REQUIRE(exts[0].attributes.at("state") == "longing");
    REQUIRE(exts[0].attributes.at("age") == "13");
    REQUIRE(exts[0].attributes.count("missing") == 0);
}

TEST_CASE("parse_extractions: fenced output and bare arrays", "[extract]") {
    auto fenced = parse_extractions("```json\n" + answer_for("place", "Verona") + "\n```");
    REQUIRE(fenced.size() == 1);
    REQUIRE(fenced[0].extraction_text == "Verona");

    auto bare = parse_extractions(R"([{"extraction_class": "a", "extraction_text": "b"}])");
    REQUIRE(bare.size() == 1);

    REQUIRE(parse_extractions(R"({"extractions": []})").empty());
}

TEST_CASE("parse_extractions: malformed output throws MalformedResponse", "[extract]") {
    auto kind_of = [](const std::string& output) {
        try {
            parse_extractions(output);
        } catch (const InferenceRuntimeError& e) {
            return e.kind();
        }
        return FailureKind::Transport;
    };

    REQUIRE(kind_of("not json") == FailureKind::MalformedResponse);
    REQUIRE(kind_of(R"({"items": []})") == FailureKind::MalformedResponse);
    REQUIRE(kind_of(R"({"extractions": [{"extraction_class": "x"}]})") ==
            FailureKind::MalformedResponse);
    REQUIRE(kind_of(R"({"extractions": [42]})") == FailureKind::MalformedResponse);
}

// ── extract_documents ───────────────────────────────────────────

TEST_CASE("extract_documents: one result per text in order, failures isolated", "[extract]") {
    MockTransportFactory mock;
    mock.client->handler = [](const std::string&, const std::string& body) {
        auto request = json::parse(body);
        auto prompt = request["messages"][0]["content"].get<std::string>();
        if (prompt.find("Q: doc two") != std::string::npos) {
            return HttpResponse{503, "unavailable", ""};
        }
        if (prompt.find("Q: doc three") != std::string::npos) {
            return chat_completion_response("I could not find anything.");
        }
        return chat_completion_response(answer_for("character", "ROMEO"));
    };

    ProviderOptions options;
    options.model_id = "glm-4";
    options.api_key = "test-key";
    options.transport_factory = mock.factory();
    GlmProvider provider(options);

    ExtractionOptions extract_options;
    extract_options.max_workers = 2;
    auto results = extract_documents(provider, "Extract characters.", character_examples(),
                                     {"doc one", "doc two", "doc three"}, extract_options);

    REQUIRE(results.size() == 3);

    REQUIRE(results[0].ok());
    REQUIRE(results[0].document.text == "doc one");
    REQUIRE(results[0].document.extractions.size() == 1);
    REQUIRE(results[0].document.document_id.rfind("doc_", 0) == 0);

    REQUIRE_FALSE(results[1].ok());
    REQUIRE(results[1].error->kind() == FailureKind::HttpStatus);
    REQUIRE(results[1].error->status_code() == 503);
    REQUIRE(results[1].document.text == "doc two");

    REQUIRE_FALSE(results[2].ok());
    REQUIRE(results[2].error->kind() == FailureKind::MalformedResponse);

    REQUIRE(results[0].document.document_id != results[1].document.document_id);
}

TEST_CASE("extract_documents: schema follows the use_schema option", "[extract]") {
    MockTransportFactory mock;
    mock.client->next_response = chat_completion_response(answer_for("character", "X"));

    ProviderOptions options;
    options.model_id = "glm-4";
    options.api_key = "test-key";
    options.transport_factory = mock.factory();
    GlmProvider provider(options);

    extract_documents(provider, "d", character_examples(), {"X"});
    REQUIRE(provider.structured_output());
    REQUIRE(provider.schema()->classes() == std::set<std::string>{"character", "emotion"});
    REQUIRE(json::parse(mock.client->last_body).contains("response_format"));

    ExtractionOptions no_schema;
    no_schema.use_schema = false;
    extract_documents(provider, "d", character_examples(), {"X"}, no_schema);
    REQUIRE_FALSE(provider.structured_output());
    REQUIRE_FALSE(json::parse(mock.client->last_body).contains("response_format"));
}

TEST_CASE("extract_documents: cancelled gate reports every document cancelled", "[extract]") {
    MockTransportFactory mock;
    mock.client->next_response = chat_completion_response(answer_for("a", "b"));

    ProviderOptions options;
    options.model_id = "glm-4";
    options.api_key = "test-key";
    options.transport_factory = mock.factory();
    GlmProvider provider(options);

    AdmissionGate gate(1);
    gate.cancel();
    ExtractionOptions extract_options;
    extract_options.params.gate = &gate;

    auto results = extract_documents(provider, "d", {}, {"a", "b"}, extract_options);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].error->kind() == FailureKind::Cancelled);
    REQUIRE(results[1].error->kind() == FailureKind::Cancelled);
    REQUIRE(mock.client->call_count.load() == 0);
}

// ── chunk_text ──────────────────────────────────────────────────

TEST_CASE("chunk_text: short text or zero limit is one chunk", "[extract]") {
    REQUIRE(chunk_text("short", 0) == std::vector<std::string>{"short"});
    REQUIRE(chunk_text("short", 5) == std::vector<std::string>{"short"});
    REQUIRE(chunk_text("", 3) == std::vector<std::string>{""});
}

TEST_CASE("chunk_text: breaks after sentence ends and newlines", "[extract]") {
    REQUIRE(chunk_text("One. Two. Three.", 10) ==
            std::vector<std::string>{"One. Two. ", "Three."});
    REQUIRE(chunk_text("ab\ncd. ef gh", 9) == std::vector<std::string>{"ab\n", "cd. ef gh"});
    REQUIRE(chunk_text("alpha beta gamma", 8) ==
            std::vector<std::string>{"alpha ", "beta ", "gamma"});
}

TEST_CASE("chunk_text: hard cuts respect UTF-8 boundaries", "[extract]") {
    REQUIRE(chunk_text("abcdefghij", 4) == std::vector<std::string>{"abcd", "efgh", "ij"});
    REQUIRE(chunk_text("\xC3\xA9\xC3\xA9\xC3\xA9", 3) ==
            std::vector<std::string>(3, "\xC3\xA9"));
}

TEST_CASE("chunk_text: chunks reassemble the text within the limit", "[extract]") {
    std::string text = "Lady Capulet enters.\nNurse: Madam! Juliet? "
                       "\xE5\xA5\xB9\xE6\x9D\xA5\xE4\xBA\x86\xE3\x80\x82 Exit all.";
    auto chunks = chunk_text(text, 16);

    std::string joined;
    for (const auto& chunk : chunks) {
        REQUIRE(!chunk.empty());
        REQUIRE(chunk.size() <= 16);
        joined += chunk;
    }
    REQUIRE(joined == text);
    REQUIRE(chunks.size() > 1);
}

// ── Chunked and multi-pass extraction ───────────────────────────

TEST_CASE("extract_documents: long text is sent in chunks and merged in order", "[extract]") {
    MockTransportFactory mock;
    mock.client->handler = [](const std::string&, const std::string& body) {
        auto prompt = prompt_of(body);
        if (prompt.find("Q: Beta two.") != std::string::npos) {
            return chat_completion_response(answer_for("item", "Beta"));
        }
        return chat_completion_response(answer_for("item", "Alpha"));
    };
    GlmProvider provider(glm_options(mock));

    ExtractionOptions options;
    options.max_char_buffer = 12;
    auto results = extract_documents(provider, "Extract items.", {},
                                     {"Alpha one. Beta two."}, options);

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].ok());
    REQUIRE(results[0].document.text == "Alpha one. Beta two.");
    REQUIRE(results[0].document.extractions.size() == 2);
    REQUIRE(results[0].document.extractions[0].extraction_text == "Alpha");
    REQUIRE(results[0].document.extractions[1].extraction_text == "Beta");
    REQUIRE(mock.client->call_count.load() == 2);
}

TEST_CASE("extract_documents: a failed chunk fails its pass", "[extract]") {
    MockTransportFactory mock;
    mock.client->handler = [](const std::string&, const std::string& body) {
        if (prompt_of(body).find("Q: Beta two.") != std::string::npos) {
            return HttpResponse{502, "bad gateway", ""};
        }
        return chat_completion_response(answer_for("item", "Alpha"));
    };
    GlmProvider provider(glm_options(mock));

    ExtractionOptions options;
    options.max_char_buffer = 12;
    auto results = extract_documents(provider, "d", {}, {"Alpha one. Beta two.", "Gamma"},
                                     options);

    REQUIRE_FALSE(results[0].ok());
    REQUIRE(results[0].error->status_code() == 502);
    REQUIRE(results[0].document.extractions.empty());
    REQUIRE(results[1].ok());
}

TEST_CASE("extract_documents: later passes add only unseen extractions", "[extract]") {
    MockTransportFactory mock;
    std::atomic<int> calls{0};
    mock.client->handler = [&calls](const std::string&, const std::string&) {
        if (++calls == 1) {
            return chat_completion_response(answer_with({{"person", "Romeo"}, {"person", "Romeo"}}));
        }
        return chat_completion_response(answer_with({{"place", "Verona"}, {"person", "Romeo"}}));
    };
    GlmProvider provider(glm_options(mock));

    ExtractionOptions options;
    options.max_workers = 1;
    options.extraction_passes = 2;
    auto results = extract_documents(provider, "d", {}, {"Romeo in Verona"}, options);

    REQUIRE(results[0].ok());
    const auto& exts = results[0].document.extractions;
    REQUIRE(exts.size() == 3);
    REQUIRE(exts[0].extraction_text == "Romeo");
    REQUIRE(exts[1].extraction_text == "Romeo");
    REQUIRE(exts[2].extraction_text == "Verona");
    REQUIRE(calls.load() == 2);
}

TEST_CASE("extract_documents: one successful pass is enough", "[extract]") {
    MockTransportFactory mock;
    std::atomic<int> calls{0};
    mock.client->handler = [&calls](const std::string&, const std::string&) {
        if (++calls == 1) return HttpResponse{500, "server error", ""};
        return chat_completion_response(answer_for("place", "Verona"));
    };
    GlmProvider provider(glm_options(mock));

    ExtractionOptions options;
    options.max_workers = 1;
    options.extraction_passes = 2;
    auto results = extract_documents(provider, "d", {}, {"Verona"}, options);

    REQUIRE(results[0].ok());
    REQUIRE(results[0].document.extractions.size() == 1);
    REQUIRE(results[0].document.extractions[0].extraction_text == "Verona");
}

TEST_CASE("extract_documents: every pass failing reports the first error", "[extract]") {
    MockTransportFactory mock;
    std::atomic<int> calls{0};
    mock.client->handler = [&calls](const std::string&, const std::string&) {
        if (++calls == 1) return HttpResponse{503, "unavailable", ""};
        return chat_completion_response("no json here");
    };
    GlmProvider provider(glm_options(mock));

    ExtractionOptions options;
    options.max_workers = 1;
    options.extraction_passes = 2;
    auto results = extract_documents(provider, "d", {}, {"text"}, options);

    REQUIRE_FALSE(results[0].ok());
    REQUIRE(results[0].error->kind() == FailureKind::HttpStatus);
    REQUIRE(results[0].error->status_code() == 503);
}

TEST_CASE("extract_documents: zero passes runs once", "[extract]") {
    MockTransportFactory mock;
    mock.client->next_response = chat_completion_response(answer_for("a", "b"));
    GlmProvider provider(glm_options(mock));

    ExtractionOptions options;
    options.extraction_passes = 0;
    auto results = extract_documents(provider, "d", {}, {"b"}, options);

    REQUIRE(results[0].ok());
    REQUIRE(mock.client->call_count.load() == 1);
}

// ── extract ─────────────────────────────────────────────────────

TEST_CASE("extract: resolves the provider from the model id", "[extract]") {
    ProviderRegistry registry;
    registry.load_builtin_providers();

    MockTransportFactory mock;
    mock.client->next_response = chat_completion_response(answer_for("character", "JULIET"));

    ExtractionRequest request;
    request.text = "JULIET. O Romeo, Romeo!";
    request.prompt_description = "Extract characters.";
    request.examples = character_examples();
    request.model_id = "gpt-4o";
    request.api_key = "test-key";
    request.transport_factory = mock.factory();

    auto doc = extract(registry, request);

    REQUIRE(mock.client->last_url == "https://api.openai.com/v1/chat/completions");
    REQUIRE(doc.text == request.text);
    REQUIRE(doc.extractions.size() == 1);
    REQUIRE(doc.extractions[0].extraction_text == "JULIET");
    REQUIRE(mock.client->close_count.load() == 1);
}

TEST_CASE("extract: chunks and passes apply to a single document", "[extract]") {
    ProviderRegistry registry;
    registry.load_builtin_providers();
    MockTransportFactory mock;
    mock.client->handler = [](const std::string&, const std::string& body) {
        if (prompt_of(body).find("Q: Beta two.") != std::string::npos) {
            return chat_completion_response(answer_for("item", "Beta"));
        }
        return chat_completion_response(answer_for("item", "Alpha"));
    };

    ExtractionRequest request;
    request.text = "Alpha one. Beta two.";
    request.prompt_description = "Extract items.";
    request.model_id = "glm-4";
    request.api_key = "k";
    request.max_char_buffer = 12;
    request.extraction_passes = 2;
    request.transport_factory = mock.factory();

    auto doc = extract(registry, request);

    REQUIRE(doc.text == request.text);
    REQUIRE(doc.extractions.size() == 2);
    REQUIRE(doc.extractions[0].extraction_text == "Alpha");
    REQUIRE(doc.extractions[1].extraction_text == "Beta");
    REQUIRE(mock.client->call_count.load() == 4);
}

TEST_CASE("extract: unknown model and missing key fail before any request", "[extract]") {
    ProviderRegistry registry;
    registry.load_builtin_providers();
    MockTransportFactory mock;

    ExtractionRequest request;
    request.text = "t";
    request.prompt_description = "d";
    request.api_key = "k";
    request.transport_factory = mock.factory();

    request.model_id = "claude-3";
    REQUIRE_THROWS_AS(extract(registry, request), NoProviderFound);

    request.model_id = "glm-4";
    request.api_key.clear();
    REQUIRE_THROWS_AS(extract(registry, request), InferenceConfigError);

    REQUIRE(mock.created->load() == 0);
}

TEST_CASE("extract: request failure is rethrown", "[extract]") {
    ProviderRegistry registry;
    registry.load_builtin_providers();
    MockTransportFactory mock;
    mock.client->next_response = {429, "rate limited", ""};

    ExtractionRequest request;
    request.text = "t";
    request.prompt_description = "d";
    request.model_id = "glm-4";
    request.api_key = "k";
    request.transport_factory = mock.factory();

    try {
        extract(registry, request);
        FAIL("expected InferenceRuntimeError");
    } catch (const InferenceRuntimeError& e) {
        REQUIRE(e.status_code() == 429);
        REQUIRE(e.is_transient());
    }
}

// ── JSON conversion ─────────────────────────────────────────────

TEST_CASE("document_to_json: id and extractions", "[extract]") {
    AnnotatedDocument doc{"doc_1", "text", {{"c", "t", {{"k", "v"}}}}};
    auto j = document_to_json(doc);
    REQUIRE(j["document_id"] == "doc_1");
    REQUIRE(j["extractions"][0]["extraction_class"] == "c");
    REQUIRE(j["extractions"][0]["attributes"]["k"] == "v");
}

TEST_CASE("example_from_json: reads text and extractions", "[extract]") {
    auto ex = example_from_json(json::parse(R"({
        "text": "Paris is in France",
        "extractions": [{"extraction_class": "city", "extraction_text": "Paris"}]
    })"));
    REQUIRE(ex.text == "Paris is in France");
    REQUIRE(ex.extractions.size() == 1);
    REQUIRE(ex.extractions[0].attributes.empty());
}
