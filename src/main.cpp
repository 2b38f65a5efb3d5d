#include "config.hpp"
#include "errors.hpp"
#include "extract.hpp"
#include "extraction_json.hpp"
#include "gate.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "schema.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: glmextract [options]\n"
              << "\n"
              << "Options:\n"
              << "  --task FILE          Extraction task (JSON: prompt, examples, documents)\n"
              << "  --model ID           Model id (selects the provider, e.g. glm-4, gpt-4o)\n"
              << "  --workers N          Concurrent requests (default from config: 4)\n"
              << "  --no-schema          Do not constrain output with the example schema\n"
              << "  --passes N           Extraction passes per document (default: 1)\n"
              << "  --max-char-buffer N  Split documents into chunks of N bytes (default: off)\n"
              << "  --output FILE        Write results to FILE instead of stdout\n"
              << "  --resolve ID         Print the provider a model id resolves to\n"
              << "  --list-providers     List registered provider patterns\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GLM_API_KEY          API key for GLM models\n"
              << "  GLM_BASE_URL         Base URL for GLM (default: https://open.bigmodel.cn/api/paas/v4)\n"
              << "  OPENAI_API_KEY       API key for OpenAI models\n"
              << "  OPENAI_BASE_URL      Base URL for OpenAI-compatible endpoints\n"
              << "  GLMEXTRACT_MODEL     Default model id\n"
              << "  GLMEXTRACT_VERIFY_SSL  true, false, or a CA bundle path\n";
}

struct Task {
    std::string prompt;
    std::vector<glmextract::ExampleAnnotation> examples;
    std::vector<std::string> documents;
};

static Task load_task(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open task file: " + path);
    }
    nlohmann::json j = nlohmann::json::parse(file);

    Task task;
    task.prompt = j.value("prompt", "");
    if (j.contains("examples") && j["examples"].is_array()) {
        for (const auto& e : j["examples"]) {
            if (e.is_object()) task.examples.push_back(glmextract::example_from_json(e));
        }
    }
    if (j.contains("documents") && j["documents"].is_array()) {
        for (const auto& d : j["documents"]) {
            if (d.is_string()) {
                task.documents.push_back(d.get<std::string>());
            } else if (d.is_object() && d.contains("text") && d["text"].is_string()) {
                task.documents.push_back(d["text"].get<std::string>());
            }
        }
    }
    if (task.prompt.empty()) {
        throw std::runtime_error("Task file has no \"prompt\"");
    }
    return task;
}

// Stops and joins the interrupt watcher however the batch ends.
struct WatcherGuard {
    std::atomic<bool>& done;
    std::thread& thread;

    ~WatcherGuard() {
        done.store(true);
        if (thread.joinable()) thread.join();
    }
};

static nlohmann::json results_to_json(const std::vector<glmextract::DocumentResult>& results) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : results) {
        nlohmann::json item = glmextract::document_to_json(r.document);
        if (r.ok()) {
            item["status"] = "success";
        } else {
            item["status"] = "error";
            item["error"] = {
                {"message", r.error->what()},
                {"kind", glmextract::failure_kind_to_string(r.error->kind())},
                {"status_code", r.error->status_code()},
                {"transient", r.error->is_transient()}
            };
        }
        out.push_back(item);
    }
    return out;
}

int main(int argc, char* argv[]) try {
    std::string task_path;
    std::string model_name;
    std::string output_path;
    std::string resolve_id;
    long workers = 0;
    long passes = 1;
    long max_char_buffer = 0;
    bool no_schema = false;
    bool list_providers = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--task") == 0 && i + 1 < argc) {
            task_path = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--passes") == 0 && i + 1 < argc) {
            passes = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--max-char-buffer") == 0 && i + 1 < argc) {
            max_char_buffer = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output_path = argv[++i];
        } else if (std::strcmp(argv[i], "--resolve") == 0 && i + 1 < argc) {
            resolve_id = argv[++i];
        } else if (std::strcmp(argv[i], "--no-schema") == 0) {
            no_schema = true;
        } else if (std::strcmp(argv[i], "--list-providers") == 0) {
            list_providers = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    glmextract::ProviderRegistry registry;
    registry.load_builtin_providers();

    if (list_providers) {
        for (const auto& d : registry.descriptors()) {
            std::cout << d.name << "\t" << d.pattern << "\tpriority " << d.priority << "\n";
        }
        return 0;
    }

    if (!resolve_id.empty()) {
        try {
            std::cout << registry.resolve(resolve_id).name << "\n";
            return 0;
        } catch (const glmextract::NoProviderFound& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    if (task_path.empty()) {
        print_usage();
        return 1;
    }
    if (passes < 1 || max_char_buffer < 0) {
        std::cerr << "Error: --passes must be at least 1 and --max-char-buffer not negative\n";
        return 1;
    }

    // Initialize
    glmextract::http_init();
    auto config = glmextract::Config::load();

    // Override config with CLI args
    if (!model_name.empty()) config.model = model_name;
    if (workers > 0) config.max_workers = static_cast<uint32_t>(workers);
    if (no_schema) config.use_schema = false;

    Task task = load_task(task_path);
    for (const auto& ext : glmextract::find_ungrounded_extractions(task.examples)) {
        std::cerr << "[extract] WARNING: example extraction '" << ext.extraction_text
                  << "' (" << ext.extraction_class << ") is not found verbatim in its text\n";
    }

    std::unique_ptr<glmextract::Provider> provider;
    try {
        auto descriptor = registry.resolve(config.model);
        provider = registry.create_provider_by_name(
            descriptor.name, config.provider_options(descriptor.name));
    } catch (const std::invalid_argument& e) {
        // NoProviderFound and InferenceConfigError
        std::cerr << "Error creating provider: " << e.what() << "\n";
        glmextract::http_cleanup();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    glmextract::http_set_abort_flag(&g_shutdown);

    // Stop admitting new requests once a shutdown signal arrives.
    glmextract::AdmissionGate gate(config.max_workers > 0 ? config.max_workers : 1);
    std::atomic<bool> done{false};
    std::thread watcher([&gate, &done]() {
        while (!done.load()) {
            if (g_shutdown.load()) {
                std::cerr << "[extract] Interrupted, cancelling pending requests\n";
                gate.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });
    WatcherGuard watcher_guard{done, watcher};

    glmextract::ExtractionOptions options;
    options.use_schema = config.use_schema;
    options.max_workers = config.max_workers;
    options.extraction_passes = static_cast<size_t>(passes);
    options.max_char_buffer = static_cast<size_t>(max_char_buffer);
    options.params.gate = &gate;

    auto results = glmextract::extract_documents(*provider, task.prompt, task.examples,
                                                 task.documents, options);
    provider->close();

    size_t failed = 0;
    for (const auto& r : results) {
        if (!r.ok()) ++failed;
    }
    std::cerr << "[extract] " << (results.size() - failed) << "/" << results.size()
              << " document(s) succeeded at " << glmextract::timestamp_now() << "\n";

    std::string rendered = results_to_json(results).dump(2, ' ', false,
        nlohmann::json::error_handler_t::replace) + "\n";
    if (output_path.empty()) {
        std::cout << rendered;
    } else if (!glmextract::atomic_write_file(output_path, rendered)) {
        std::cerr << "Error: cannot write " << output_path << "\n";
        glmextract::http_cleanup();
        return 1;
    }

    glmextract::http_cleanup();
    return failed == 0 ? 0 : 2;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
