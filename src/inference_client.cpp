#include "inference_client.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <system_error>
#include <utility>

namespace glmextract {

const std::vector<ScoredOutput>& InferenceResult::value() const {
    if (error) throw *error;
    return outputs;
}

namespace {

InferenceResult run_one(HttpClient& http, const RequestFn& request,
                        const std::string& prompt) {
    InferenceResult result;
    try {
        result.outputs = request(http, prompt);
    } catch (const InferenceRuntimeError& e) {
        result.error = e;
    } catch (const std::exception& e) {
        result.error = InferenceRuntimeError(std::string("Inference failed: ") + e.what(),
                                             FailureKind::Transport, 0, e.what());
    }
    return result;
}

InferenceResult cancelled_result() {
    InferenceResult result;
    result.error = InferenceRuntimeError("Request cancelled before dispatch",
                                         FailureKind::Cancelled);
    return result;
}

// Releases an admission slot when the request finishes, however it ends.
struct SlotRelease {
    AdmissionGate* gate;
    ~SlotRelease() {
        if (gate) gate->release();
    }
};

std::thread launch_thread(std::function<void()> work) {
    return std::thread(std::move(work));
}

// Core batch executor. The returned future's driver starts the workers, each
// of which takes the next prompt index, waits for admission and stores its
// result by index. Admission happens inside the worker, so a worker that was
// never started never holds a slot.
std::future<std::vector<InferenceResult>> dispatch(std::shared_ptr<HttpClient> http,
                                                   std::vector<std::string> prompts,
                                                   RequestFn request,
                                                   AdmissionGate* gate,
                                                   WorkerLauncher launch) {
    auto driver = std::make_shared<std::function<std::vector<InferenceResult>()>>(
        [http = std::move(http), prompts = std::move(prompts),
         request = std::move(request), gate, launch = std::move(launch)]() {
            const size_t total = prompts.size();
            std::vector<InferenceResult> results(total);
            std::atomic<size_t> next{0};

            auto work = [&]() {
                for (size_t i = next++; i < total; i = next++) {
                    if (gate && !gate->acquire()) {
                        results[i] = cancelled_result();
                        continue;
                    }
                    SlotRelease slot{gate};
                    results[i] = run_one(*http, request, prompts[i]);
                }
            };

            const size_t wanted = gate ? std::min(total, gate->capacity()) : total;
            std::vector<std::thread> workers;
            workers.reserve(wanted);
            for (size_t w = 0; w < wanted; ++w) {
                try {
                    workers.push_back(launch(work));
                } catch (const std::system_error& e) {
                    std::cerr << "[inference] Started " << workers.size() << "/" << wanted
                              << " workers: " << e.what() << '\n';
                    break;
                }
            }
            if (workers.empty()) {
                work();
            }
            for (auto& worker : workers) {
                worker.join();
            }

            for (size_t i = 0; i < total; ++i) {
                if (!results[i].ok()) {
                    std::cerr << "[inference] Request " << (i + 1) << "/" << total
                              << " failed: " << results[i].error->what() << '\n';
                }
            }
            return results;
        });

    try {
        return std::async(std::launch::async, [driver]() { return (*driver)(); });
    } catch (const std::system_error& e) {
        std::cerr << "[inference] No driver thread (" << e.what()
                  << "), batch runs on first wait\n";
        return std::async(std::launch::deferred, [driver]() { return (*driver)(); });
    }
}

// Closes a transport owned by a single blocking call.
struct ScopedTransport {
    std::shared_ptr<HttpClient> http;
    ~ScopedTransport() {
        if (http) http->close();
    }
};

} // namespace

InferenceClient::InferenceClient(TransportOptions options, TransportFactory factory,
                                 WorkerLauncher launcher)
    : options_(std::move(options)),
      factory_(factory ? std::move(factory) : TransportFactory(make_curl_transport)),
      launcher_(launcher ? std::move(launcher) : WorkerLauncher(launch_thread)) {}

InferenceClient::~InferenceClient() {
    close();
}

std::shared_ptr<HttpClient> InferenceClient::make_transport() const {
    auto http = factory_(options_);
    if (!http) {
        throw InferenceRuntimeError("Transport factory returned no client",
                                    FailureKind::Transport);
    }
    return http;
}

std::shared_ptr<HttpClient> InferenceClient::transport() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transport_) {
        transport_ = make_transport();
    }
    return transport_;
}

bool InferenceClient::has_transport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_ != nullptr;
}

void InferenceClient::close() {
    std::shared_ptr<HttpClient> http;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        http.swap(transport_);
    }
    if (http) http->close();
}

std::future<std::vector<InferenceResult>> InferenceClient::run_async(
    const std::vector<std::string>& prompts, RequestFn request, AdmissionGate* gate) {
    return dispatch(transport(), prompts, std::move(request), gate, launcher_);
}

std::vector<InferenceResult> InferenceClient::run_blocking(
    const std::vector<std::string>& prompts, RequestFn request, AdmissionGate* gate) {
    ScopedTransport scoped{make_transport()};
    return dispatch(scoped.http, prompts, std::move(request), gate, launcher_).get();
}

} // namespace glmextract
