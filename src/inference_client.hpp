#pragma once
#include "errors.hpp"
#include "extraction.hpp"
#include "gate.hpp"
#include "http.hpp"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace glmextract {

// Outcome of one prompt in a batch: outputs on success, error otherwise.
struct InferenceResult {
    std::vector<ScoredOutput> outputs;
    std::optional<InferenceRuntimeError> error;

    bool ok() const { return !error.has_value(); }

    // Outputs, or rethrows the captured error.
    const std::vector<ScoredOutput>& value() const;
};

// Performs one full request/response cycle for a prompt over the given
// transport. Throws InferenceRuntimeError on failure.
using RequestFn = std::function<std::vector<ScoredOutput>(HttpClient& http,
                                                          const std::string& prompt)>;

// Starts one batch worker thread. Throws std::system_error when the thread
// cannot be created.
using WorkerLauncher = std::function<std::thread(std::function<void()> work)>;

// Owns the transport lifecycle and runs batches of requests.
//
// The non-blocking path dispatches every prompt against one persistent,
// lazily created transport that lives until close(). The blocking path is a
// thin adapter over the same core: it creates a private transport, runs the
// batch on a dedicated worker and closes the transport before returning.
//
// A batch runs on one worker per prompt, or one per gate slot when an
// AdmissionGate is given. If fewer workers can be started the started ones
// drain the batch; if none can, the batch runs on the driver thread.
// No retries. Results are always returned in prompt order.
class InferenceClient {
public:
    InferenceClient(TransportOptions options, TransportFactory factory,
                    WorkerLauncher launcher = {});
    ~InferenceClient();

    InferenceClient(const InferenceClient&) = delete;
    InferenceClient& operator=(const InferenceClient&) = delete;

    std::future<std::vector<InferenceResult>> run_async(const std::vector<std::string>& prompts,
                                                        RequestFn request,
                                                        AdmissionGate* gate = nullptr);

    std::vector<InferenceResult> run_blocking(const std::vector<std::string>& prompts,
                                              RequestFn request,
                                              AdmissionGate* gate = nullptr);

    // Persistent transport, created on first call.
    std::shared_ptr<HttpClient> transport();
    bool has_transport() const;

    // Release the persistent transport. Safe to call repeatedly and when no
    // transport was ever created. In-flight requests keep their reference
    // and finish normally.
    void close();

private:
    std::shared_ptr<HttpClient> make_transport() const;

    TransportOptions options_;
    TransportFactory factory_;
    WorkerLauncher launcher_;
    mutable std::mutex mutex_;
    std::shared_ptr<HttpClient> transport_;
};

} // namespace glmextract
