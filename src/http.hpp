#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace glmextract {

// Initialize HTTP subsystem (call once at startup, before any thread starts).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 when the transfer itself failed
    std::string body;
    std::string error;     // transport error message when status_code == 0
};

// TLS peer verification policy. Verifies by default; disabling it is an
// explicit opt-out. A non-empty ca_bundle implies verification against it.
struct TlsVerification {
    bool verify = true;
    std::string ca_bundle;

    static TlsVerification disabled() { return {false, ""}; }
    static TlsVerification with_ca_bundle(const std::string& path) { return {true, path}; }
};

struct TransportOptions {
    TlsVerification tls;
    long timeout_seconds = 60;
};

// Abstract HTTP client interface (injectable for testing).
// Implementations must tolerate concurrent post() calls.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 60) = 0;

    // Release pooled connections. Idempotent.
    virtual void close() {}
};

using TransportFactory = std::function<std::shared_ptr<HttpClient>(const TransportOptions&)>;

// libcurl client keeping a pool of easy handles so connections are reused
// across requests and across threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(TransportOptions options);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 60) override;

    void close() override;

private:
    // Opaque CURL* handles; <curl/curl.h> stays out of this header.
    void* acquire_handle();
    void release_handle(void* handle);

    TransportOptions options_;
    std::mutex mutex_;
    std::vector<void*> idle_;
    bool closed_ = false;
};

// Default transport factory (libcurl).
std::shared_ptr<HttpClient> make_curl_transport(const TransportOptions& options);

} // namespace glmextract
