#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace glmextract {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

static void apply_tls(CURL* curl, const TlsVerification& tls) {
    if (!tls.verify) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        return;
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    if (!tls.ca_bundle.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, tls.ca_bundle.c_str());
    }
}

// ── RAII lease of a pooled easy handle ────────────────────────

class HandleLease {
public:
    HandleLease(CurlHttpClient& owner, void* handle,
                void (CurlHttpClient::*release)(void*))
        : owner_(owner), handle_(handle), release_(release) {}
    ~HandleLease() {
        curl_slist_free_all(hlist);
        if (handle_) (owner_.*release_)(handle_);
    }
    HandleLease(const HandleLease&) = delete;
    HandleLease& operator=(const HandleLease&) = delete;

    CURL* curl() const { return static_cast<CURL*>(handle_); }
    explicit operator bool() const { return handle_ != nullptr; }

    curl_slist* hlist = nullptr;

private:
    CurlHttpClient& owner_;
    void* handle_;
    void (CurlHttpClient::*release_)(void*);
};

// ── CurlHttpClient ────────────────────────────────────────────

CurlHttpClient::CurlHttpClient(TransportOptions options)
    : options_(std::move(options)) {}

CurlHttpClient::~CurlHttpClient() {
    close();
}

void* CurlHttpClient::acquire_handle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            void* handle = idle_.back();
            idle_.pop_back();
            // Reset options but keep live connections and the session cache.
            curl_easy_reset(static_cast<CURL*>(handle));
            return handle;
        }
    }
    return curl_easy_init();
}

void CurlHttpClient::release_handle(void* handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        curl_easy_cleanup(static_cast<CURL*>(handle));
        return;
    }
    idle_.push_back(handle);
}

void CurlHttpClient::close() {
    std::vector<void*> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        handles.swap(idle_);
    }
    for (void* handle : handles) {
        curl_easy_cleanup(static_cast<CURL*>(handle));
    }
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    HandleLease req(*this, acquire_handle(), &CurlHttpClient::release_handle);
    HttpResponse response;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }

    CURL* curl = req.curl();
    char errbuf[CURL_ERROR_SIZE] = {0};
    req.hlist = build_headers(headers);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds > 0 ? timeout_seconds
                                                              : options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    apply_tls(curl, options_.tls);
    apply_abort_hook(curl);

    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.error = errbuf[0] ? std::string(curl_easy_strerror(res)) + ": " + errbuf
                                   : std::string(curl_easy_strerror(res));
    }
    // The error buffer lives on this stack frame only.
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    return response;
}

std::shared_ptr<HttpClient> make_curl_transport(const TransportOptions& options) {
    return std::make_shared<CurlHttpClient>(options);
}

} // namespace glmextract
