#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace multichat {

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

struct RawStreamContext {
    CURL* curl = nullptr;
    RawChunkCallback* callback = nullptr;
    HttpResponse* response = nullptr;
    bool aborted = false;
};

// Called by curl at least once per second, data or not. Return non-zero
// to abort the transfer.
static int stream_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<RawStreamContext*>(clientp);
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed)) {
        return 1;
    }
    if (!(*ctx->callback)(nullptr, 0)) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->aborted) return 0;

    // Error bodies are kept for the caller's exception message instead of
    // being fed to the stream parser.
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        ctx->response->body.append(ptr, total);
        return total;
    }

    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }

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

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

HttpResponse CurlHttpClient::stream_post_raw(const std::string& url,
                                              const std::string& body,
                                              const std::vector<Header>& headers,
                                              RawChunkCallback callback,
                                              long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    RawStreamContext ctx;
    ctx.curl = req.curl;
    ctx.callback = &callback;
    ctx.response = &response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, stream_progress_cb);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.aborted = ctx.aborted;
    if (res != CURLE_OK && !ctx.aborted) {
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace multichat
