#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace multichat {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string body;   // error responses only; successful bodies go to the callback
    std::string error;  // transport error, empty on success
    bool aborted = false;
};

// Raw-chunk streaming callback: receives raw bytes from the response.
// Also called with len == 0 from the transfer's progress hook, so an idle
// stream can be aborted. Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds = 300) = 0;
};

// libcurl implementation
class CurlHttpClient : public HttpClient {
public:
    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long timeout_seconds = 300) override;
};

} // namespace multichat
