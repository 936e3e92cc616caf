#pragma once
#include "http.hpp"
#include <string>
#include <vector>

namespace multichat {

// Replays canned response bodies through the raw-chunk callback.
class MockHttpClient : public HttpClient {
public:
    struct Scripted {
        std::vector<std::string> chunks; // delivered to the callback in order
        HttpResponse response;
    };

    Scripted next_response;
    std::vector<Scripted> response_queue;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    int call_count = 0;
    size_t chunks_delivered = 0;

    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long /*timeout_seconds*/) override {
        call_count++;
        last_url = url;
        last_body = body;
        last_headers = headers;

        Scripted scripted = next_response;
        if (!response_queue.empty()) {
            scripted = response_queue.front();
            response_queue.erase(response_queue.begin());
        }

        for (const auto& chunk : scripted.chunks) {
            chunks_delivered++;
            if (!callback(chunk.data(), chunk.size())) {
                HttpResponse aborted = scripted.response;
                aborted.aborted = true;
                return aborted;
            }
        }
        return scripted.response;
    }

    std::string header(const std::string& name) const {
        for (const auto& [key, value] : last_headers) {
            if (key == name) return value;
        }
        return {};
    }
};

// SSE frame carrying one chat-completions content delta.
inline std::string sse_delta(const std::string& text) {
    return "data: {\"choices\":[{\"delta\":{\"content\":\"" + text + "\"}}]}\n\n";
}

} // namespace multichat
