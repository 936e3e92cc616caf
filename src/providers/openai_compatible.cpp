#include "openai_compatible.hpp"
#include "sse.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace multichat {

OpenAICompatibleProvider::OpenAICompatibleProvider(std::string name,
                                                   const std::string& api_key,
                                                   HttpClient& http,
                                                   const std::string& base_url)
    : name_(std::move(name)), api_key_(api_key), http_(http), base_url_(base_url) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json OpenAICompatibleProvider::build_request(const std::vector<ChatMessage>& messages,
                                              const std::string& model,
                                              double temperature) const {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;
    request["stream"] = true;
    request["stream_options"] = {{"include_usage", true}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request;
}

std::vector<Header> OpenAICompatibleProvider::build_headers() const {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };
    if (!api_key_.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key_);
    }
    return headers;
}

ChatResponse OpenAICompatibleProvider::chat_stream(const std::vector<ChatMessage>& messages,
                                                    const std::string& model,
                                                    double temperature,
                                                    const TextDeltaCallback& on_delta) {
    json request = build_request(messages, model, temperature);
    std::string url = base_url_ + "/chat/completions";

    ChatResponse result;
    result.model = model;
    std::string accumulated_text;
    std::string stream_error;
    bool stopped = false;

    auto handle_event = [&](const SSEEvent& sse) -> bool {
        if (sse.data.empty() || sse.data == "[DONE]") return true;

        json payload = json::parse(sse.data, nullptr, false);
        if (payload.is_discarded()) return true;

        // Some servers report failures in-band after a 200 status
        if (payload.contains("error")) {
            const auto& err = payload["error"];
            stream_error = err.is_object() ? err.value("message", err.dump())
                                           : err.dump();
            return false;
        }

        if (payload.contains("model") && payload["model"].is_string()) {
            result.model = payload["model"].get<std::string>();
        }

        if (payload.contains("choices") && payload["choices"].is_array() &&
            !payload["choices"].empty()) {
            const auto& choice = payload["choices"][0];
            if (choice.contains("delta") && choice["delta"].contains("content") &&
                choice["delta"]["content"].is_string()) {
                std::string text = choice["delta"]["content"].get<std::string>();
                if (!text.empty()) {
                    accumulated_text += text;
                    if (on_delta && !on_delta(text)) {
                        stopped = true;
                        return false;
                    }
                }
            }
        }

        // Usage (sent in final chunk with stream_options)
        if (payload.contains("usage") && payload["usage"].is_object()) {
            const auto& usage = payload["usage"];
            result.usage.prompt_tokens = usage.value("prompt_tokens", 0u);
            result.usage.completion_tokens = usage.value("completion_tokens", 0u);
            result.usage.total_tokens = usage.value("total_tokens", 0u);
        }
        return true;
    };

    SSEParser parser;
    auto http_response = http_.stream_post_raw(
        url, request.dump(), build_headers(),
        [&](const char* data, size_t len) -> bool {
            if (len == 0) {
                // Idle heartbeat from the transport
                if (on_delta && !on_delta("")) {
                    stopped = true;
                    return false;
                }
                return true;
            }
            return parser.feed(std::string(data, len), handle_event);
        });

    if (!stopped && stream_error.empty()) {
        parser.finish(handle_event);
    }

    if (!stream_error.empty()) {
        throw std::runtime_error(name_ + " stream error: " + stream_error);
    }
    if (stopped) {
        result.aborted = true;
        result.content = accumulated_text;
        return result;
    }
    if (!http_response.error.empty()) {
        throw std::runtime_error(name_ + " request failed: " + http_response.error);
    }
    if (http_response.status_code < 200 || http_response.status_code >= 300) {
        throw std::runtime_error(name_ + " API error (HTTP " +
            std::to_string(http_response.status_code) + "): " + http_response.body);
    }

    result.content = accumulated_text;
    return result;
}

} // namespace multichat
