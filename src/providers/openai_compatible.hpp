#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace multichat {

// Streaming client for the OpenAI chat-completions API and the many
// servers that mirror it (OpenRouter, Ollama's /v1, llama.cpp, vLLM).
class OpenAICompatibleProvider : public Provider {
public:
    OpenAICompatibleProvider(std::string name,
                             const std::string& api_key,
                             HttpClient& http,
                             const std::string& base_url);

    ChatResponse chat_stream(const std::vector<ChatMessage>& messages,
                             const std::string& model,
                             double temperature,
                             const TextDeltaCallback& on_delta) override;

    std::string provider_name() const override { return name_; }

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::string& model,
                                 double temperature) const;

    const std::string& base_url() const { return base_url_; }

private:
    std::vector<Header> build_headers() const;

    std::string name_;
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace multichat
