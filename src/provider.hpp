#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <cstdint>

namespace multichat {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    TokenUsage usage;
    std::string model;
    bool aborted = false; // the delta callback asked to stop
};

// Callback for streaming text deltas. Return false to abort. An empty
// delta is a heartbeat sent while the stream is idle.
using TextDeltaCallback = std::function<bool(const std::string& delta)>;

// Abstract base class for LLM providers. Implementations throw
// std::runtime_error on transport or API failure.
class Provider {
public:
    virtual ~Provider() = default;

    // Stream one assistant reply. Deltas are delivered in order on the
    // calling thread; the returned content is the full reply.
    virtual ChatResponse chat_stream(const std::vector<ChatMessage>& messages,
                                     const std::string& model,
                                     double temperature,
                                     const TextDeltaCallback& on_delta) = 0;

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration
struct Config;

// Factory: create the configured provider by name.
// Throws std::runtime_error for unknown names or missing endpoints.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const Config& config,
                                          HttpClient& http);

} // namespace multichat
