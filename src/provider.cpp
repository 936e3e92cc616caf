#include "provider.hpp"
#include "config.hpp"
#include "providers/openai_compatible.hpp"
#include <stdexcept>

namespace multichat {

static std::string default_base_url(const std::string& name) {
    if (name == "openai") return "https://api.openai.com/v1";
    if (name == "openrouter") return "https://openrouter.ai/api/v1";
    if (name == "ollama") return "http://localhost:11434/v1";
    return {};
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const Config& config,
                                          HttpClient& http) {
    if (name != "openai" && name != "openrouter" &&
        name != "ollama" && name != "compatible") {
        throw std::runtime_error("Unknown provider: " + name);
    }

    std::string base_url = config.base_url_for(name);
    if (base_url.empty()) base_url = default_base_url(name);
    if (base_url.empty()) {
        throw std::runtime_error("Provider " + name + " needs a base_url");
    }

    return std::make_unique<OpenAICompatibleProvider>(
        name, config.api_key_for(name), http, base_url);
}

} // namespace multichat
