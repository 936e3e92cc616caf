#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace multichat {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct StreamingConfig {
    uint32_t max_concurrent_streams = 20;
    uint32_t worker_threads = 4;
    uint32_t context_messages = 20;   // stored messages sent with each prompt
    bool persist_cancelled = false;   // store partial content on explicit stop
};

// What the view cache does when every cached entry is either the
// active session or backing a running stream.
enum class EvictionFallback {
    Overflow,     // keep everything, grow past capacity until an entry frees up
    EvictOldest   // drop the oldest non-active view; its stream keeps running
};

const char* eviction_fallback_to_string(EvictionFallback fallback);
bool parse_eviction_fallback(const std::string& name, EvictionFallback& out);

struct ViewCacheConfig {
    uint32_t max_cached_views = 20;
    uint32_t message_page_size = 100;
    EvictionFallback eviction_fallback = EvictionFallback::Overflow;
};

struct StoreConfig {
    std::string path; // empty = ~/.multichat/chats.db
};

struct Config {
    std::string provider = "openai";
    std::string model = "gpt-4o-mini";
    double temperature = 0.7;
    std::string system_prompt;

    std::unordered_map<std::string, ProviderEntry> providers;

    StreamingConfig streaming;
    ViewCacheConfig view_cache;
    StoreConfig store;

    // Load from ~/.multichat/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // Resolved SQLite database path
    std::string store_path() const;
};

// Path of the config file (~/.multichat/config.json, HOME expanded)
std::string config_file_path();

} // namespace multichat
