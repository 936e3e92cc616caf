#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace multichat {

const char* eviction_fallback_to_string(EvictionFallback fallback) {
    switch (fallback) {
        case EvictionFallback::Overflow: return "overflow";
        case EvictionFallback::EvictOldest: return "evict_oldest";
    }
    return "overflow";
}

bool parse_eviction_fallback(const std::string& name, EvictionFallback& out) {
    if (name == "overflow") {
        out = EvictionFallback::Overflow;
        return true;
    }
    if (name == "evict_oldest") {
        out = EvictionFallback::EvictOldest;
        return true;
    }
    return false;
}

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "openai"},
        {"model", "gpt-4o-mini"},
        {"temperature", 0.7},
        {"system_prompt", ""},
        {"providers", {
            {"openai", {{"api_key", ""}, {"base_url", "https://api.openai.com/v1"}}},
            {"openrouter", {{"api_key", ""}, {"base_url", "https://openrouter.ai/api/v1"}}},
            {"ollama", {{"base_url", "http://localhost:11434/v1"}}},
            {"compatible", {{"api_key", ""}, {"base_url", ""}}}
        }},
        {"streaming", {
            {"max_concurrent_streams", 20},
            {"worker_threads", 4},
            {"context_messages", 20},
            {"persist_cancelled", false}
        }},
        {"view_cache", {
            {"max_cached_views", 20},
            {"message_page_size", 100},
            {"eviction_fallback", "overflow"}
        }},
        {"store", {
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Positive integers only: a zero bound would disable streaming or caching.
static void read_positive(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) {
        auto v = obj[key].get<uint32_t>();
        if (v > 0) out = v;
    }
}

std::string config_file_path() {
    return expand_home("~/.multichat/config.json");
}

Config Config::load() {
    Config cfg;

    std::string config_path = config_file_path();
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("system_prompt") && j["system_prompt"].is_string())
        cfg.system_prompt = j["system_prompt"].get<std::string>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("streaming") && j["streaming"].is_object()) {
        auto& s = j["streaming"];
        read_positive(s, "max_concurrent_streams", cfg.streaming.max_concurrent_streams);
        read_positive(s, "worker_threads", cfg.streaming.worker_threads);
        read_positive(s, "context_messages", cfg.streaming.context_messages);
        if (s.contains("persist_cancelled") && s["persist_cancelled"].is_boolean())
            cfg.streaming.persist_cancelled = s["persist_cancelled"].get<bool>();
    }

    if (j.contains("view_cache") && j["view_cache"].is_object()) {
        auto& v = j["view_cache"];
        read_positive(v, "max_cached_views", cfg.view_cache.max_cached_views);
        read_positive(v, "message_page_size", cfg.view_cache.message_page_size);
        if (v.contains("eviction_fallback") && v["eviction_fallback"].is_string()) {
            auto name = v["eviction_fallback"].get<std::string>();
            if (!parse_eviction_fallback(name, cfg.view_cache.eviction_fallback)) {
                std::cerr << "[config] Unknown eviction_fallback '" << name
                          << "', using "
                          << eviction_fallback_to_string(cfg.view_cache.eviction_fallback)
                          << "\n";
            }
        }
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& st = j["store"];
        if (st.contains("path") && st["path"].is_string())
            cfg.store.path = st["path"].get<std::string>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        cfg.providers["openrouter"].api_key = v;
    if (const char* v = std::getenv("COMPATIBLE_API_KEY"))
        cfg.providers["compatible"].api_key = v;
    if (const char* v = std::getenv("COMPATIBLE_BASE_URL"))
        cfg.providers["compatible"].base_url = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;
    if (const char* v = std::getenv("MULTICHAT_DB_PATH"))
        cfg.store.path = v;

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    return expand_home("~/.multichat/chats.db");
}

} // namespace multichat
