#pragma once
#include "config.hpp"
#include "session_view.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace multichat {

class ChatStore;
class EventBus;
class StreamOrchestrator;

struct CacheStats {
    size_t total_cached = 0;
    size_t active_count = 0;    // the active session or backing a running stream
    size_t inactive_count = 0;  // safe to evict
    size_t max_capacity = 0;
};

// Bounded cache of SessionViews keyed by session id, in insertion order.
// Entries for the active session or for a session with a running stream
// are never picked while a safe entry exists; what happens when none is
// safe is set by ViewCacheConfig::eviction_fallback.
class SessionViewCache {
public:
    SessionViewCache(StreamOrchestrator& orchestrator, ChatStore& store, EventBus& bus,
                     const ViewCacheConfig& config);
    ~SessionViewCache();

    SessionViewCache(const SessionViewCache&) = delete;
    SessionViewCache& operator=(const SessionViewCache&) = delete;

    std::shared_ptr<SessionView> get_or_create(const std::string& session_id);

    // Cached view or null. Does not create or reorder.
    std::shared_ptr<SessionView> find(const std::string& session_id) const;

    // Make session_id active and resume its view from the store.
    std::shared_ptr<SessionView> switch_to_session(const std::string& session_id);

    // Make a brand-new session active.
    std::shared_ptr<SessionView> create_new_session(const std::string& session_id);

    void set_active_session(const std::string& session_id);
    void clear_active_session();
    std::optional<std::string> active_session() const;

    // Stop the session's stream and drop its view. Returns true if a view
    // was cached.
    bool close_session(const std::string& session_id);

    // Stop every stream and clean up every view. Safe to call twice.
    void shutdown();

    CacheStats stats() const;
    std::vector<std::string> cached_sessions() const;
    size_t size() const;

private:
    struct Entry {
        std::string session_id;
        std::shared_ptr<SessionView> view;
    };

    // Index of the entry to evict, or -1. Must be called with mutex_ held.
    int pick_victim() const;
    bool is_pinned(const std::string& session_id) const;

    StreamOrchestrator& orchestrator_;
    ChatStore& store_;
    EventBus& bus_;
    ViewCacheConfig config_;

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::optional<std::string> active_session_;
    bool shut_down_ = false;
};

} // namespace multichat
