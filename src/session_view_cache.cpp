#include "session_view_cache.hpp"
#include "event_bus.hpp"
#include "stream_orchestrator.hpp"
#include <iostream>
#include <utility>
#include <vector>

namespace multichat {

SessionViewCache::SessionViewCache(StreamOrchestrator& orchestrator, ChatStore& store,
                                   EventBus& bus, const ViewCacheConfig& config)
    : orchestrator_(orchestrator), store_(store), bus_(bus), config_(config) {
    if (config_.max_cached_views == 0) config_.max_cached_views = 1;
}

SessionViewCache::~SessionViewCache() {
    shutdown();
}

bool SessionViewCache::is_pinned(const std::string& session_id) const {
    return (active_session_ && *active_session_ == session_id) ||
           orchestrator_.has_active_stream(session_id);
}

int SessionViewCache::pick_victim() const {
    // Safe set first, in insertion order
    for (size_t i = 0; i < entries_.size(); i++) {
        if (!is_pinned(entries_[i].session_id)) return static_cast<int>(i);
    }
    if (config_.eviction_fallback == EvictionFallback::EvictOldest) {
        for (size_t i = 0; i < entries_.size(); i++) {
            if (!active_session_ || *active_session_ != entries_[i].session_id) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

std::shared_ptr<SessionView> SessionViewCache::get_or_create(const std::string& session_id) {
    std::shared_ptr<SessionView> view;
    std::vector<std::pair<Entry, bool>> evicted; // entry, was streaming
    size_t cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.session_id == session_id) return entry.view;
        }

        // Trims back to capacity after an earlier overflow
        while (entries_.size() >= config_.max_cached_views) {
            int victim = pick_victim();
            if (victim < 0) {
                std::cerr << "[view-cache] No evictable view, growing past capacity ("
                          << entries_.size() + 1 << "/" << config_.max_cached_views << ")\n";
                break;
            }
            Entry entry = std::move(entries_[static_cast<size_t>(victim)]);
            entries_.erase(entries_.begin() + victim);
            bool streaming = orchestrator_.has_active_stream(entry.session_id);
            evicted.emplace_back(std::move(entry), streaming);
        }

        view = std::make_shared<SessionView>(orchestrator_, store_,
                                             config_.message_page_size);
        entries_.push_back(Entry{session_id, view});
        cached = entries_.size();
    }

    for (auto& item : evicted) {
        const Entry& entry = item.first;
        entry.view->cleanup();
        std::cerr << "[view-cache] Evicted " << entry.session_id
                  << (item.second ? " (stream continues without a view)" : "")
                  << " (cached: " << cached << ")\n";

        SessionEvictedEvent ev;
        ev.session_id = entry.session_id;
        ev.was_streaming = item.second;
        bus_.publish(ev);
    }
    return view;
}

std::shared_ptr<SessionView> SessionViewCache::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.session_id == session_id) return entry.view;
    }
    return nullptr;
}

std::shared_ptr<SessionView> SessionViewCache::switch_to_session(const std::string& session_id) {
    set_active_session(session_id);
    auto view = get_or_create(session_id);
    view->resume(session_id);
    return view;
}

std::shared_ptr<SessionView> SessionViewCache::create_new_session(const std::string& session_id) {
    set_active_session(session_id);
    auto view = get_or_create(session_id);
    view->resume(session_id);
    return view;
}

void SessionViewCache::set_active_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_session_ = session_id;
}

void SessionViewCache::clear_active_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_session_.reset();
}

std::optional<std::string> SessionViewCache::active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_session_;
}

bool SessionViewCache::close_session(const std::string& session_id) {
    if (orchestrator_.has_active_stream(session_id)) {
        orchestrator_.stop_stream(session_id);
    }

    std::shared_ptr<SessionView> view;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->session_id == session_id) {
                view = std::move(it->view);
                entries_.erase(it);
                break;
            }
        }
        if (active_session_ && *active_session_ == session_id) {
            active_session_.reset();
        }
    }

    if (view) view->cleanup();
    std::cerr << "[view-cache] Closed session " << session_id << "\n";

    SessionClosedEvent ev;
    ev.session_id = session_id;
    bus_.publish(ev);
    return view != nullptr;
}

void SessionViewCache::shutdown() {
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        entries.swap(entries_);
        active_session_.reset();
    }

    std::cerr << "[view-cache] Shutting down (" << entries.size() << " cached views)\n";
    orchestrator_.shutdown();
    for (auto& entry : entries) {
        entry.view->cleanup();
    }
}

CacheStats SessionViewCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.total_cached = entries_.size();
    stats.max_capacity = config_.max_cached_views;
    for (const auto& entry : entries_) {
        if (is_pinned(entry.session_id)) {
            stats.active_count++;
        } else {
            stats.inactive_count++;
        }
    }
    return stats;
}

std::vector<std::string> SessionViewCache::cached_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.session_id);
    }
    return ids;
}

size_t SessionViewCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace multichat
