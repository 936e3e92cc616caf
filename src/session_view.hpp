#pragma once
#include "chat_store.hpp"
#include "stream_handle.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace multichat {

class StreamOrchestrator; // forward declaration

// One transcript entry as the UI shows it. An assistant entry with an
// empty id is a reply still being streamed.
struct ViewMessage {
    std::string id;
    int64_t seq = 0;
    Role role = Role::User;
    std::string content;
    bool failed = false;
    bool outdated = false;
    uint64_t created_at = 0;

    bool finalized() const { return !id.empty(); }
};

ViewMessage view_message_from(const StoredMessage& stored);

struct SessionViewSnapshot {
    std::string session_id;
    std::vector<ViewMessage> messages;
    bool has_more = false;
    bool is_loading = false;
    bool is_thinking = false;
    std::optional<std::string> error_message;

    bool search_mode = false;
    std::string search_query;
    std::vector<StoredMessage> search_results;
    size_t current_search_index = 0;

    size_t subscription_count = 0;
};

// UI-facing state for one session: transcript page, search, and the
// subscription to the session's running stream.
//
// Stream callbacks arrive on worker threads. The view never calls into a
// StreamHandle or destroys a subscription while holding its own mutex.
class SessionView {
public:
    SessionView(StreamOrchestrator& orchestrator, ChatStore& store,
                uint32_t page_size = 100);
    ~SessionView();

    SessionView(const SessionView&) = delete;
    SessionView& operator=(const SessionView&) = delete;

    // Switch to session_id: drop old subscriptions, load the newest page,
    // flag an interrupted reply, and attach to a running stream.
    void resume(const std::string& session_id);

    // Send through the orchestrator. Returns false if ignored or rejected;
    // rejections set error_message.
    bool send_message(const std::string& text);

    // Detach and stop the running stream. The partial reply stays visible.
    void cancel_response();

    // Prepend the previous page. Returns false when there is nothing older.
    bool load_previous_messages();

    void search_messages(const std::string& query);
    void next_search_result();
    void previous_search_result();
    void clear_search();

    // Attach to the session's active stream, replacing any earlier
    // subscription for it. Returns false when no stream is running.
    bool subscribe_to_stream(const std::string& session_id);

    SessionViewSnapshot snapshot() const;
    std::string session_id() const;
    bool is_loading() const;

    // Called after every state change, without the view's lock held.
    void set_on_change(std::function<void()> callback);

    // Detach everything and drop all buffered state.
    void cleanup();

private:
    void detach_all();
    void notify_changed();
    void reload_latest(const std::string& session_id, uint64_t generation);
    void replace_streaming_entry(ViewMessage message);
    void on_stream_content(const std::string& session_id, uint64_t generation,
                           const std::string& content);
    void on_stream_finish(const std::string& session_id, uint64_t generation,
                          StreamState state, const std::shared_ptr<StreamHandle>& handle);

    StreamOrchestrator& orchestrator_;
    ChatStore& store_;
    const uint32_t page_size_;

    mutable std::mutex mutex_;
    std::string session_id_;
    uint64_t generation_ = 0;
    uint64_t finished_generation_ = 0; // generation whose stream already finished
    std::vector<ViewMessage> messages_;
    int64_t oldest_seq_ = 0;
    bool has_more_ = false;
    bool is_loading_ = false;
    bool is_loading_previous_ = false;
    bool is_thinking_ = false;
    std::optional<std::string> error_message_;

    bool search_mode_ = false;
    std::string search_query_;
    std::vector<StoredMessage> search_results_;
    size_t current_search_index_ = 0;

    std::unordered_map<std::string, StreamSubscription> subscriptions_;
    std::function<void()> on_change_;
};

} // namespace multichat
