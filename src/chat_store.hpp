#pragma once
#include "provider.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace multichat {

struct StoredMessage {
    int64_t seq = 0;          // store-assigned, increases with insertion order
    std::string id;
    std::string session_id;
    Role role = Role::User;
    std::string content;
    bool failed = false;      // assistant reply that ended in an error
    bool outdated = false;    // superseded by an edit or retry
    uint64_t created_at = 0;  // epoch milliseconds
};

// A window of a session's history, oldest first.
struct MessagePage {
    std::vector<StoredMessage> messages;
    bool has_more = false;    // older messages exist before messages.front()
};

struct SessionInfo {
    std::string id;
    std::string title;
    uint64_t updated_at = 0;
    uint32_t message_count = 0;
};

// Durable chat history. All calls may block on I/O; implementations are
// thread-safe and throw std::runtime_error when a write cannot be made durable.
class ChatStore {
public:
    virtual ~ChatStore() = default;

    // Create the session row if it is missing. Returns true if it was created.
    virtual bool ensure_session(const std::string& session_id, const std::string& title) = 0;

    virtual bool session_exists(const std::string& session_id) = 0;

    virtual StoredMessage record_user_message(const std::string& session_id,
                                              const std::string& content) = 0;

    virtual StoredMessage save_assistant_response(const std::string& session_id,
                                                  const std::string& content,
                                                  bool failed) = 0;

    // Most recent `limit` messages.
    virtual MessagePage recent_messages(const std::string& session_id, uint32_t limit) = 0;

    // Up to `limit` messages strictly older than before_seq.
    virtual MessagePage messages_before(const std::string& session_id,
                                        int64_t before_seq,
                                        uint32_t limit) = 0;

    // Case-insensitive substring search, newest first.
    virtual std::vector<StoredMessage> search_messages(const std::string& session_id,
                                                       const std::string& query,
                                                       uint32_t limit) = 0;

    // Sessions ordered by most recent activity.
    virtual std::vector<SessionInfo> list_sessions(uint32_t limit) = 0;

    // Remove a session and its messages. Returns false if it did not exist.
    virtual bool delete_session(const std::string& session_id) = 0;
};

} // namespace multichat
