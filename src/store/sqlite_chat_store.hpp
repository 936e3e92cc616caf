#pragma once
#include "../chat_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace multichat {

class SqliteChatStore : public ChatStore {
public:
    // path may be ":memory:" for a private in-process database.
    explicit SqliteChatStore(const std::string& path);
    ~SqliteChatStore() override;

    // Non-copyable
    SqliteChatStore(const SqliteChatStore&) = delete;
    SqliteChatStore& operator=(const SqliteChatStore&) = delete;

    bool ensure_session(const std::string& session_id, const std::string& title) override;
    bool session_exists(const std::string& session_id) override;

    StoredMessage record_user_message(const std::string& session_id,
                                      const std::string& content) override;
    StoredMessage save_assistant_response(const std::string& session_id,
                                          const std::string& content,
                                          bool failed) override;

    MessagePage recent_messages(const std::string& session_id, uint32_t limit) override;
    MessagePage messages_before(const std::string& session_id,
                                int64_t before_seq,
                                uint32_t limit) override;

    std::vector<StoredMessage> search_messages(const std::string& session_id,
                                               const std::string& query,
                                               uint32_t limit) override;

    std::vector<SessionInfo> list_sessions(uint32_t limit) override;

    bool delete_session(const std::string& session_id) override;

private:
    void init_schema();
    void exec_or_throw(const char* sql);
    StoredMessage insert_message(const std::string& session_id, Role role,
                                 const std::string& content, bool failed);
    MessagePage query_page(const std::string& session_id, int64_t before_seq,
                           uint32_t limit);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace multichat
