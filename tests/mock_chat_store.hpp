#pragma once
#include "chat_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace multichat {

// In-process ChatStore. Set fail_writes to make every write throw.
class MemoryChatStore : public ChatStore {
public:
    std::atomic<bool> fail_writes{false};

    bool ensure_session(const std::string& session_id, const std::string& title) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_writable();
        for (const auto& s : sessions_) {
            if (s.id == session_id) return false;
        }
        sessions_.push_back(SessionInfo{session_id, title, epoch_millis(), 0});
        return true;
    }

    bool session_exists(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : sessions_) {
            if (s.id == session_id) return true;
        }
        return false;
    }

    StoredMessage record_user_message(const std::string& session_id,
                                      const std::string& content) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return insert(session_id, Role::User, content, false);
    }

    StoredMessage save_assistant_response(const std::string& session_id,
                                          const std::string& content,
                                          bool failed) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return insert(session_id, Role::Assistant, content, failed);
    }

    MessagePage recent_messages(const std::string& session_id, uint32_t limit) override {
        return messages_before(session_id, INT64_MAX, limit);
    }

    MessagePage messages_before(const std::string& session_id, int64_t before_seq,
                                uint32_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoredMessage> older;
        for (const auto& m : messages_) {
            if (m.session_id == session_id && m.seq < before_seq) older.push_back(m);
        }
        MessagePage page;
        if (older.size() > limit) {
            page.has_more = true;
            older.erase(older.begin(), older.end() - limit);
        }
        page.messages = std::move(older);
        return page;
    }

    std::vector<StoredMessage> search_messages(const std::string& session_id,
                                               const std::string& query,
                                               uint32_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoredMessage> results;
        std::string needle = lower(query);
        for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
            if (results.size() >= limit) break;
            if (it->session_id == session_id &&
                lower(it->content).find(needle) != std::string::npos) {
                results.push_back(*it);
            }
        }
        return results;
    }

    std::vector<SessionInfo> list_sessions(uint32_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionInfo> out(sessions_.rbegin(), sessions_.rend());
        for (auto& s : out) {
            s.message_count = static_cast<uint32_t>(std::count_if(
                messages_.begin(), messages_.end(),
                [&](const StoredMessage& m) { return m.session_id == s.id; }));
        }
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    bool delete_session(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.erase(std::remove_if(messages_.begin(), messages_.end(),
                            [&](const StoredMessage& m) { return m.session_id == session_id; }),
                        messages_.end());
        auto before = sessions_.size();
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                            [&](const SessionInfo& s) { return s.id == session_id; }),
                        sessions_.end());
        return sessions_.size() != before;
    }

    // Test helpers

    std::vector<StoredMessage> all_messages(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoredMessage> out;
        for (const auto& m : messages_) {
            if (m.session_id == session_id) out.push_back(m);
        }
        return out;
    }

    std::vector<StoredMessage> assistant_messages(const std::string& session_id) const {
        std::vector<StoredMessage> out;
        for (auto& m : all_messages(session_id)) {
            if (m.role == Role::Assistant) out.push_back(m);
        }
        return out;
    }

private:
    void check_writable() const {
        if (fail_writes.load()) throw std::runtime_error("disk full");
    }

    StoredMessage insert(const std::string& session_id, Role role,
                         const std::string& content, bool failed) {
        check_writable();
        StoredMessage m;
        m.seq = ++next_seq_;
        m.id = generate_id();
        m.session_id = session_id;
        m.role = role;
        m.content = content;
        m.failed = failed;
        m.created_at = epoch_millis();
        messages_.push_back(m);
        return m;
    }

    static std::string lower(const std::string& s) {
        std::string out = s;
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    mutable std::mutex mutex_;
    std::vector<SessionInfo> sessions_;
    std::vector<StoredMessage> messages_;
    int64_t next_seq_ = 0;
};

} // namespace multichat
