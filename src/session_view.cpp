#include "session_view.hpp"
#include "stream_orchestrator.hpp"
#include "util.hpp"
#include <iostream>

namespace multichat {

static constexpr const char* kInterruptedMessage = "Response was interrupted. Please retry.";
static constexpr uint32_t kSearchLimit = 100;

ViewMessage view_message_from(const StoredMessage& stored) {
    ViewMessage msg;
    msg.id = stored.id;
    msg.seq = stored.seq;
    msg.role = stored.role;
    msg.content = stored.content;
    msg.failed = stored.failed;
    msg.outdated = stored.outdated;
    msg.created_at = stored.created_at;
    return msg;
}

static std::vector<ViewMessage> view_messages_from(const std::vector<StoredMessage>& stored) {
    std::vector<ViewMessage> out;
    out.reserve(stored.size());
    for (const auto& msg : stored) {
        out.push_back(view_message_from(msg));
    }
    return out;
}

SessionView::SessionView(StreamOrchestrator& orchestrator, ChatStore& store,
                         uint32_t page_size)
    : orchestrator_(orchestrator), store_(store), page_size_(page_size == 0 ? 1 : page_size) {}

SessionView::~SessionView() {
    detach_all();
}

void SessionView::notify_changed() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_change_;
    }
    if (callback) callback();
}

void SessionView::set_on_change(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_change_ = std::move(callback);
}

void SessionView::detach_all() {
    std::unordered_map<std::string, StreamSubscription> detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        detached.swap(subscriptions_);
        ++generation_;
    }
    // Destroyed here, outside the view lock
    detached.clear();
}

// ── Session switching ───────────────────────────────────────────

void SessionView::resume(const std::string& session_id) {
    detach_all();

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id_ = session_id;
        generation = ++generation_;
        messages_.clear();
        oldest_seq_ = 0;
        has_more_ = false;
        is_loading_ = true;
        is_loading_previous_ = false;
        is_thinking_ = false;
        error_message_.reset();
        search_mode_ = false;
        search_query_.clear();
        search_results_.clear();
        current_search_index_ = 0;
    }

    MessagePage page;
    try {
        page = store_.recent_messages(session_id, page_size_);
    } catch (const std::exception& e) {
        std::cerr << "[view] Failed to load session " << session_id << ": " << e.what() << "\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (session_id_ != session_id || generation_ != generation) return;
            error_message_ = "Failed to load session. Please try again.";
            is_loading_ = false;
        }
        notify_changed();
        return;
    }

    bool streaming = orchestrator_.has_active_stream(session_id);

    // A user message with no reply and nothing running means the process
    // stopped mid-response.
    std::optional<StoredMessage> interrupted;
    if (!page.has_more && !page.messages.empty() && !streaming) {
        const StoredMessage* last = nullptr;
        for (auto it = page.messages.rbegin(); it != page.messages.rend(); ++it) {
            if (!it->outdated) {
                last = &*it;
                break;
            }
        }
        if (last && last->role == Role::User) {
            try {
                interrupted = store_.save_assistant_response(session_id, kInterruptedMessage, true);
            } catch (const std::exception& e) {
                std::cerr << "[view] Failed to record interrupted reply for session "
                          << session_id << ": " << e.what() << "\n";
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || generation_ != generation) return;
        messages_ = view_messages_from(page.messages);
        if (interrupted) messages_.push_back(view_message_from(*interrupted));
        oldest_seq_ = page.messages.empty() ? 0 : page.messages.front().seq;
        has_more_ = page.has_more;
        is_loading_ = streaming;
    }

    if (streaming) {
        subscribe_to_stream(session_id);
    }
    notify_changed();
}

// ── Streaming ───────────────────────────────────────────────────

bool SessionView::subscribe_to_stream(const std::string& session_id) {
    StreamSubscription previous;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(session_id);
        if (it != subscriptions_.end()) {
            previous = std::move(it->second);
            subscriptions_.erase(it);
        }
        generation = ++generation_;
    }
    previous.reset();

    auto handle = orchestrator_.get_active_thread(session_id);
    if (!handle) {
        // The stream may have ended between the send and this lookup
        reload_latest(session_id, generation);
        return false;
    }

    bool has_chunks = handle->chunk_count() > 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || generation_ != generation) return false;
        is_loading_ = true;
        is_thinking_ = !has_chunks;
    }

    std::weak_ptr<StreamHandle> weak = handle;
    StreamSubscription subscription = handle->subscribe(
        [this, session_id, generation](const std::string& content) {
            on_stream_content(session_id, generation, content);
        },
        [this, session_id, generation, weak](StreamState state) {
            on_stream_finish(session_id, generation, state, weak.lock());
        });

    // The finish may land between subscribe() returning and this lock
    bool still_running = subscription.active();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (still_running && session_id_ == session_id && generation_ == generation &&
            finished_generation_ != generation) {
            subscriptions_[session_id] = std::move(subscription);
        }
    }
    notify_changed();
    return true;
}

void SessionView::replace_streaming_entry(ViewMessage message) {
    // Must be called with mutex_ held.
    if (!messages_.empty()) {
        auto& last = messages_.back();
        if (last.role == Role::Assistant && !last.finalized()) {
            last = std::move(message);
            return;
        }
    }
    messages_.push_back(std::move(message));
}

void SessionView::on_stream_content(const std::string& session_id, uint64_t generation,
                                    const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || generation_ != generation) return;
        is_thinking_ = false;
        ViewMessage partial;
        partial.role = Role::Assistant;
        partial.content = content;
        replace_streaming_entry(std::move(partial));
    }
    notify_changed();
}

void SessionView::on_stream_finish(const std::string& session_id, uint64_t generation,
                                   StreamState state,
                                   const std::shared_ptr<StreamHandle>& handle) {
    std::optional<StoredMessage> saved;
    if (handle) saved = handle->saved_message();

    StreamSubscription finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || generation_ != generation) return;

        if (saved) {
            replace_streaming_entry(view_message_from(*saved));
        } else if (state == StreamState::Failed && !messages_.empty() &&
                   messages_.back().role == Role::Assistant && !messages_.back().finalized()) {
            messages_.back().failed = true;
        }
        is_loading_ = false;
        is_thinking_ = false;
        finished_generation_ = generation;

        auto it = subscriptions_.find(session_id);
        if (it != subscriptions_.end()) {
            finished = std::move(it->second);
            subscriptions_.erase(it);
        }
    }
    notify_changed();
}

void SessionView::reload_latest(const std::string& session_id, uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || generation_ != generation || !is_loading_) return;
    }

    MessagePage page;
    try {
        page = store_.recent_messages(session_id, page_size_);
    } catch (const std::exception& e) {
        std::cerr << "[view] Failed to reload session " << session_id << ": " << e.what() << "\n";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || generation_ != generation) return;
        if (!page.messages.empty()) {
            messages_ = view_messages_from(page.messages);
            oldest_seq_ = page.messages.front().seq;
            has_more_ = page.has_more;
        }
        is_loading_ = false;
        is_thinking_ = false;
    }
    notify_changed();
}

bool SessionView::send_message(const std::string& text) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_loading_ || session_id_.empty()) return false;
        session_id = session_id_;
    }
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;

    auto result = orchestrator_.send_message(session_id, trimmed);
    if (!result.ok()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (session_id_ == session_id) {
                error_message_ = send_error_message(result.error);
            }
        }
        notify_changed();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id) return true;
        ViewMessage user;
        user.id = result.user_message_id;
        user.role = Role::User;
        user.content = trimmed;
        user.created_at = epoch_millis();
        messages_.push_back(std::move(user));
        error_message_.reset();
        is_loading_ = true;
        is_thinking_ = true;
    }
    subscribe_to_stream(session_id);
    return true;
}

void SessionView::cancel_response() {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id = session_id_;
    }
    detach_all();
    if (!session_id.empty()) {
        orchestrator_.stop_stream(session_id);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_loading_ = false;
        is_thinking_ = false;
    }
    notify_changed();
}

// ── Pagination ──────────────────────────────────────────────────

bool SessionView::load_previous_messages() {
    std::string session_id;
    int64_t before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_loading_previous_ || !has_more_ || session_id_.empty()) return false;
        is_loading_previous_ = true;
        session_id = session_id_;
        before = oldest_seq_;
    }

    MessagePage page;
    try {
        page = store_.messages_before(session_id, before, page_size_);
    } catch (const std::exception& e) {
        std::cerr << "[view] Failed to load previous messages: " << e.what() << "\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            is_loading_previous_ = false;
            if (session_id_ == session_id) {
                error_message_ = "Failed to load previous messages. Please try again.";
            }
        }
        notify_changed();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_loading_previous_ = false;
        if (session_id_ != session_id || oldest_seq_ != before) return false;
        auto older = view_messages_from(page.messages);
        messages_.insert(messages_.begin(), older.begin(), older.end());
        if (!page.messages.empty()) oldest_seq_ = page.messages.front().seq;
        has_more_ = page.has_more;
    }
    notify_changed();
    return true;
}

// ── Search ──────────────────────────────────────────────────────

void SessionView::search_messages(const std::string& query) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_.empty()) return;
        session_id = session_id_;
        search_query_ = query;
        if (trim(query).empty()) {
            search_results_.clear();
            current_search_index_ = 0;
            return;
        }
        search_mode_ = true;
    }

    std::vector<StoredMessage> results;
    std::optional<std::string> error;
    try {
        results = store_.search_messages(session_id, query, kSearchLimit);
    } catch (const std::exception& e) {
        std::cerr << "[view] Search failed: " << e.what() << "\n";
        error = "Search failed. Please try again.";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session_id || search_query_ != query) return;
        search_results_ = std::move(results);
        current_search_index_ = 0;
        if (error) error_message_ = error;
    }
    notify_changed();
}

void SessionView::next_search_result() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (search_results_.empty()) return;
        current_search_index_ = (current_search_index_ + 1) % search_results_.size();
    }
    notify_changed();
}

void SessionView::previous_search_result() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (search_results_.empty()) return;
        current_search_index_ = current_search_index_ == 0
            ? search_results_.size() - 1
            : current_search_index_ - 1;
    }
    notify_changed();
}

void SessionView::clear_search() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        search_mode_ = false;
        search_query_.clear();
        search_results_.clear();
        current_search_index_ = 0;
    }
    notify_changed();
}

// ── State ───────────────────────────────────────────────────────

SessionViewSnapshot SessionView::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionViewSnapshot snap;
    snap.session_id = session_id_;
    snap.messages = messages_;
    snap.has_more = has_more_;
    snap.is_loading = is_loading_;
    snap.is_thinking = is_thinking_;
    snap.error_message = error_message_;
    snap.search_mode = search_mode_;
    snap.search_query = search_query_;
    snap.search_results = search_results_;
    snap.current_search_index = current_search_index_;
    snap.subscription_count = subscriptions_.size();
    return snap;
}

std::string SessionView::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

bool SessionView::is_loading() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_loading_;
}

void SessionView::cleanup() {
    detach_all();
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_.clear();
    messages_.clear();
    oldest_seq_ = 0;
    has_more_ = false;
    is_loading_ = false;
    is_loading_previous_ = false;
    is_thinking_ = false;
    error_message_.reset();
    search_mode_ = false;
    search_query_.clear();
    search_results_.clear();
    current_search_index_ = 0;
    on_change_ = nullptr;
}

} // namespace multichat
