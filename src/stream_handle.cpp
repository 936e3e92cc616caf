#include "stream_handle.hpp"
#include <algorithm>

namespace multichat {

const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::Created:   return "created";
        case StreamState::Streaming: return "streaming";
        case StreamState::Completed: return "completed";
        case StreamState::Failed:    return "failed";
        case StreamState::Cancelled: return "cancelled";
    }
    return "created";
}

bool is_terminal_state(StreamState state) {
    return state == StreamState::Completed ||
           state == StreamState::Failed ||
           state == StreamState::Cancelled;
}

// ── Observer ────────────────────────────────────────────────────

struct StreamSubscription::Observer {
    // Recursive so a callback may reset its own subscription.
    std::recursive_mutex delivery_mutex;
    StreamContentCallback on_content;
    StreamFinishCallback on_finish;
    size_t delivered = 0;   // chunk count covered by the last delivery
    bool finished = false;
    bool active = true;
};

// ── StreamSubscription ──────────────────────────────────────────

StreamSubscription::StreamSubscription(StreamSubscription&& other) noexcept
    : handle_(std::move(other.handle_)), observer_(std::move(other.observer_)) {
    other.handle_.reset();
}

StreamSubscription& StreamSubscription::operator=(StreamSubscription&& other) noexcept {
    if (this != &other) {
        reset();
        handle_ = std::move(other.handle_);
        observer_ = std::move(other.observer_);
        other.handle_.reset();
    }
    return *this;
}

void StreamSubscription::reset() {
    if (!observer_) return;
    auto observer = std::move(observer_);
    observer_.reset();
    {
        std::lock_guard<std::recursive_mutex> lock(observer->delivery_mutex);
        observer->active = false;
    }
    if (auto handle = handle_.lock()) {
        handle->detach(observer);
    }
    handle_.reset();
}

bool StreamSubscription::active() const {
    if (!observer_) return false;
    std::lock_guard<std::recursive_mutex> lock(observer_->delivery_mutex);
    return observer_->active && !observer_->finished;
}

// ── StreamHandle ────────────────────────────────────────────────

StreamHandle::StreamHandle(std::string session_id, std::string thread_id)
    : session_id_(std::move(session_id)),
      thread_id_(std::move(thread_id)),
      started_at_(std::chrono::steady_clock::now()) {}

bool StreamHandle::append(const std::string& chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal_state(state_)) return false;
        if (state_ == StreamState::Created) state_ = StreamState::Streaming;
        chunks_.push_back(chunk);
        content_ += chunk;
    }
    deliver_all();
    return true;
}

bool StreamHandle::transition_to(StreamState next) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal_state(state_)) return false;
        if (next == StreamState::Streaming && state_ != StreamState::Created) return false;
        state_ = next;
    }
    if (is_terminal_state(next)) deliver_all();
    return true;
}

bool StreamHandle::mark_streaming() {
    return transition_to(StreamState::Streaming);
}

bool StreamHandle::mark_completed() {
    return transition_to(StreamState::Completed);
}

bool StreamHandle::mark_failed() {
    return transition_to(StreamState::Failed);
}

bool StreamHandle::mark_cancelled() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finishing_ || is_terminal_state(state_)) return false;
        state_ = StreamState::Cancelled;
    }
    cancel_.cancel();
    deliver_all();
    return true;
}

bool StreamHandle::begin_finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal_state(state_)) return false;
    finishing_ = true;
    return true;
}

StreamState StreamHandle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool StreamHandle::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_terminal_state(state_);
}

std::string StreamHandle::content() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_;
}

std::vector<std::string> StreamHandle::chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

size_t StreamHandle::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

void StreamHandle::set_saved_message(StoredMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    saved_message_ = std::move(message);
}

std::optional<StoredMessage> StreamHandle::saved_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved_message_;
}

uint64_t StreamHandle::elapsed_ms() const {
    auto elapsed = std::chrono::steady_clock::now() - started_at_;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

StreamSubscription StreamHandle::subscribe(StreamContentCallback on_content,
                                           StreamFinishCallback on_finish) {
    auto observer = std::make_shared<Observer>();
    observer->on_content = std::move(on_content);
    observer->on_finish = std::move(on_finish);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers_.push_back(observer);
    }
    StreamSubscription subscription(weak_from_this(), observer);
    // Replay. A concurrent append may already have delivered past this
    // point; deliver() skips anything not newer than what was sent.
    deliver(observer);
    return subscription;
}

size_t StreamHandle::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

void StreamHandle::deliver(const std::shared_ptr<Observer>& observer) {
    std::lock_guard<std::recursive_mutex> delivery(observer->delivery_mutex);
    if (!observer->active || observer->finished) return;

    size_t count;
    std::string content;
    StreamState state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = chunks_.size();
        state = state_;
        if (count > observer->delivered) content = content_;
    }

    if (count > observer->delivered) {
        observer->delivered = count;
        if (observer->on_content) observer->on_content(content);
    }

    if (is_terminal_state(state) && observer->active && !observer->finished) {
        observer->finished = true;
        if (observer->on_finish) observer->on_finish(state);
    }
}

void StreamHandle::deliver_all() {
    std::vector<std::shared_ptr<Observer>> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_call = observers_;
    }
    for (const auto& observer : to_call) {
        deliver(observer);
    }
}

void StreamHandle::detach(const std::shared_ptr<Observer>& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                     observers_.end());
}

} // namespace multichat
