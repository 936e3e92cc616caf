#pragma once
#include "cancel_token.hpp"
#include "chat_store.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace multichat {

enum class StreamState { Created, Streaming, Completed, Failed, Cancelled };

const char* stream_state_to_string(StreamState state);
bool is_terminal_state(StreamState state);

// Receives the joined content each time it grows. The first call after
// subscribing is the replay of everything buffered so far.
using StreamContentCallback = std::function<void(const std::string& content)>;

// Receives the terminal state, exactly once.
using StreamFinishCallback = std::function<void(StreamState state)>;

class StreamHandle;

// Move-only token for one observer attached to a StreamHandle.
// Destroying or resetting it detaches the observer exactly once; after
// reset() returns no further callback starts for it. Safe to reset from
// inside one of its own callbacks.
class StreamSubscription {
public:
    StreamSubscription() = default;
    ~StreamSubscription() { reset(); }

    StreamSubscription(const StreamSubscription&) = delete;
    StreamSubscription& operator=(const StreamSubscription&) = delete;

    StreamSubscription(StreamSubscription&& other) noexcept;
    StreamSubscription& operator=(StreamSubscription&& other) noexcept;

    void reset();
    bool active() const;

private:
    friend class StreamHandle;
    struct Observer;

    StreamSubscription(std::weak_ptr<StreamHandle> handle, std::shared_ptr<Observer> observer)
        : handle_(std::move(handle)), observer_(std::move(observer)) {}

    std::weak_ptr<StreamHandle> handle_;
    std::shared_ptr<Observer> observer_;
};

// Live state of one request/response exchange for a session.
//
// The production task is the only writer of chunks and state; all writes
// go through the handle's mutex. Observers are called with no handle lock
// held, one delivery at a time per observer, each carrying a strictly
// longer prefix than the one before.
class StreamHandle : public std::enable_shared_from_this<StreamHandle> {
public:
    StreamHandle(std::string session_id, std::string thread_id);

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    const std::string& session_id() const { return session_id_; }
    const std::string& thread_id() const { return thread_id_; }

    CancelToken& cancel_token() { return cancel_; }
    const CancelToken& cancel_token() const { return cancel_; }

    // Append one chunk. Returns false (and drops the chunk) once terminal.
    bool append(const std::string& chunk);

    // State transitions. Each returns true only if it changed the state.
    bool mark_streaming();
    bool mark_completed();
    bool mark_failed();
    bool mark_cancelled();   // also cancels the token

    // Reserve the terminal transition for the producer while it persists
    // the reply. Afterwards mark_cancelled() is refused, so the outcome the
    // producer stores is the one observers see. False if already terminal.
    bool begin_finish();

    StreamState state() const;
    bool is_terminal() const;

    std::string content() const;
    std::vector<std::string> chunks() const;
    size_t chunk_count() const;

    // The persisted assistant message, set by the orchestrator before it
    // marks the handle terminal.
    void set_saved_message(StoredMessage message);
    std::optional<StoredMessage> saved_message() const;

    uint64_t elapsed_ms() const;

    // Registry removal guard: true for the first caller only.
    bool release() { return !released_.exchange(true); }
    bool released() const { return released_.load(); }

    // Attach an observer. Buffered content is replayed before this returns.
    StreamSubscription subscribe(StreamContentCallback on_content,
                                 StreamFinishCallback on_finish = {});

    size_t observer_count() const;

private:
    friend class StreamSubscription;
    using Observer = StreamSubscription::Observer;

    bool transition_to(StreamState next);
    void deliver(const std::shared_ptr<Observer>& observer);
    void deliver_all();
    void detach(const std::shared_ptr<Observer>& observer);

    const std::string session_id_;
    const std::string thread_id_;
    const std::chrono::steady_clock::time_point started_at_;
    CancelToken cancel_;
    std::atomic<bool> released_{false};

    mutable std::mutex mutex_;
    std::vector<std::string> chunks_;
    std::string content_;
    StreamState state_ = StreamState::Created;
    bool finishing_ = false;
    std::optional<StoredMessage> saved_message_;
    std::vector<std::shared_ptr<Observer>> observers_;
};

} // namespace multichat
