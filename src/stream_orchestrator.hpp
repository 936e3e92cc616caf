#pragma once
#include "chat_store.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "stream_handle.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace multichat {

class EventBus; // forward declaration

enum class SendError {
    None,
    EmptyMessage,
    SessionBusy,        // a stream is already running for the session
    CapacityExceeded,   // max_concurrent_streams reached
    PersistenceFailure, // the user message could not be stored
    ShuttingDown
};

// User-facing text for a send failure.
const char* send_error_message(SendError error);

struct SendResult {
    std::optional<std::string> thread_id;
    std::string user_message_id; // id of the stored user message on success
    SendError error = SendError::None;

    bool ok() const { return thread_id.has_value(); }
};

// Owns the session -> StreamHandle registry and runs one production task
// per send on a worker pool. At most one handle per session and at most
// max_concurrent_streams handles overall are registered at any time.
class StreamOrchestrator {
public:
    StreamOrchestrator(Provider& provider, ChatStore& store, EventBus& bus,
                       const Config& config);
    ~StreamOrchestrator();

    StreamOrchestrator(const StreamOrchestrator&) = delete;
    StreamOrchestrator& operator=(const StreamOrchestrator&) = delete;

    // Record the user message, register a handle and start streaming the reply.
    SendResult send_message(const std::string& session_id, const std::string& message);

    // Current handle for the session, or null.
    std::shared_ptr<StreamHandle> get_active_thread(const std::string& session_id) const;

    bool has_active_stream(const std::string& session_id) const;
    size_t active_count() const;
    std::vector<std::string> active_sessions() const;

    // Cancel the session's stream and drop it from the registry without
    // waiting for the task. Returns false if nothing was running.
    bool stop_stream(const std::string& session_id);

    // Cancel everything and wait for the pool to drain. Idempotent.
    void shutdown();

    // Block until no production task is queued or running.
    void wait_idle();

    uint32_t max_concurrent_streams() const { return streaming_.max_concurrent_streams; }

private:
    std::string next_thread_id(const std::string& session_id);
    std::vector<ChatMessage> build_context(const std::string& session_id);

    void run_stream(const std::shared_ptr<StreamHandle>& handle,
                    const std::vector<ChatMessage>& context);
    void finish_completed(const std::shared_ptr<StreamHandle>& handle);
    void finish_failed(const std::shared_ptr<StreamHandle>& handle, const std::string& error);
    void finish_cancelled(const std::shared_ptr<StreamHandle>& handle);

    std::optional<StoredMessage> persist_response(const std::shared_ptr<StreamHandle>& handle,
                                                  const std::string& content, bool failed);

    // Remove the handle from the registry. Runs at most once per handle.
    void release_handle(const std::shared_ptr<StreamHandle>& handle);

    Provider& provider_;
    ChatStore& store_;
    EventBus& bus_;
    std::string model_;
    double temperature_;
    std::string system_prompt_;
    StreamingConfig streaming_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<StreamHandle>> active_;
    bool shutting_down_ = false;
    std::atomic<uint64_t> thread_counter_{0};

    WorkerPool pool_; // last: joined before the members its tasks use
};

} // namespace multichat
