#include "stream_orchestrator.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <iostream>

namespace multichat {

static constexpr size_t kTitleMaxLength = 50;
static constexpr const char* kFailureMarker = "Response failed: ";
static constexpr const char* kCancelledMarker = "Response cancelled.";

const char* send_error_message(SendError error) {
    switch (error) {
        case SendError::None:
            return "";
        case SendError::EmptyMessage:
            return "Message is empty.";
        case SendError::SessionBusy:
            return "A response is already being generated for this chat.";
        case SendError::CapacityExceeded:
            return "Too many responses are being generated. Please wait for one to finish.";
        case SendError::PersistenceFailure:
            return "Could not save your message.";
        case SendError::ShuttingDown:
            return "Shutting down.";
    }
    return "";
}

StreamOrchestrator::StreamOrchestrator(Provider& provider, ChatStore& store, EventBus& bus,
                                       const Config& config)
    : provider_(provider),
      store_(store),
      bus_(bus),
      model_(config.model),
      temperature_(config.temperature),
      system_prompt_(config.system_prompt),
      streaming_(config.streaming),
      pool_(config.streaming.worker_threads) {}

StreamOrchestrator::~StreamOrchestrator() {
    shutdown();
}

std::string StreamOrchestrator::next_thread_id(const std::string& session_id) {
    return session_id + "_" + std::to_string(epoch_millis()) + "_" +
           std::to_string(++thread_counter_);
}

std::vector<ChatMessage> StreamOrchestrator::build_context(const std::string& session_id) {
    std::vector<ChatMessage> context;
    if (!system_prompt_.empty()) {
        context.push_back(ChatMessage{Role::System, system_prompt_});
    }
    auto page = store_.recent_messages(session_id, streaming_.context_messages);
    for (const auto& msg : page.messages) {
        // Failed replies carry error markers the model should not see
        if (msg.outdated || msg.failed) continue;
        context.push_back(ChatMessage{msg.role, msg.content});
    }
    return context;
}

SendResult StreamOrchestrator::send_message(const std::string& session_id,
                                            const std::string& message) {
    SendResult result;
    std::string text = trim(message);
    if (text.empty()) {
        result.error = SendError::EmptyMessage;
        return result;
    }

    std::shared_ptr<StreamHandle> handle;
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            result.error = SendError::ShuttingDown;
            return result;
        }
        if (active_.count(session_id)) {
            std::cerr << "[orchestrator] Session " << session_id
                      << " already has an active stream\n";
            result.error = SendError::SessionBusy;
            return result;
        }
        if (active_.size() >= streaming_.max_concurrent_streams) {
            std::cerr << "[orchestrator] Max concurrent streams reached ("
                      << streaming_.max_concurrent_streams << "), rejecting session "
                      << session_id << "\n";
            result.error = SendError::CapacityExceeded;
            return result;
        }
        handle = std::make_shared<StreamHandle>(session_id, next_thread_id(session_id));
        active_[session_id] = handle;
        active = active_.size();
    }

    // The user message is durable before any background work starts.
    std::vector<ChatMessage> context;
    try {
        store_.ensure_session(session_id, text.substr(0, kTitleMaxLength));
        result.user_message_id = store_.record_user_message(session_id, text).id;
        context = build_context(session_id);
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Failed to record message for session " << session_id
                  << ": " << e.what() << "\n";
        handle->mark_failed();
        release_handle(handle);
        result.user_message_id.clear();
        result.error = SendError::PersistenceFailure;
        return result;
    }

    std::cerr << "[orchestrator] Starting stream " << handle->thread_id()
              << " (active: " << active << ")\n";

    StreamStartedEvent started;
    started.session_id = session_id;
    started.thread_id = handle->thread_id();
    bus_.publish(started);

    bool posted = pool_.post([this, handle, context = std::move(context)]() {
        run_stream(handle, context);
    });
    if (!posted) {
        handle->mark_cancelled();
        release_handle(handle);
        result.user_message_id.clear();
        result.error = SendError::ShuttingDown;
        return result;
    }

    result.thread_id = handle->thread_id();
    return result;
}

void StreamOrchestrator::run_stream(const std::shared_ptr<StreamHandle>& handle,
                                    const std::vector<ChatMessage>& context) {
    // Registry cleanup runs on every exit path
    struct Cleanup {
        StreamOrchestrator* self;
        const std::shared_ptr<StreamHandle>& handle;
        ~Cleanup() { self->release_handle(handle); }
    } cleanup{this, handle};

    if (handle->cancel_token().cancelled()) {
        finish_cancelled(handle);
        return;
    }
    handle->mark_streaming();

    try {
        auto response = provider_.chat_stream(
            context, model_, temperature_,
            [this, &handle](const std::string& delta) {
                if (handle->cancel_token().cancelled()) return false;
                if (delta.empty()) return true;
                if (!handle->append(delta)) return false;

                StreamChunkEvent ev;
                ev.session_id = handle->session_id();
                ev.thread_id = handle->thread_id();
                ev.delta = delta;
                ev.content = handle->content();
                bus_.publish(ev);
                return true;
            });

        if (handle->cancel_token().cancelled() || response.aborted) {
            finish_cancelled(handle);
            return;
        }
        // Providers that return the reply without streaming deltas
        if (handle->chunk_count() == 0 && response.content && !response.content->empty()) {
            handle->append(*response.content);
        }
        finish_completed(handle);
    } catch (const std::exception& e) {
        if (handle->cancel_token().cancelled()) {
            finish_cancelled(handle);
            return;
        }
        finish_failed(handle, e.what());
    }
}

std::optional<StoredMessage> StreamOrchestrator::persist_response(
        const std::shared_ptr<StreamHandle>& handle, const std::string& content, bool failed) {
    try {
        return store_.save_assistant_response(handle->session_id(), content, failed);
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Failed to save response for session "
                  << handle->session_id() << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void StreamOrchestrator::finish_completed(const std::shared_ptr<StreamHandle>& handle) {
    // A stop that won the race turns this into a cancellation
    if (!handle->begin_finish()) {
        finish_cancelled(handle);
        return;
    }

    std::string response = handle->content();
    auto saved = persist_response(handle, response, false);
    if (saved) handle->set_saved_message(*saved);
    handle->mark_completed();

    StreamCompletedEvent ev;
    ev.session_id = handle->session_id();
    ev.thread_id = handle->thread_id();
    ev.response = response;
    ev.duration_ms = handle->elapsed_ms();
    bus_.publish(ev);
}

void StreamOrchestrator::finish_failed(const std::shared_ptr<StreamHandle>& handle,
                                       const std::string& error) {
    if (!handle->begin_finish()) {
        finish_cancelled(handle);
        return;
    }
    std::cerr << "[orchestrator] Stream " << handle->thread_id() << " failed: " << error << "\n";

    std::string partial = handle->content();
    std::string marker = kFailureMarker + error;
    std::string stored = partial.empty() ? marker : partial + "\n\n" + marker;
    auto saved = persist_response(handle, stored, true);
    if (saved) handle->set_saved_message(*saved);
    handle->mark_failed();

    StreamFailedEvent ev;
    ev.session_id = handle->session_id();
    ev.thread_id = handle->thread_id();
    ev.error = error;
    if (!partial.empty()) ev.partial_response = partial;
    bus_.publish(ev);
}

void StreamOrchestrator::finish_cancelled(const std::shared_ptr<StreamHandle>& handle) {
    std::string partial = handle->content();
    if (streaming_.persist_cancelled && !partial.empty()) {
        auto saved = persist_response(handle, partial + "\n\n" + kCancelledMarker, true);
        if (saved) handle->set_saved_message(*saved);
    }
    handle->mark_cancelled();

    StreamCancelledEvent ev;
    ev.session_id = handle->session_id();
    ev.thread_id = handle->thread_id();
    if (!partial.empty()) ev.partial_response = partial;
    bus_.publish(ev);
}

void StreamOrchestrator::release_handle(const std::shared_ptr<StreamHandle>& handle) {
    if (!handle->release()) return;

    size_t remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(handle->session_id());
        if (it != active_.end() && it->second == handle) {
            active_.erase(it);
        }
        remaining = active_.size();
    }
    std::cerr << "[orchestrator] Stream " << handle->thread_id() << " cleaned up ("
              << stream_state_to_string(handle->state()) << ", active: " << remaining << ")\n";
}

std::shared_ptr<StreamHandle> StreamOrchestrator::get_active_thread(
        const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(session_id);
    if (it == active_.end()) return nullptr;
    return it->second;
}

bool StreamOrchestrator::has_active_stream(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(session_id) > 0;
}

size_t StreamOrchestrator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::vector<std::string> StreamOrchestrator::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (const auto& [id, handle] : active_) {
        ids.push_back(id);
    }
    return ids;
}

bool StreamOrchestrator::stop_stream(const std::string& session_id) {
    std::shared_ptr<StreamHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(session_id);
        if (it != active_.end()) handle = it->second;
    }
    if (!handle) {
        std::cerr << "[orchestrator] No active stream for session " << session_id << "\n";
        return false;
    }

    std::cerr << "[orchestrator] Stopping stream " << handle->thread_id() << "\n";
    if (!handle->mark_cancelled()) {
        std::cerr << "[orchestrator] Stream " << handle->thread_id()
                  << " is already saving its reply\n";
    }
    release_handle(handle);
    return true;
}

void StreamOrchestrator::shutdown() {
    std::vector<std::shared_ptr<StreamHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shutting_down_) {
            shutting_down_ = true;
            std::cerr << "[orchestrator] Shutting down (" << active_.size()
                      << " active streams)\n";
        }
        for (const auto& [id, handle] : active_) {
            handles.push_back(handle);
        }
    }
    for (const auto& handle : handles) {
        handle->mark_cancelled();
        release_handle(handle);
    }
    pool_.stop();
}

void StreamOrchestrator::wait_idle() {
    pool_.wait_idle();
}

} // namespace multichat
