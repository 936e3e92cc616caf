#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace multichat {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* StreamStarted   = "StreamStarted";
    constexpr const char* StreamChunk     = "StreamChunk";
    constexpr const char* StreamCompleted = "StreamCompleted";
    constexpr const char* StreamFailed    = "StreamFailed";
    constexpr const char* StreamCancelled = "StreamCancelled";
    constexpr const char* SessionEvicted  = "SessionEvicted";
    constexpr const char* SessionClosed   = "SessionClosed";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct StreamStartedEvent : Event {
    static constexpr const char* TAG = event_tags::StreamStarted;
    std::string session_id;
    std::string thread_id;

    StreamStartedEvent() { type_tag = TAG; }
};

// One appended chunk. `content` is the joined content after the append.
struct StreamChunkEvent : Event {
    static constexpr const char* TAG = event_tags::StreamChunk;
    std::string session_id;
    std::string thread_id;
    std::string delta;
    std::string content;

    StreamChunkEvent() { type_tag = TAG; }
};

struct StreamCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::StreamCompleted;
    std::string session_id;
    std::string thread_id;
    std::string response;
    uint64_t duration_ms = 0;

    StreamCompletedEvent() { type_tag = TAG; }
};

struct StreamFailedEvent : Event {
    static constexpr const char* TAG = event_tags::StreamFailed;
    std::string session_id;
    std::string thread_id;
    std::string error;
    std::optional<std::string> partial_response; // unset when nothing was buffered

    StreamFailedEvent() { type_tag = TAG; }
};

struct StreamCancelledEvent : Event {
    static constexpr const char* TAG = event_tags::StreamCancelled;
    std::string session_id;
    std::string thread_id;
    std::optional<std::string> partial_response;

    StreamCancelledEvent() { type_tag = TAG; }
};

struct SessionEvictedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEvicted;
    std::string session_id;
    bool was_streaming = false;

    SessionEvictedEvent() { type_tag = TAG; }
};

struct SessionClosedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionClosed;
    std::string session_id;

    SessionClosedEvent() { type_tag = TAG; }
};

} // namespace multichat
