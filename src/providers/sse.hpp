#pragma once
#include <string>
#include <functional>

namespace multichat {

struct SSEEvent {
    std::string event; // event type, empty for plain "data:" events
    std::string data;  // payload; multiple data lines joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental Server-Sent Events parser. Chunks may split lines and
// events at any byte; partial input is buffered until the next feed().
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);

    // Dispatch an event left pending because the stream ended without
    // the terminating blank line.
    bool finish(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    bool dispatch(const SSECallback& callback);
    void process_line(const std::string& line);

    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
};

} // namespace multichat
