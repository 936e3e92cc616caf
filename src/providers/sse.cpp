#include "sse.hpp"

namespace multichat {

// Field value after "name:" with the single optional leading space removed.
static std::string field_value(const std::string& line, size_t name_len) {
    size_t start = name_len + 1;
    if (start < line.size() && line[start] == ' ') ++start;
    return start < line.size() ? line.substr(start) : std::string();
}

void SSEParser::process_line(const std::string& line) {
    if (line.rfind("data:", 0) == 0) {
        if (has_data_) data_ += '\n';
        data_ += field_value(line, 4);
        has_data_ = true;
    } else if (line.rfind("event:", 0) == 0) {
        event_ = field_value(line, 5);
    }
    // Comments (":keepalive"), "id:" and "retry:" carry nothing we use.
}

bool SSEParser::dispatch(const SSECallback& callback) {
    bool keep_going = true;
    if (has_data_) {
        SSEEvent event{event_, data_};
        keep_going = callback(event);
    }
    event_.clear();
    data_.clear();
    has_data_ = false;
    return keep_going;
}

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (true) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            if (!dispatch(callback)) {
                buffer_.erase(0, pos);
                return false;
            }
        } else {
            process_line(line);
        }
    }

    // Keep the incomplete tail for the next chunk
    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    if (!buffer_.empty()) {
        std::string line = buffer_;
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) process_line(line);
    }
    return dispatch(callback);
}

void SSEParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
}

} // namespace multichat
