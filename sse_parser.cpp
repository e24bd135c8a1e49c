#include "courier.h"
#include "sse_parser.h"
#include <sstream>

SSEParser::SSEParser() {
    dprintf(4, "SSEParser created");
}

bool SSEParser::process_chunk(const std::string& chunk, EventCallback callback) {
    if (chunk.empty()) {
        return true;
    }

    // Append chunk to buffer
    buffer_ += chunk;

    // Process complete lines
    size_t pos = 0;
    size_t newline_pos;

    while ((newline_pos = buffer_.find('\n', pos)) != std::string::npos) {
        // Extract line (handle both \n and \r\n)
        size_t line_end = newline_pos;
        if (line_end > pos && buffer_[line_end - 1] == '\r') {
            line_end--;
        }

        std::string line = buffer_.substr(pos, line_end - pos);
        pos = newline_pos + 1;

        // Process the line
        if (!process_line(line, callback)) {
            buffer_ = buffer_.substr(pos);
            return false; // Callback requested stop
        }
    }

    // Keep unprocessed data in buffer
    if (pos < buffer_.length()) {
        buffer_ = buffer_.substr(pos);
    } else {
        buffer_.clear();
    }

    return true;
}

bool SSEParser::finish(EventCallback callback) {
    if (!buffer_.empty()) {
        std::string line = buffer_;
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!process_line(line, callback)) {
            return false;
        }
    }
    if (!data_lines_.empty() || !event_type_.empty()) {
        return dispatch_event(callback);
    }
    return true;
}

bool SSEParser::process_line(const std::string& line, EventCallback callback) {
    // Empty line dispatches the event
    if (line.empty()) {
        if (!data_lines_.empty() || !event_type_.empty()) {
            return dispatch_event(callback);
        }
        return true;
    }

    // Comment lines start with :
    if (line[0] == ':') {
        dprintf(4, "SSE comment: %s", line.c_str());
        return true;
    }

    // Parse field:value format
    size_t colon_pos = line.find(':');
    std::string field;
    std::string value;

    if (colon_pos != std::string::npos) {
        field = line.substr(0, colon_pos);
        value = line.substr(colon_pos + 1);

        // Remove leading space from value
        if (!value.empty() && value[0] == ' ') {
            value = value.substr(1);
        }
    } else {
        // Line with no colon is treated as field with empty value
        field = line;
    }

    // Process field
    if (field == "event") {
        event_type_ = value;
    } else if (field == "data") {
        // Accumulate data lines
        data_lines_.push_back(value);
    } else if (field == "id") {
        event_id_ = value;
    } else if (field == "retry") {
        // Reconnection hint; we never reconnect a completion stream
        dprintf(4, "SSE retry field ignored: %s", value.c_str());
    } else {
        dprintf(4, "Unknown SSE field: %s", field.c_str());
    }

    return true;
}

bool SSEParser::dispatch_event(EventCallback callback) {
    // Join data lines with newlines
    event_data_.clear();
    for (size_t i = 0; i < data_lines_.size(); ++i) {
        if (i > 0) {
            event_data_ += "\n";
        }
        event_data_ += data_lines_[i];
    }

    bool continue_parsing = true;

    // A "data:" line with an empty value still produces an event
    if (!data_lines_.empty() || !event_type_.empty()) {
        dprintf(3, "SSE event - type: '%s', data length: %zu, id: '%s'",
                event_type_.c_str(), event_data_.length(), event_id_.c_str());

        events_dispatched_++;
        continue_parsing = callback(event_type_, event_data_, event_id_);
    }

    // Clear event state
    event_type_.clear();
    event_data_.clear();
    event_id_.clear();
    data_lines_.clear();

    return continue_parsing;
}

void SSEParser::reset() {
    buffer_.clear();
    event_type_.clear();
    event_data_.clear();
    event_id_.clear();
    data_lines_.clear();
    events_dispatched_ = 0;
    dprintf(4, "SSEParser reset");
}

bool SSEParser::is_done_marker(const std::string& data) {
    return data == "[DONE]";
}

std::string SSEParser::format_data(const std::string& payload) {
    std::string frame;
    frame.reserve(payload.size() + 8);
    frame += "data: ";
    frame += payload;
    frame += "\n\n";
    return frame;
}
