#include "event_framer.h"
#include "frame_error.h"

namespace bridge::protocol {

    EventFramer::EventFramer(std::size_t max_event_size)
        : max_event_size_(max_event_size) {
    }

    std::vector<SseEvent> EventFramer::feed(std::string_view chunk) {
        std::vector<SseEvent> events;
        buffer_.append(chunk);

        std::size_t start = 0;
        while (true) {
            auto newline = buffer_.find('\n', start);
            if (newline == std::string::npos) {
                break;
            }
            std::string_view line(buffer_.data() + start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (line.empty()) {
                dispatch(events);
            } else {
                block_size_ += line.size() + 1;
                process_line(line);
            }
            start = newline + 1;
        }
        buffer_.erase(0, start);

        if (max_event_size_ != 0 && pending() > max_event_size_) {
            auto size = pending();
            reset();
            throw FrameTooLarge("SSE event exceeded " + std::to_string(max_event_size_) +
                                        " bytes without a terminating blank line (" + std::to_string(size) + " buffered)",
                                max_event_size_);
        }
        return events;
    }

    void EventFramer::reset() {
        buffer_.clear();
        current_ = SseEvent{};
        has_data_ = false;
        block_size_ = 0;
    }

    void EventFramer::process_line(std::string_view line) {
        if (line.front() == ':') {
            return;// comment / keep-alive
        }

        auto colon = line.find(':');
        auto field = line.substr(0, colon);
        std::string_view value;
        if (colon != std::string_view::npos) {
            value = line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ') {
                value.remove_prefix(1);
            }
        }

        if (field == "event") {
            current_.name = std::string(value);
        } else if (field == "data") {
            // later data lines of the same block are not joined
            if (!has_data_) {
                current_.data = std::string(value);
                has_data_ = true;
            }
        } else if (field == "id") {
            current_.id = std::string(value);
        }
    }

    void EventFramer::dispatch(std::vector<SseEvent> &events) {
        if (has_data_) {
            events.push_back(std::move(current_));
        }
        current_ = SseEvent{};
        has_data_ = false;
        block_size_ = 0;
    }

}// namespace bridge::protocol
