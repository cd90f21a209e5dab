#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::protocol {

    /**
     * @brief One dispatched Server-Sent Event.
     *
     * Only the first data line of a block is kept; the remote endpoint sends
     * one JSON-RPC message per event on a single line.
     */
    struct SseEvent {
        std::optional<std::string> name;///< "event:" field, absent for default events
        std::string data;               ///< first "data:" field
        std::optional<std::string> id;  ///< "id:" field

        bool is_default() const { return !name || name->empty() || *name == "message"; }
    };

    /**
     * @brief Incremental text/event-stream decoder.
     *
     * Feed raw body bytes as they arrive; every block closed by a blank line
     * comes back as an SseEvent. LF and CRLF line endings are accepted and a
     * delimiter may straddle two feeds. Blocks with no data line (comments,
     * keep-alives) produce nothing.
     */
    class EventFramer {
    public:
        explicit EventFramer(std::size_t max_event_size = 0);

        /**
         * @brief Append body bytes and return the events they completed.
         * @throws FrameTooLarge if the open block exceeds max_event_size
         */
        std::vector<SseEvent> feed(std::string_view chunk);

        /// bytes belonging to the block that is still open
        std::size_t pending() const { return buffer_.size() + block_size_; }

        void reset();

    private:
        void process_line(std::string_view line);
        void dispatch(std::vector<SseEvent> &events);

        std::string buffer_;///< unterminated line
        SseEvent current_;
        bool has_data_ = false;
        std::size_t block_size_ = 0;
        std::size_t max_event_size_;
    };

}// namespace bridge::protocol
