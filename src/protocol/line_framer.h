#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::protocol {

    /**
     * @brief Splits the local peer's byte stream into newline-terminated messages.
     *
     * Chunks may end anywhere, including inside a line or between '\r' and '\n'.
     * The unterminated tail is kept until the next feed(). Blank and
     * whitespace-only lines are dropped.
     *
     * With a non-zero @p max_line_size an oversized line is discarded up to its
     * newline instead of growing the buffer without bound.
     */
    class LineFramer {
    public:
        explicit LineFramer(std::size_t max_line_size = 0);

        /**
         * @brief Append a chunk and return every line it completed, in order.
         * Returned lines have no trailing '\n' or '\r'.
         */
        std::vector<std::string> feed(std::string_view chunk);

        /// bytes held for the line still waiting for its newline
        std::size_t pending() const { return buffer_.size(); }

        /// number of lines discarded for exceeding max_line_size
        std::size_t dropped() const { return dropped_; }

        void reset();

    private:
        void emit(std::vector<std::string> &lines);
        void drop_oversized();

        std::string buffer_;
        std::size_t max_line_size_;
        std::size_t dropped_ = 0;
        bool discarding_ = false;
    };

}// namespace bridge::protocol
