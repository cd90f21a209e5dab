#include "line_framer.h"
#include "core/logger.h"
#include "utils/string_utils.h"

namespace bridge::protocol {

    LineFramer::LineFramer(std::size_t max_line_size)
        : max_line_size_(max_line_size) {
    }

    std::vector<std::string> LineFramer::feed(std::string_view chunk) {
        std::vector<std::string> lines;
        while (!chunk.empty()) {
            auto newline = chunk.find('\n');
            if (newline == std::string_view::npos) {
                if (!discarding_) {
                    buffer_.append(chunk);
                    if (max_line_size_ != 0 && buffer_.size() > max_line_size_) {
                        drop_oversized();
                    }
                }
                break;
            }

            if (discarding_) {
                // newline that ends an already dropped line
                discarding_ = false;
            } else {
                buffer_.append(chunk.substr(0, newline));
                if (max_line_size_ != 0 && buffer_.size() > max_line_size_) {
                    ++dropped_;
                    BRIDGE_WARN("Dropping {}-byte input line, limit is {} bytes", buffer_.size(), max_line_size_);
                } else {
                    emit(lines);
                }
            }
            buffer_.clear();
            chunk.remove_prefix(newline + 1);
        }
        return lines;
    }

    void LineFramer::reset() {
        buffer_.clear();
        discarding_ = false;
    }

    void LineFramer::emit(std::vector<std::string> &lines) {
        std::string_view line = buffer_;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (utils::trim(line).empty()) {
            return;// transport padding
        }
        lines.emplace_back(line);
    }

    void LineFramer::drop_oversized() {
        ++dropped_;
        BRIDGE_WARN("Input line exceeded {} bytes without a newline, discarding it", max_line_size_);
        buffer_.clear();
        buffer_.shrink_to_fit();
        discarding_ = true;
    }

}// namespace bridge::protocol
