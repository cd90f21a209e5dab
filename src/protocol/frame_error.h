#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bridge::protocol {

    /**
     * @brief A partial frame grew past its configured limit before its delimiter arrived.
     */
    class FrameTooLarge : public std::runtime_error {
    public:
        FrameTooLarge(const std::string &what, std::size_t limit)
            : std::runtime_error(what), limit_(limit) {}

        std::size_t limit() const { return limit_; }

    private:
        std::size_t limit_;
    };

}// namespace bridge::protocol
