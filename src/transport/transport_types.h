#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bridge::transport {

    // request headers, sent in order
    using Headers = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief Protocol violation or unusable reply from the remote HTTP server.
     */
    class HttpError : public std::runtime_error {
    public:
        explicit HttpError(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief Receives complete protocol messages destined for the local peer.
     *
     * write() appends exactly one newline after @p message.
     */
    class MessageSink {
    public:
        virtual ~MessageSink() = default;
        virtual bool write(const std::string &message) = 0;
    };

    // raw stdin bytes as they were read
    using ChunkCallback = std::function<void(std::string_view)>;

}// namespace bridge::transport
