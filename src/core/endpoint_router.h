#pragma once

#include "utils/url.h"
#include <cstddef>
#include <string>
#include <string_view>

namespace bridge::core {

    /**
     * @brief Holds the URL every outbound POST is sent to.
     *
     * Starts as the SSE URL with its path suffix swapped (".../sse" becomes
     * ".../mcp") and is replaced whenever an endpoint event arrives. One
     * writer (the SSE listener) and many readers, all on the io_context
     * thread, so reads are plain value copies without locking. A send that is
     * already in flight keeps the URL it read.
     */
    class EndpointRouter {
    public:
        /**
         * @throws utils::UrlError if @p sse_url is not an absolute http(s) URL
         */
        EndpointRouter(const std::string &sse_url,
                       const std::string &sse_suffix = "/sse",
                       const std::string &post_suffix = "/mcp");

        std::string current() const { return target_; }

        const std::string &sse_url() const { return sse_url_; }
        const std::string &origin() const { return origin_; }

        /// number of endpoint events applied so far
        std::size_t generation() const { return generation_; }

        /**
         * @brief Interpret an endpoint event payload.
         *
         * "http(s)://..." is taken verbatim, "/path" is resolved against the
         * SSE URL's origin, anything else is an opaque replacement.
         * "//host/path" counts as a path: the origin is prefixed as is.
         */
        std::string resolve(std::string_view data) const;

        /**
         * @brief Resolve @p data and make it the current target.
         * @return the new target
         */
        std::string update(std::string_view data);

    private:
        std::string sse_url_;
        std::string origin_;
        std::string target_;
        std::size_t generation_ = 0;
    };

}// namespace bridge::core
