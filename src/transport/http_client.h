#pragma once

#include "transport_types.h"
#include <asio.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace httplib {
    class Client;
}

namespace bridge::transport {

    /**
     * @brief Status line and headers of an HTTP response.
     * Header names are stored lower case.
     */
    struct HttpResponseHead {
        std::string version;
        int status = 0;
        std::string reason;
        std::unordered_map<std::string, std::string> headers;

        bool ok() const { return status >= 200 && status < 300; }

        /// case-insensitive lookup, empty string when absent
        std::string header(const std::string &name) const;
    };

    struct HttpResponse {
        HttpResponseHead head;
        std::string body;
    };

    /**
     * @brief A response whose body is consumed while it is still arriving.
     */
    class HttpStream {
    public:
        virtual ~HttpStream() = default;

        virtual const HttpResponseHead &head() const = 0;

        /**
         * @brief Wait for the next piece of body.
         * @return body bytes, or nullopt once the body has ended
         * @throws std::system_error / HttpError when the connection fails
         */
        virtual asio::awaitable<std::optional<std::string>> read_chunk() = 0;

        virtual void close() = 0;
    };

    /**
     * @brief Outgoing HTTP operations used by the bridge.
     *
     * Abstract so the sender and listener can be driven by an in-process
     * fake in tests.
     */
    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        /**
         * @brief POST @p body to @p url and read the complete response.
         * @throws utils::UrlError or HttpError on transport failure
         */
        virtual asio::awaitable<HttpResponse> post(const std::string &url,
                                                   const std::string &body,
                                                   const Headers &headers) = 0;

        /**
         * @brief GET @p url and return as soon as the response head is in.
         * @throws utils::UrlError or HttpError on transport failure
         */
        virtual asio::awaitable<std::unique_ptr<HttpStream>> open_stream(const std::string &url,
                                                                         const Headers &headers) = 0;
    };

    struct HttpClientOptions {
        bool verify_tls = true;
        std::string user_agent = "sse-bridge/1.0";
        std::size_t worker_threads = 4;///< concurrent requests, the SSE stream holds one
        int connection_timeout_s = 10;
        int request_timeout_s = 30;
        int stream_idle_timeout_s = 24 * 60 * 60;
    };

    /**
     * @brief HttpClient on cpp-httplib.
     *
     * httplib calls block, so every request runs on a small worker pool and
     * its result is posted back to the awaiting coroutine's executor. Stream
     * bodies arrive through httplib's content receiver the same way.
     */
    class HttplibClient : public HttpClient {
    public:
        explicit HttplibClient(HttpClientOptions options = {});
        ~HttplibClient() override;

        asio::awaitable<HttpResponse> post(const std::string &url,
                                           const std::string &body,
                                           const Headers &headers) override;

        asio::awaitable<std::unique_ptr<HttpStream>> open_stream(const std::string &url,
                                                                 const Headers &headers) override;

    private:
        class ActiveRequest;

        HttpClientOptions options_;
        std::mutex active_mutex_;
        std::unordered_set<httplib::Client *> active_;
        bool stopping_ = false;
        asio::thread_pool workers_;
    };

}// namespace bridge::transport
