// src/core/bridge.h
#pragma once

#include "core/endpoint_router.h"
#include "core/reconnect_supervisor.h"
#include "protocol/event_classifier.h"
#include "protocol/line_framer.h"
#include "transport/http_client.h"
#include "transport/outbound_sender.h"
#include "transport/sse_listener.h"
#include "transport/stdio_transport.h"
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>


namespace bridge::core {

    struct BridgeOptions {
        std::string sse_url;
        std::chrono::milliseconds reconnect_interval{5000};
        std::size_t max_line_size = 16 * 1024 * 1024;
        std::size_t max_event_size = 16 * 1024 * 1024;
        std::string sse_path_suffix = "/sse";
        std::string post_path_suffix = "/mcp";
        std::vector<std::string> suppressed_methods = protocol::EventClassifier::default_suppressed_methods();
        std::chrono::milliseconds shutdown_grace{2000};
        bool verify_tls = true;
    };

    /**
     * @brief Relays newline-delimited JSON-RPC between stdio and a remote SSE endpoint.
     *
     * Everything runs on one io_context thread: stdin lines become POSTs,
     * SSE events become stdout lines, and a supervisor keeps the SSE stream open.
     */
    class Bridge {
    public:
        class Builder;

        ~Bridge();

        /**
         * @brief Start reading input and spawn the SSE supervisor. Does not block.
         */
        void start();

        /**
         * @brief start(), then run the io_context until shutdown. Handles SIGINT / SIGTERM.
         */
        void run();

        /**
         * @brief Begin an orderly shutdown: stop reconnecting, let in-flight
         * POSTs finish within the grace period, then stop the io_context.
         */
        void shutdown();

        /// Frame a chunk of local input and POST every completed line.
        void feed_input(std::string_view chunk);

        /// Local input reached end of file.
        void finish_input();

        asio::io_context &get_io_context() { return io_context_; }
        const EndpointRouter &router() const { return *router_; }
        const transport::OutboundSender &sender() const { return *sender_; }
        const transport::SseListener &listener() const { return *listener_; }
        const ReconnectSupervisor &supervisor() const { return *supervisor_; }
        const BridgeOptions &options() const { return options_; }

    private:
        explicit Bridge(BridgeOptions options);
        friend class Builder;

        asio::awaitable<void> drain_and_stop();

        BridgeOptions options_;
        asio::io_context io_context_;
        std::shared_ptr<transport::HttpClient> http_client_;
        std::unique_ptr<EndpointRouter> router_;
        std::unique_ptr<protocol::EventClassifier> classifier_;
        std::unique_ptr<transport::StdioTransport> stdio_transport_;
        std::shared_ptr<transport::MessageSink> external_sink_;
        transport::MessageSink *sink_ = nullptr;
        protocol::LineFramer framer_;
        std::unique_ptr<transport::OutboundSender> sender_;
        std::unique_ptr<transport::SseListener> listener_;
        std::unique_ptr<ReconnectSupervisor> supervisor_;

        bool read_stdin_ = true;
        bool started_ = false;
        bool shutting_down_ = false;
    };

    class Bridge::Builder {
    public:
        Builder() = default;

        Builder &with_options(BridgeOptions options) {
            options_ = std::move(options);
            return *this;
        }
        Builder &with_sse_url(const std::string &url) {
            options_.sse_url = url;
            return *this;
        }
        Builder &with_reconnect_interval(std::chrono::milliseconds interval) {
            options_.reconnect_interval = interval;
            return *this;
        }
        Builder &with_max_line_size(std::size_t bytes) {
            options_.max_line_size = bytes;
            return *this;
        }
        Builder &with_max_event_size(std::size_t bytes) {
            options_.max_event_size = bytes;
            return *this;
        }
        Builder &with_path_suffixes(const std::string &sse_suffix, const std::string &post_suffix) {
            options_.sse_path_suffix = sse_suffix;
            options_.post_path_suffix = post_suffix;
            return *this;
        }
        Builder &with_suppressed_methods(std::vector<std::string> methods) {
            options_.suppressed_methods = std::move(methods);
            return *this;
        }
        Builder &with_shutdown_grace(std::chrono::milliseconds grace) {
            options_.shutdown_grace = grace;
            return *this;
        }
        Builder &with_tls_verification(bool verify) {
            options_.verify_tls = verify;
            return *this;
        }

        // replaces the httplib client, used by tests
        Builder &with_http_client(std::shared_ptr<transport::HttpClient> client) {
            http_client_ = std::move(client);
            return *this;
        }

        // replaces stdout as the destination of inbound messages
        Builder &with_sink(std::shared_ptr<transport::MessageSink> sink) {
            sink_ = std::move(sink);
            return *this;
        }

        // false: input only arrives through feed_input()/finish_input()
        Builder &enableStdinInput(bool enable = true) {
            read_stdin_ = enable;
            return *this;
        }

        /**
         * @brief Validate the options and wire the components together.
         * @throws utils::UrlError if the SSE URL is not an absolute http(s) URL
         */
        std::unique_ptr<Bridge> build();

    private:
        BridgeOptions options_;
        std::shared_ptr<transport::HttpClient> http_client_;
        std::shared_ptr<transport::MessageSink> sink_;
        bool read_stdin_ = true;
    };

}// namespace bridge::core
