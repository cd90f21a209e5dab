#include "bridge.h"
#include "core/logger.h"
#include "utils/url.h"
#include <csignal>
#include <stdexcept>


namespace bridge::core {

    std::unique_ptr<Bridge> Bridge::Builder::build() {
        if (options_.sse_url.empty()) {
            throw utils::UrlError("SSE URL is required");
        }
        if (!utils::has_http_scheme(options_.sse_url)) {
            throw utils::UrlError("SSE URL must start with http:// or https://: " + options_.sse_url);
        }

        auto bridge = std::unique_ptr<Bridge>(new Bridge(options_));
        auto &b = *bridge;

        // throws UrlError for anything Url::parse rejects
        b.router_ = std::make_unique<EndpointRouter>(b.options_.sse_url,
                                                     b.options_.sse_path_suffix,
                                                     b.options_.post_path_suffix);
        b.classifier_ = std::make_unique<protocol::EventClassifier>(b.options_.suppressed_methods);

        if (http_client_) {
            b.http_client_ = http_client_;
        } else {
            transport::HttpClientOptions client_options;
            client_options.verify_tls = b.options_.verify_tls;
            b.http_client_ = std::make_shared<transport::HttplibClient>(client_options);
        }

        b.stdio_transport_ = std::make_unique<transport::StdioTransport>(b.io_context_);
        if (sink_) {
            b.external_sink_ = sink_;
            b.sink_ = b.external_sink_.get();
        } else {
            b.sink_ = b.stdio_transport_.get();
        }
        b.read_stdin_ = read_stdin_;

        b.sender_ = std::make_unique<transport::OutboundSender>(b.http_client_, *b.router_, *b.sink_);
        b.listener_ = std::make_unique<transport::SseListener>(b.http_client_, b.options_.sse_url, *b.router_,
                                                               *b.sink_, *b.classifier_, b.options_.max_event_size);
        b.supervisor_ = std::make_unique<ReconnectSupervisor>(
                b.io_context_.get_executor(),
                [listener = b.listener_.get()](std::function<void()> on_streaming) {
                    return listener->run(std::move(on_streaming));
                },
                b.options_.reconnect_interval);

        BRIDGE_INFO("Bridge configured: SSE {} -> initial POST target {}", b.router_->sse_url(), b.router_->current());
        BRIDGE_DEBUG("Reconnect interval {} ms, max line {} bytes, max event {} bytes",
                     b.options_.reconnect_interval.count(), b.options_.max_line_size, b.options_.max_event_size);
        return bridge;
    }

    Bridge::Bridge(BridgeOptions options)
        : options_(std::move(options)), framer_(options_.max_line_size) {
    }

    Bridge::~Bridge() {
        if (supervisor_) {
            supervisor_->stop();
        }
        if (stdio_transport_) {
            stdio_transport_->close();
        }
    }

    void Bridge::start() {
        if (started_) {
            return;
        }
        started_ = true;

        if (read_stdin_) {
            bool opened = stdio_transport_->open(
                    [this](std::string_view chunk) { feed_input(chunk); },
                    [this]() { finish_input(); });
            if (!opened) {
                throw std::runtime_error("Failed to start STDIO Transport");
            }
        }

        asio::co_spawn(io_context_, supervisor_->run(), asio::detached);
    }

    void Bridge::run() {
        asio::signal_set signals(io_context_, SIGINT, SIGTERM);
        signals.async_wait([this](const asio::error_code &ec, int signo) {
            if (ec) {
                return;
            }
            BRIDGE_INFO("Received signal {}, shutting down", signo);
            shutdown();
        });

        start();
        BRIDGE_INFO("SSE bridge running. Send JSON-RPC messages via stdin.");
        io_context_.run();

        asio::error_code ignored;
        signals.cancel(ignored);
        BRIDGE_INFO("SSE bridge stopped ({} sent, {} failed, {} forwarded, {} suppressed)",
                    sender_->sent(), sender_->failures(), listener_->forwarded(), listener_->suppressed());
    }

    void Bridge::feed_input(std::string_view chunk) {
        for (auto &line: framer_.feed(chunk)) {
            BRIDGE_TRACE("Sending: {}", line);
            asio::co_spawn(io_context_, sender_->send(std::move(line)), asio::detached);
        }
    }

    void Bridge::finish_input() {
        if (framer_.pending() > 0) {
            BRIDGE_WARN("Discarding {} bytes of unterminated input", framer_.pending());
            framer_.reset();
        }
        shutdown();
    }

    void Bridge::shutdown() {
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
        BRIDGE_INFO("Shutting down bridge");

        supervisor_->stop();
        listener_->stop();
        stdio_transport_->close();
        asio::co_spawn(io_context_, drain_and_stop(), asio::detached);
    }

    asio::awaitable<void> Bridge::drain_and_stop() {
        auto deadline = std::chrono::steady_clock::now() + options_.shutdown_grace;
        asio::steady_timer timer(io_context_);

        while (sender_->in_flight() > 0 && std::chrono::steady_clock::now() < deadline) {
            timer.expires_after(std::chrono::milliseconds(10));
            asio::error_code ec;
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        if (sender_->in_flight() > 0) {
            BRIDGE_WARN("Abandoning {} in-flight request(s) after {} ms", sender_->in_flight(), options_.shutdown_grace.count());
        }
        io_context_.stop();
        co_return;
    }

}// namespace bridge::core
