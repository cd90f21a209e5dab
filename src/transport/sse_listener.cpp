#include "sse_listener.h"
#include "core/endpoint_router.h"
#include "core/logger.h"
#include <stdexcept>

namespace bridge::transport {

    SseListener::SseListener(std::shared_ptr<HttpClient> client,
                             std::string sse_url,
                             core::EndpointRouter &router,
                             MessageSink &sink,
                             const protocol::EventClassifier &classifier,
                             std::size_t max_event_size)
        : client_(std::move(client)),
          sse_url_(std::move(sse_url)),
          router_(router),
          sink_(sink),
          classifier_(classifier),
          max_event_size_(max_event_size) {
        if (!client_) {
            throw std::invalid_argument("HttpClient cannot be null");
        }
    }

    asio::awaitable<void> SseListener::run(std::function<void()> on_streaming) {
        Headers headers{
                {"Accept", "text/event-stream"},
                {"Cache-Control", "no-cache"}};

        std::shared_ptr<HttpStream> stream = co_await client_->open_stream(sse_url_, headers);
        active_ = stream;
        const auto &head = stream->head();
        if (!head.ok()) {
            throw HttpError("SSE connection failed: " + std::to_string(head.status) + " " + head.reason);
        }

        auto content_type = head.header("content-type");
        if (content_type.find("text/event-stream") == std::string::npos) {
            BRIDGE_WARN("SSE endpoint answered with Content-Type '{}'", content_type);
        }

        if (on_streaming) {
            on_streaming();
        }

        protocol::EventFramer framer(max_event_size_);
        while (auto chunk = co_await stream->read_chunk()) {
            for (const auto &event: framer.feed(*chunk)) {
                handle_event(event);
            }
        }

        if (framer.pending() > 0) {
            BRIDGE_DEBUG("Discarding {} bytes of an unterminated SSE event", framer.pending());
        }
        stream->close();
        co_return;
    }

    void SseListener::stop() {
        if (auto stream = active_.lock()) {
            stream->close();
        }
    }

    void SseListener::handle_event(const protocol::SseEvent &event) {
        switch (classifier_.classify(event)) {
            case protocol::EventKind::ENDPOINT_DISCOVERY:
                if (event.data.empty()) {
                    BRIDGE_WARN("Ignoring endpoint event without data");
                    return;
                }
                router_.update(event.data);
                return;

            case protocol::EventKind::SUPPRESSED:
                ++suppressed_;
                BRIDGE_DEBUG("Suppressed SSE notification: {}", event.data);
                return;

            case protocol::EventKind::PASS_THROUGH:
                ++forwarded_;
                BRIDGE_TRACE("Received SSE: {}", event.data);
                if (!sink_.write(event.data)) {
                    BRIDGE_DEBUG("SSE message of {} bytes was not delivered to the local peer", event.data.size());
                }
                return;
        }
    }

}// namespace bridge::transport
