#pragma once

#include "http_client.h"
#include "protocol/event_classifier.h"
#include "protocol/event_framer.h"
#include "transport_types.h"
#include <asio.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace bridge::core {
    class EndpointRouter;
}

namespace bridge::transport {

    /**
     * @brief Owns the long-lived SSE connection of one streaming session.
     *
     * Endpoint events retarget the router, suppressed notifications are
     * dropped, everything else is written to the local peer verbatim.
     */
    class SseListener {
    public:
        SseListener(std::shared_ptr<HttpClient> client,
                    std::string sse_url,
                    core::EndpointRouter &router,
                    MessageSink &sink,
                    const protocol::EventClassifier &classifier,
                    std::size_t max_event_size = 0);

        /**
         * @brief Connect and forward events until the stream ends.
         * @param on_streaming called once the server accepted the stream
         * @throws HttpError for a non-success status; any connection or framing error
         *         propagates to the caller
         */
        asio::awaitable<void> run(std::function<void()> on_streaming = {});

        /// close the stream of a running session, if any; run() then fails with a read error
        void stop();

        /// classify and act on one event
        void handle_event(const protocol::SseEvent &event);

        std::size_t forwarded() const { return forwarded_; }
        std::size_t suppressed() const { return suppressed_; }

    private:
        std::shared_ptr<HttpClient> client_;
        std::string sse_url_;
        core::EndpointRouter &router_;
        MessageSink &sink_;
        const protocol::EventClassifier &classifier_;
        std::size_t max_event_size_;
        std::weak_ptr<HttpStream> active_;
        std::size_t forwarded_ = 0;
        std::size_t suppressed_ = 0;
    };

}// namespace bridge::transport
