#pragma once

#include "http_client.h"
#include "transport_types.h"
#include <asio.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace bridge::core {
    class EndpointRouter;
}

namespace bridge::transport {

    /**
     * @brief Forwards local peer messages to the remote endpoint, one POST each.
     *
     * Sends are independent: a failed POST is logged and forgotten, it is
     * never retried and never stops the next one. Replies reach the sink in
     * the order the POSTs complete.
     */
    class OutboundSender {
    public:
        OutboundSender(std::shared_ptr<HttpClient> client,
                       const core::EndpointRouter &router,
                       MessageSink &sink);

        /**
         * @brief POST @p line to the current target and relay the reply.
         * Never throws; transport errors are logged.
         */
        asio::awaitable<void> send(std::string line);

        std::size_t in_flight() const { return in_flight_; }
        std::size_t sent() const { return sent_; }
        std::size_t failures() const { return failures_; }

        /// Mcp-Session-Id last assigned by the remote endpoint, empty if none
        const std::string &session_id() const { return session_id_; }

    private:
        void relay(const HttpResponse &response);

        std::shared_ptr<HttpClient> client_;
        const core::EndpointRouter &router_;
        MessageSink &sink_;
        std::string session_id_;
        std::size_t in_flight_ = 0;
        std::size_t sent_ = 0;
        std::size_t failures_ = 0;
    };

}// namespace bridge::transport
