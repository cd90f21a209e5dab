#include "outbound_sender.h"
#include "core/endpoint_router.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <stdexcept>

namespace bridge::transport {

    OutboundSender::OutboundSender(std::shared_ptr<HttpClient> client,
                                   const core::EndpointRouter &router,
                                   MessageSink &sink)
        : client_(std::move(client)), router_(router), sink_(sink) {
        if (!client_) {
            throw std::invalid_argument("HttpClient cannot be null");
        }
    }

    asio::awaitable<void> OutboundSender::send(std::string line) {
        // the target is read once, an endpoint change mid-flight does not affect this send
        const std::string target = router_.current();
        ++in_flight_;

        Headers headers{{"Content-Type", "application/json"}};
        if (!session_id_.empty()) {
            headers.emplace_back("Mcp-Session-Id", session_id_);
        }

        try {
            BRIDGE_DEBUG("Forwarding {} bytes to {}", line.size(), target);
            auto response = co_await client_->post(target, line, headers);
            ++sent_;

            if (!response.head.ok()) {
                BRIDGE_WARN("POST {} returned {} {}", target, response.head.status, response.head.reason);
            }

            auto assigned = response.head.header("mcp-session-id");
            if (!assigned.empty() && assigned != session_id_) {
                BRIDGE_DEBUG("Remote endpoint assigned session id {}", assigned);
                session_id_ = std::move(assigned);
            }

            relay(response);
        } catch (const std::exception &e) {
            ++failures_;
            BRIDGE_ERROR("Error forwarding request to {}: {}", target, e.what());
        }

        --in_flight_;
        co_return;
    }

    void OutboundSender::relay(const HttpResponse &response) {
        auto body = utils::trim_line_ending(response.body);
        if (utils::trim(body).empty()) {
            return;// accepted with no body, the reply arrives over SSE
        }
        if (!sink_.write(std::string(body))) {
            BRIDGE_DEBUG("Reply of {} bytes was not delivered to the local peer", body.size());
        }
    }

}// namespace bridge::transport
