#include "reconnect_supervisor.h"
#include "core/logger.h"
#include <stdexcept>

using asio::use_awaitable;

namespace bridge::core {

    const char *to_string(ConnectionState state) {
        switch (state) {
            case ConnectionState::CONNECTING:
                return "CONNECTING";
            case ConnectionState::STREAMING:
                return "STREAMING";
            case ConnectionState::WAITING:
                return "WAITING";
            case ConnectionState::STOPPED:
                return "STOPPED";
        }
        return "UNKNOWN";
    }

    ReconnectSupervisor::ReconnectSupervisor(const asio::any_io_executor &executor,
                                             StreamSession session,
                                             std::chrono::milliseconds interval)
        : session_(std::move(session)), interval_(interval), timer_(executor) {
        if (!session_) {
            throw std::invalid_argument("StreamSession cannot be empty");
        }
    }

    asio::awaitable<void> ReconnectSupervisor::run() {
        while (!stopped_) {
            transition(ConnectionState::CONNECTING);
            ++attempts_;

            try {
                co_await session_([this]() { transition(ConnectionState::STREAMING); });
                if (!stopped_) {
                    BRIDGE_WARN("SSE stream closed by the remote endpoint");
                }
            } catch (const std::exception &e) {
                if (stopped_) {
                    BRIDGE_DEBUG("SSE stream closed during shutdown: {}", e.what());
                } else {
                    BRIDGE_ERROR("SSE Error: {}", e.what());
                }
            }

            if (stopped_) {
                break;
            }

            transition(ConnectionState::WAITING);
            if (!stopped_) {
                timer_.expires_after(interval_);
                asio::error_code ec;
                co_await timer_.async_wait(asio::redirect_error(use_awaitable, ec));
            }
        }

        transition(ConnectionState::STOPPED);
        co_return;
    }

    void ReconnectSupervisor::stop() {
        stopped_ = true;
        timer_.cancel();
    }

    void ReconnectSupervisor::transition(ConnectionState next) {
        if (next == state_) {
            return;
        }
        switch (next) {
            case ConnectionState::CONNECTING:
                BRIDGE_INFO("Connecting to SSE stream (attempt {})", attempts_ + 1);
                break;
            case ConnectionState::STREAMING:
                BRIDGE_INFO("SSE stream established");
                break;
            case ConnectionState::WAITING:
                BRIDGE_INFO("Reconnecting in {} ms", interval_.count());
                break;
            case ConnectionState::STOPPED:
                BRIDGE_INFO("SSE supervisor stopped");
                break;
        }
        state_ = next;
        if (state_callback_) {
            state_callback_(next);
        }
    }

}// namespace bridge::core
