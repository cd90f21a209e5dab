#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>

namespace bridge::core {

    enum class ConnectionState {
        CONNECTING,
        STREAMING,
        WAITING,
        STOPPED
    };

    const char *to_string(ConnectionState state);

    /**
     * @brief Keeps the inbound stream alive.
     *
     * CONNECTING -> STREAMING -> (error or end of stream) -> WAITING -> CONNECTING.
     * WAITING always lasts the same interval; there is no backoff and no
     * retry limit. STOPPED is only reached through stop().
     */
    class ReconnectSupervisor {
    public:
        // one connection attempt; calls on_streaming once connected, returns or throws when the stream is gone
        using StreamSession = std::function<asio::awaitable<void>(std::function<void()> on_streaming)>;
        using StateCallback = std::function<void(ConnectionState)>;

        ReconnectSupervisor(const asio::any_io_executor &executor,
                            StreamSession session,
                            std::chrono::milliseconds interval);

        /**
         * @brief Run connection attempts until stop() is called.
         * A stop() that comes before run() makes it return without connecting.
         */
        asio::awaitable<void> run();

        /**
         * @brief End the loop at the next transition, cancelling a pending wait.
         */
        void stop();

        void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

        ConnectionState state() const { return state_; }
        std::size_t attempts() const { return attempts_; }
        std::chrono::milliseconds interval() const { return interval_; }

    private:
        void transition(ConnectionState next);

        StreamSession session_;
        std::chrono::milliseconds interval_;
        asio::steady_timer timer_;
        StateCallback state_callback_;
        ConnectionState state_ = ConnectionState::STOPPED;
        std::size_t attempts_ = 0;
        bool stopped_ = false;
    };

}// namespace bridge::core
