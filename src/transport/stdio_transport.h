// src/transport/stdio_transport.h
#pragma once
#include "transport_types.h"
#include <array>
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace bridge::transport {

    /**
     * @brief The local peer's side of the bridge: stdin in, stdout out.
     *
     * Reads run on the io_context. Writes are synchronous, so one message
     * never interleaves with another on stdout.
     */
    class StdioTransport : public MessageSink {
    public:
        using CloseCallback = std::function<void()>;

        explicit StdioTransport(asio::io_context &io_context);
        ~StdioTransport() override;

        /**
         * @brief Start reading stdin.
         *
         * A descriptor epoll cannot watch (a regular file) is read on a
         * helper thread that close() joins.
         * @param on_chunk called with every chunk read, on the io_context thread
         * @param on_close called once when stdin reaches end of file or fails
         */
        bool open(ChunkCallback on_chunk, CloseCallback on_close);
        void close();
        bool write(const std::string &message) override;

        bool is_open() const { return running_; }

    private:
        asio::awaitable<void> read_loop();
        void start_reader_thread();
        void finish();

        asio::io_context &io_context_;
        asio::posix::stream_descriptor input_;
        std::array<char, 8192> buffer_{};
        std::thread reader_;
        std::atomic<bool> reader_stop_{false};
        ChunkCallback on_chunk_;
        CloseCallback on_close_;
        bool running_ = false;
    };

}// namespace bridge::transport
