// src/transport/stdio_transport.cpp
#include "stdio_transport.h"
#include "core/logger.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>

using asio::use_awaitable;

namespace bridge::transport {

    StdioTransport::StdioTransport(asio::io_context &io_context)
        : io_context_(io_context), input_(io_context) {
    }

    StdioTransport::~StdioTransport() {
        close();
    }

    bool StdioTransport::open(ChunkCallback on_chunk, CloseCallback on_close) {
        on_chunk_ = std::move(on_chunk);
        on_close_ = std::move(on_close);
        running_ = true;

        int fd = ::dup(STDIN_FILENO);
        if (fd < 0) {
            BRIDGE_ERROR("Cannot duplicate stdin: {}", std::strerror(errno));
            running_ = false;
            return false;
        }

        asio::error_code ec;
        input_.assign(fd, ec);
        if (ec) {
            // descriptor the reactor cannot watch, read it on a helper thread instead
            ::close(fd);
            BRIDGE_DEBUG("stdin is not pollable ({}), using a reader thread", ec.message());
            start_reader_thread();
        } else {
            asio::co_spawn(io_context_, read_loop(), asio::detached);
        }

        BRIDGE_INFO("STDIO Transport started, waiting for input...");
        return true;
    }

    asio::awaitable<void> StdioTransport::read_loop() {
        try {
            while (running_) {
                asio::error_code ec;
                auto n = co_await input_.async_read_some(asio::buffer(buffer_), asio::redirect_error(use_awaitable, ec));
                if (ec == asio::error::operation_aborted) {
                    co_return;// close() was called
                }
                if (ec == asio::error::eof) {
                    break;
                }
                if (ec) {
                    BRIDGE_ERROR("stdin read failed: {}", ec.message());
                    break;
                }
                BRIDGE_TRACE("Read {} bytes from stdin", n);
                on_chunk_(std::string_view(buffer_.data(), n));
            }
        } catch (const std::exception &e) {
            BRIDGE_ERROR("stdin reader stopped: {}", e.what());
        }
        finish();
        co_return;
    }

    void StdioTransport::start_reader_thread() {
        reader_stop_ = false;
        reader_ = std::thread([this]() {
            std::array<char, 8192> chunk{};
            while (!reader_stop_) {
                auto n = ::read(STDIN_FILENO, chunk.data(), chunk.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    break;
                }
                // hand the bytes to the io_context thread
                asio::post(io_context_, [this, data = std::string(chunk.data(), static_cast<std::size_t>(n))]() {
                    if (running_) {
                        on_chunk_(data);
                    }
                });
            }
            if (!reader_stop_) {
                asio::post(io_context_, [this]() { finish(); });
            }
        });
    }

    void StdioTransport::finish() {
        if (!running_) {
            return;
        }
        running_ = false;
        BRIDGE_INFO("stdin closed");
        if (on_close_) {
            on_close_();
        }
    }

    bool StdioTransport::write(const std::string &message) {
        std::cout << message << std::endl;// endl flushes, one frame per write
        if (!std::cout) {
            BRIDGE_ERROR("Failed to write {} bytes to stdout", message.size());
            std::cout.clear();
            return false;
        }
        return true;
    }

    void StdioTransport::close() {
        running_ = false;
        asio::error_code ec;
        if (input_.is_open()) {
            input_.cancel(ec);
            input_.close(ec);
        }
        // reads from a regular file never block, so the join is bounded
        reader_stop_ = true;
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.join();
        }
    }

}// namespace bridge::transport
