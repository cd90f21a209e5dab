#pragma once

#include "transport/http_client.h"
#include "transport/transport_types.h"
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace bridge::test {

    struct RecordedRequest {
        std::string url;
        std::string body;
        transport::Headers headers;

        std::string header(const std::string &name) const {
            for (const auto &[key, value]: headers) {
                if (key == name) return value;
            }
            return "";
        }
    };

    // What one open_stream() call delivers
    struct StreamScript {
        int status = 200;
        std::string content_type = "text/event-stream";
        std::vector<std::string> chunks;
        bool hold_open = false;///< after the chunks, block until close() instead of ending
    };

    inline transport::HttpResponse make_response(int status, std::string body,
                                                 const std::string &content_type = "application/json") {
        transport::HttpResponse response;
        response.head.version = "HTTP/1.1";
        response.head.status = status;
        response.head.reason = status < 300 ? "OK" : "Error";
        if (!content_type.empty()) {
            response.head.headers["content-type"] = content_type;
        }
        response.body = std::move(body);
        return response;
    }

    class FakeHttpStream : public transport::HttpStream {
    public:
        FakeHttpStream(const asio::any_io_executor &executor, StreamScript script)
            : timer_(executor), chunks_(script.chunks.begin(), script.chunks.end()), hold_open_(script.hold_open) {
            head_.version = "HTTP/1.1";
            head_.status = script.status;
            head_.reason = script.status < 300 ? "OK" : "Error";
            head_.headers["content-type"] = script.content_type;
        }

        const transport::HttpResponseHead &head() const override { return head_; }

        asio::awaitable<std::optional<std::string>> read_chunk() override {
            if (closed_) {
                throw std::system_error(asio::error_code(asio::error::operation_aborted));
            }
            if (!chunks_.empty()) {
                auto chunk = std::move(chunks_.front());
                chunks_.pop_front();
                co_return chunk;
            }
            if (!hold_open_) {
                co_return std::nullopt;
            }
            timer_.expires_at(asio::steady_timer::time_point::max());
            asio::error_code ec;
            co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            throw std::system_error(asio::error_code(asio::error::operation_aborted));
        }

        void close() override {
            closed_ = true;
            timer_.cancel();
        }

    private:
        transport::HttpResponseHead head_;
        asio::steady_timer timer_;
        std::deque<std::string> chunks_;
        bool hold_open_;
        bool closed_ = false;
    };

    /**
     * In-process HttpClient: records every request and answers from scripts.
     */
    class FakeHttpClient : public transport::HttpClient {
    public:
        // answer for a POST; throw to simulate a transport failure
        std::function<transport::HttpResponse(const RecordedRequest &)> on_post;
        // optional artificial latency per POST
        std::function<std::chrono::milliseconds(const RecordedRequest &)> post_delay;

        std::deque<StreamScript> streams;

        std::vector<RecordedRequest> posts;
        std::vector<RecordedRequest> stream_requests;

        asio::awaitable<transport::HttpResponse> post(const std::string &url,
                                                      const std::string &body,
                                                      const transport::Headers &headers) override {
            RecordedRequest request{url, body, headers};
            posts.push_back(request);

            if (post_delay) {
                auto delay = post_delay(request);
                if (delay.count() > 0) {
                    asio::steady_timer timer(co_await asio::this_coro::executor, delay);
                    co_await timer.async_wait(asio::use_awaitable);
                }
            }
            if (!on_post) {
                co_return make_response(202, "", "");
            }
            co_return on_post(request);
        }

        asio::awaitable<std::unique_ptr<transport::HttpStream>> open_stream(const std::string &url,
                                                                            const transport::Headers &headers) override {
            stream_requests.push_back(RecordedRequest{url, "", headers});
            if (streams.empty()) {
                throw std::runtime_error("connection refused");
            }
            auto script = std::move(streams.front());
            streams.pop_front();
            std::unique_ptr<transport::HttpStream> stream =
                    std::make_unique<FakeHttpStream>(co_await asio::this_coro::executor, std::move(script));
            co_return stream;
        }
    };

    class CaptureSink : public transport::MessageSink {
    public:
        bool write(const std::string &message) override {
            messages.push_back(message);
            return true;
        }

        std::vector<std::string> messages;
    };

    // Run @p task on @p io until nothing is left to do; rethrows what the task threw
    inline void run_to_completion(asio::io_context &io, asio::awaitable<void> task) {
        asio::co_spawn(io, std::move(task), [](std::exception_ptr e) {
            if (e) std::rethrow_exception(e);
        });
        io.run();
        io.restart();
    }

}// namespace bridge::test
