#include "http_client.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/url.h"
#include <atomic>
#include <deque>
#include <exception>
#include <httplib.h>
#include <system_error>

namespace bridge::transport {

    std::string HttpResponseHead::header(const std::string &name) const {
        auto it = headers.find(utils::to_lower(name));
        return it != headers.end() ? it->second : "";
    }

    namespace {

        HttpResponseHead to_head(const httplib::Response &response) {
            HttpResponseHead head;
            head.version = response.version;
            head.status = response.status;
            head.reason = response.reason;
            for (const auto &[name, value]: response.headers) {
                auto key = utils::to_lower(name);
                auto it = head.headers.find(key);
                if (it == head.headers.end()) {
                    head.headers.emplace(std::move(key), value);
                } else {
                    it->second += ", " + value;
                }
            }
            return head;
        }

        // httplib takes the content type apart from the other request headers
        httplib::Headers to_httplib(const Headers &headers, std::string &content_type) {
            httplib::Headers converted;
            for (const auto &[name, value]: headers) {
                if (utils::to_lower(name) == "content-type") {
                    content_type = value;
                } else {
                    converted.emplace(name, value);
                }
            }
            return converted;
        }

        std::unique_ptr<httplib::Client> make_client(const utils::Url &url,
                                                     const HttpClientOptions &options,
                                                     int read_timeout_s) {
            auto client = std::make_unique<httplib::Client>(url.origin());
            if (!client->is_valid()) {
                throw HttpError("Cannot create an HTTP client for " + url.origin());
            }
            client->set_connection_timeout(options.connection_timeout_s, 0);
            client->set_read_timeout(read_timeout_s, 0);
            client->set_write_timeout(options.connection_timeout_s, 0);
            if (!options.user_agent.empty()) {
                client->set_default_headers({{"User-Agent", options.user_agent}});
            }
            if (url.is_tls()) {
                client->enable_server_certificate_verification(options.verify_tls);
            }
            return client;
        }

        /**
         * @brief Run blocking @p work on @p pool and resume the caller on its own executor.
         * Exceptions thrown by @p work are rethrown in the caller.
         */
        template<typename T, typename Work>
        asio::awaitable<T> run_blocking(asio::thread_pool &pool, Work work) {
            auto executor = co_await asio::this_coro::executor;
            co_return co_await asio::async_initiate<decltype(asio::use_awaitable), void(std::exception_ptr, T)>(
                    [&pool, executor, work = std::move(work)](auto handler) mutable {
                        asio::post(pool, [guard = asio::make_work_guard(executor),
                                          handler = std::move(handler),
                                          work = std::move(work)]() mutable {
                            std::exception_ptr error;
                            T result{};
                            try {
                                result = work();
                            } catch (const std::exception &) {
                                error = std::current_exception();
                            }
                            asio::post(guard.get_executor(), [handler = std::move(handler), error, result = std::move(result)]() mutable {
                                std::move(handler)(error, std::move(result));
                            });
                            guard.reset();
                        });
                    },
                    asio::use_awaitable);
        }

        /**
         * @brief What a streaming GET has produced so far.
         *
         * The worker thread never touches the fields below `closed`; it posts
         * updates to the io executor and wakes the reader through `signal`.
         */
        struct StreamState : std::enable_shared_from_this<StreamState> {
            explicit StreamState(const asio::any_io_executor &executor)
                : executor(executor), signal(executor) {
            }

            template<typename Update>
            void deliver(Update update) {
                asio::post(executor, [self = shared_from_this(), update = std::move(update)]() mutable {
                    update(*self);
                    self->signal.cancel();
                });
            }

            asio::awaitable<void> wait() {
                signal.expires_at(asio::steady_timer::time_point::max());
                asio::error_code ec;
                co_await signal.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            }

            asio::any_io_executor executor;
            asio::steady_timer signal;
            std::unique_ptr<httplib::Client> client;
            std::atomic<bool> closed{false};

            std::optional<HttpResponseHead> head;
            std::deque<std::string> chunks;
            bool finished = false;
            std::string error;
        };

        class HttplibStream : public HttpStream {
        public:
            explicit HttplibStream(std::shared_ptr<StreamState> state) : state_(std::move(state)) {}

            ~HttplibStream() override { close(); }

            const HttpResponseHead &head() const override { return *state_->head; }

            asio::awaitable<std::optional<std::string>> read_chunk() override {
                auto state = state_;
                while (true) {
                    if (state->closed) {
                        throw std::system_error(asio::error_code(asio::error::operation_aborted));
                    }
                    if (!state->chunks.empty()) {
                        auto chunk = std::move(state->chunks.front());
                        state->chunks.pop_front();
                        co_return chunk;
                    }
                    if (state->finished) {
                        if (!state->error.empty()) {
                            throw HttpError(state->error);
                        }
                        co_return std::nullopt;
                    }
                    co_await state->wait();
                }
            }

            void close() override {
                if (state_->closed.exchange(true)) {
                    return;
                }
                state_->client->stop();
                state_->signal.cancel();
            }

        private:
            std::shared_ptr<StreamState> state_;
        };

    }// namespace

    // Registers a client for the duration of one request, so the destructor can abort it
    class HttplibClient::ActiveRequest {
    public:
        ActiveRequest(HttplibClient &owner, httplib::Client &client) : owner_(owner), client_(client) {
            std::lock_guard<std::mutex> lock(owner_.active_mutex_);
            if (owner_.stopping_) {
                throw HttpError("HTTP client is shutting down");
            }
            owner_.active_.insert(&client_);
        }

        ~ActiveRequest() {
            std::lock_guard<std::mutex> lock(owner_.active_mutex_);
            owner_.active_.erase(&client_);
        }

    private:
        HttplibClient &owner_;
        httplib::Client &client_;
    };

    HttplibClient::HttplibClient(HttpClientOptions options)
        : options_(std::move(options)),
          workers_(options_.worker_threads) {
        if (!options_.verify_tls) {
            BRIDGE_WARN("TLS certificate verification is disabled");
        }
    }

    HttplibClient::~HttplibClient() {
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            stopping_ = true;
            for (auto *client: active_) {
                client->stop();
            }
        }
        workers_.stop();
        workers_.join();
    }

    asio::awaitable<HttpResponse> HttplibClient::post(const std::string &url,
                                                      const std::string &body,
                                                      const Headers &headers) {
        auto parsed = utils::Url::parse(url);
        co_return co_await run_blocking<HttpResponse>(workers_, [this, parsed, body, headers]() {
            auto client = make_client(parsed, options_, options_.request_timeout_s);
            ActiveRequest active(*this, *client);

            std::string content_type;
            auto request_headers = to_httplib(headers, content_type);
            auto result = client->Post(parsed.target, request_headers, body, content_type);
            if (!result) {
                throw HttpError("POST " + parsed.str() + " failed: " + httplib::to_string(result.error()));
            }

            HttpResponse response;
            response.head = to_head(*result);
            response.body = std::move(result->body);
            BRIDGE_TRACE("POST {} -> {} ({} bytes)", parsed.str(), response.head.status, response.body.size());
            return response;
        });
    }

    asio::awaitable<std::unique_ptr<HttpStream>> HttplibClient::open_stream(const std::string &url,
                                                                            const Headers &headers) {
        auto parsed = utils::Url::parse(url);
        auto state = std::make_shared<StreamState>(co_await asio::this_coro::executor);
        state->client = make_client(parsed, options_, options_.stream_idle_timeout_s);

        std::string content_type;
        auto request_headers = to_httplib(headers, content_type);
        asio::post(workers_, [this, state, parsed, request_headers]() {
            std::string error;
            try {
                ActiveRequest active(*this, *state->client);
                auto result = state->client->Get(
                        parsed.target, request_headers,
                        [&state](const httplib::Response &response) {
                            state->deliver([head = to_head(response)](StreamState &s) mutable { s.head = std::move(head); });
                            return !state->closed;
                        },
                        [&state](const char *data, std::size_t length) {
                            state->deliver([chunk = std::string(data, length)](StreamState &s) mutable {
                                s.chunks.push_back(std::move(chunk));
                            });
                            return !state->closed;
                        });
                if (!result && !state->closed) {
                    error = "GET " + parsed.str() + " failed: " + httplib::to_string(result.error());
                }
            } catch (const std::exception &e) {
                error = e.what();
            }
            state->deliver([error](StreamState &s) {
                s.finished = true;
                s.error = error;
            });
        });

        while (!state->head && !state->finished) {
            co_await state->wait();
        }
        if (!state->head) {
            state->closed = true;
            throw HttpError(state->error.empty() ? "No response from " + parsed.str() : state->error);
        }
        co_return std::make_unique<HttplibStream>(state);
    }

}// namespace bridge::transport
