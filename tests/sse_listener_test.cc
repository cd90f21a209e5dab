#include "core/endpoint_router.h"
#include "fake_http_client.h"
#include "protocol/event_classifier.h"
#include "protocol/frame_error.h"
#include "transport/sse_listener.h"
#include <gtest/gtest.h>

using namespace bridge;
using bridge::test::CaptureSink;
using bridge::test::FakeHttpClient;
using bridge::test::run_to_completion;
using bridge::test::StreamScript;

class SseListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<FakeHttpClient>();
    }

    std::unique_ptr<transport::SseListener> make_listener(std::size_t max_event_size = 0) {
        return std::make_unique<transport::SseListener>(client, sse_url, router, sink, classifier, max_event_size);
    }

    void add_stream(std::vector<std::string> chunks, int status = 200) {
        StreamScript script;
        script.status = status;
        script.chunks = std::move(chunks);
        client->streams.push_back(std::move(script));
    }

    const std::string sse_url = "http://localhost:9000/sse";
    asio::io_context io;
    core::EndpointRouter router{sse_url};
    protocol::EventClassifier classifier;
    CaptureSink sink;
    std::shared_ptr<FakeHttpClient> client;
};

TEST_F(SseListenerTest, RequestsEventStream) {
    add_stream({});
    auto listener = make_listener();
    run_to_completion(io, listener->run());

    ASSERT_EQ(client->stream_requests.size(), 1u);
    EXPECT_EQ(client->stream_requests[0].url, sse_url);
    EXPECT_EQ(client->stream_requests[0].header("Accept"), "text/event-stream");
}

TEST_F(SseListenerTest, EndpointThenNotification) {
    add_stream({"event: endpoint\ndata: /messages?sessionId=1\n\n",
                "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"level\":\"info\"}}\n\n"});
    auto listener = make_listener();

    bool streaming = false;
    run_to_completion(io, listener->run([&streaming]() { streaming = true; }));

    EXPECT_TRUE(streaming);
    EXPECT_EQ(router.current(), "http://localhost:9000/messages?sessionId=1");
    ASSERT_EQ(sink.messages.size(), 1u);
    EXPECT_EQ(sink.messages[0], R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})");
    EXPECT_EQ(listener->forwarded(), 1u);
}

TEST_F(SseListenerTest, AbsoluteEndpointReplacesTarget) {
    add_stream({"event: endpoint\r\ndata: https://other.example.com/rpc\r\n\r\n"});
    auto listener = make_listener();
    run_to_completion(io, listener->run());

    EXPECT_EQ(router.current(), "https://other.example.com/rpc");
    EXPECT_TRUE(sink.messages.empty());
}

TEST_F(SseListenerTest, SuppressedNotificationsNeverReachSink) {
    add_stream({"data: {\"jsonrpc\":\"2.0\",\"method\":\"connection/ready\"}\n\n",
                "data: {\"jsonrpc\":\"2.0\",\"method\":\"server/capabilities\",\"params\":{}}\n\n",
                "data: {\"jsonrpc\":\"2.0\",\"id\":5,\"result\":{}}\n\n"});
    auto listener = make_listener();
    run_to_completion(io, listener->run());

    ASSERT_EQ(sink.messages.size(), 1u);
    EXPECT_EQ(sink.messages[0], R"({"jsonrpc":"2.0","id":5,"result":{}})");
    EXPECT_EQ(listener->suppressed(), 2u);
}

TEST_F(SseListenerTest, EventSplitAcrossReads) {
    add_stream({"data: {\"id\":", "7}\n", "\n", "data: plain text\n\n"});
    auto listener = make_listener();
    run_to_completion(io, listener->run());

    ASSERT_EQ(sink.messages.size(), 2u);
    EXPECT_EQ(sink.messages[0], R"({"id":7})");
    EXPECT_EQ(sink.messages[1], "plain text");
}

TEST_F(SseListenerTest, EndpointWithoutDataIsIgnored) {
    add_stream({"event: endpoint\ndata:\n\n"});
    auto listener = make_listener();
    run_to_completion(io, listener->run());

    EXPECT_EQ(router.current(), "http://localhost:9000/mcp");
    EXPECT_EQ(router.generation(), 0u);
}

TEST_F(SseListenerTest, ErrorStatusThrows) {
    add_stream({"data: never read\n\n"}, 503);
    auto listener = make_listener();

    bool streaming = false;
    EXPECT_THROW(run_to_completion(io, listener->run([&streaming]() { streaming = true; })), transport::HttpError);
    EXPECT_FALSE(streaming);
    EXPECT_TRUE(sink.messages.empty());
}

TEST_F(SseListenerTest, ConnectFailureThrows) {
    auto listener = make_listener();
    EXPECT_THROW(run_to_completion(io, listener->run()), std::runtime_error);
}

TEST_F(SseListenerTest, OversizedEventThrows) {
    add_stream({"data: " + std::string(64, 'x')});
    auto listener = make_listener(32);
    EXPECT_THROW(run_to_completion(io, listener->run()), protocol::FrameTooLarge);
}

TEST_F(SseListenerTest, StopClosesOpenStream) {
    StreamScript script;
    script.chunks = {"data: {\"id\":1}\n\n"};
    script.hold_open = true;
    client->streams.push_back(script);
    auto listener = make_listener();

    asio::steady_timer timer(io, std::chrono::milliseconds(20));
    timer.async_wait([&listener](const asio::error_code &) { listener->stop(); });

    EXPECT_THROW(run_to_completion(io, listener->run()), std::system_error);
    ASSERT_EQ(sink.messages.size(), 1u);
    EXPECT_EQ(sink.messages[0], R"({"id":1})");
}
