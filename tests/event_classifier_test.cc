#include "protocol/event_classifier.h"
#include <gtest/gtest.h>

using namespace bridge::protocol;

namespace {
    SseEvent make_event(std::optional<std::string> name, std::string data) {
        SseEvent event;
        event.name = std::move(name);
        event.data = std::move(data);
        return event;
    }
}// namespace

class EventClassifierTest : public ::testing::Test {
protected:
    EventClassifier classifier;
};

TEST_F(EventClassifierTest, EndpointEventIsDiscovery) {
    EXPECT_EQ(classifier.classify(make_event("endpoint", "/messages")), EventKind::ENDPOINT_DISCOVERY);
    // the name decides, not the payload
    EXPECT_EQ(classifier.classify(make_event("endpoint", "{\"method\":\"connection/ready\"}")), EventKind::ENDPOINT_DISCOVERY);
}

TEST_F(EventClassifierTest, DefaultMethodsAreSuppressed) {
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "{\"method\":\"connection/ready\"}")), EventKind::SUPPRESSED);
    EXPECT_EQ(classifier.classify(make_event("message", "{\"jsonrpc\":\"2.0\",\"method\":\"server/capabilities\",\"params\":{}}")),
              EventKind::SUPPRESSED);
}

TEST_F(EventClassifierTest, OtherMessagesPassThrough) {
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}")), EventKind::PASS_THROUGH);
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "{\"method\":\"notifications/progress\"}")), EventKind::PASS_THROUGH);
    EXPECT_EQ(classifier.classify(make_event("custom", "{\"method\":\"tools/list_changed\"}")), EventKind::PASS_THROUGH);
}

TEST_F(EventClassifierTest, NonJsonDataPassesThrough) {
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "not json at all")), EventKind::PASS_THROUGH);
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "{\"method\":\"connection/ready\"")), EventKind::PASS_THROUGH);
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "[\"connection/ready\"]")), EventKind::PASS_THROUGH);
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "{\"method\":42}")), EventKind::PASS_THROUGH);
    EXPECT_EQ(classifier.classify(make_event(std::nullopt, "")), EventKind::PASS_THROUGH);
}

TEST_F(EventClassifierTest, CustomSuppressionList) {
    EventClassifier custom({"notifications/message"});

    EXPECT_EQ(custom.classify(make_event(std::nullopt, "{\"method\":\"notifications/message\"}")), EventKind::SUPPRESSED);
    EXPECT_EQ(custom.classify(make_event(std::nullopt, "{\"method\":\"connection/ready\"}")), EventKind::PASS_THROUGH);
    EXPECT_TRUE(custom.is_suppressed_method("notifications/message"));
    EXPECT_EQ(custom.suppressed_methods().size(), 1u);
}

TEST_F(EventClassifierTest, KindNames) {
    EXPECT_STREQ(to_string(EventKind::ENDPOINT_DISCOVERY), "endpoint");
    EXPECT_STREQ(to_string(EventKind::SUPPRESSED), "suppressed");
    EXPECT_STREQ(to_string(EventKind::PASS_THROUGH), "pass-through");
}
