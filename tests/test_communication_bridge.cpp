// EN: Unit tests for the in-process communication bridge
// FR: Tests unitaires du pont de communication intra-processus

#include <gtest/gtest.h>

#include "orchestrator/communication_bridge.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace CKW;
using namespace CKW::Orchestrator;
using nlohmann::json;

namespace {

ToolMessage makeMessage(const std::string& id, const std::string& to = "generate_dockerfile") {
    ToolMessage message;
    message.id = id;
    message.from = "build_image";
    message.to = to;
    message.type = "coordination_request";
    message.payload = {{"fix_errors", "true"}};
    message.timestamp = TimeUtils::fromUnixMicros(1700000000000000LL);
    message.correlation_id = "coord-" + id;
    return message;
}

} // namespace

class CommunicationBridgeTest : public ::testing::Test {
protected:
    Testing::LogCapture capture_{LogLevel::WARN};
    InProcessCommunicationBridge bridge_{2};
};

TEST_F(CommunicationBridgeTest, HandlerReceivesMessageSynchronously) {
    std::vector<ToolMessage> received;
    bridge_.registerHandler("generate_dockerfile", [&received](const CancellationToken&, const ToolMessage& m) {
        received.push_back(m);
    });

    bridge_.send(CancellationToken(), "build_image", "generate_dockerfile", makeMessage("m1"));
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].correlation_id, "coord-m1");
    EXPECT_EQ(bridge_.pendingCount("generate_dockerfile"), 0u);
}

TEST_F(CommunicationBridgeTest, MessagesQueueWithoutHandlerAndDrainInOrder) {
    bridge_.send(CancellationToken(), "build_image", "generate_dockerfile", makeMessage("m1"));
    bridge_.send(CancellationToken(), "build_image", "generate_dockerfile", makeMessage("m2"));
    EXPECT_EQ(bridge_.pendingCount("generate_dockerfile"), 2u);

    auto pending = bridge_.getPendingMessages("generate_dockerfile");
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, "m1");
    EXPECT_EQ(pending[1].id, "m2");
    EXPECT_TRUE(bridge_.getPendingMessages("generate_dockerfile").empty());
}

TEST_F(CommunicationBridgeTest, FullQueueRejectsDelivery) {
    bridge_.send(CancellationToken(), "a", "b", makeMessage("m1", "b"));
    bridge_.send(CancellationToken(), "a", "b", makeMessage("m2", "b"));
    try {
        bridge_.send(CancellationToken(), "a", "b", makeMessage("m3", "b"));
        FAIL() << "Expected CommunicationError";
    } catch (const CommunicationError& e) {
        EXPECT_EQ(e.from(), "a");
        EXPECT_EQ(e.to(), "b");
    }
}

TEST_F(CommunicationBridgeTest, CancelledOrAddresslessSendFails) {
    CancellationSource source;
    source.cancel();
    EXPECT_THROW(bridge_.send(source.token(), "a", "b", makeMessage("m1", "b")), CommunicationError);
    EXPECT_THROW(bridge_.send(CancellationToken(), "a", "", makeMessage("m1", "")), CommunicationError);
    EXPECT_EQ(bridge_.pendingCount("b"), 0u);
}

TEST_F(CommunicationBridgeTest, FailingHandlerBecomesCommunicationError) {
    bridge_.registerHandler("b", [](const CancellationToken&, const ToolMessage&) {
        throw std::runtime_error("tool offline");
    });
    try {
        bridge_.send(CancellationToken(), "a", "b", makeMessage("m1", "b"));
        FAIL() << "Expected CommunicationError";
    } catch (const CommunicationError& e) {
        EXPECT_NE(std::string(e.what()).find("tool offline"), std::string::npos);
    }
    EXPECT_EQ(capture_.count(LogLevel::WARN, "communication_bridge"), 1u);
}

TEST_F(CommunicationBridgeTest, UnregisteredHandlerFallsBackToQueue) {
    bridge_.registerHandler("b", [](const CancellationToken&, const ToolMessage&) {});
    EXPECT_TRUE(bridge_.unregisterHandler("b"));
    EXPECT_FALSE(bridge_.unregisterHandler("b"));

    bridge_.send(CancellationToken(), "a", "b", makeMessage("m1", "b"));
    EXPECT_EQ(bridge_.pendingCount("b"), 1u);
}

TEST_F(CommunicationBridgeTest, RegistrationValidatesArguments) {
    EXPECT_THROW(bridge_.registerHandler("", [](const CancellationToken&, const ToolMessage&) {}),
                 std::invalid_argument);
    EXPECT_THROW(bridge_.registerHandler("b", MessageHandler()), std::invalid_argument);
}

TEST(ToolMessageTest, JsonRoundTrip) {
    ToolMessage message = makeMessage("m1");
    message.reply_to = "m0";
    json j = message;
    EXPECT_EQ(j["correlation"], "coord-m1");
    EXPECT_EQ(j["timestamp"], "2023-11-14T22:13:20.000000Z");

    ToolMessage decoded = j.get<ToolMessage>();
    EXPECT_EQ(decoded.id, "m1");
    EXPECT_EQ(decoded.reply_to, "m0");
    EXPECT_EQ(decoded.correlation_id, "coord-m1");
    EXPECT_EQ(decoded.payload, message.payload);
    EXPECT_EQ(decoded.timestamp, message.timestamp);

    ToolMessage sparse = json{{"id", "x"}, {"context", "bad"}}.get<ToolMessage>();
    EXPECT_TRUE(sparse.context.is_object());
    EXPECT_TRUE(sparse.correlation_id.empty());
}
