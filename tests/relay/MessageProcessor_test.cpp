#include <gtest/gtest.h>
#include "relay/MessageProcessor.hpp"
#include "helpers/RecordingEventLogger.hpp"

using namespace mcpgate;

namespace {

ProcessorConfig fake(const std::string& name, const std::string& mode) {
    ProcessorConfig config;
    config.name = name;
    config.type = "cli";
    config.timeout = 5;
    config.config = {{"command", FAKE_PROCESSOR_PATH}, {"args", json::array({mode})}};
    return config;
}

Message make_message(Direction direction, const std::string& raw) {
    Message message;
    message.direction = direction;
    message.type = classify_frame(raw, direction);
    message.raw = raw;
    message.session_id = "session_1";
    return message;
}

} // namespace

class MessageProcessorTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingEventLogger> events_ = std::make_shared<RecordingEventLogger>();

    MessageProcessor processor_with(std::vector<ProcessorConfig> processors) {
        auto chain = std::make_shared<Chain>(std::move(processors), "server", "session_1",
                                             Transport::Stdio, Executor("."));
        return MessageProcessor(chain, events_);
    }
};

TEST_F(MessageProcessorTest, NoProcessorsForwardsRawFrame) {
    MessageProcessor processor = processor_with({});
    const std::string raw = R"({"id":1,  "method":"tools/list"})";

    FrameDecision decision = processor.process(make_message(Direction::ClientToServer, raw));
    EXPECT_EQ(decision.action, FrameAction::Forward);
    EXPECT_EQ(decision.frame, raw);
    EXPECT_FALSE(decision.modified);

    auto events = events_->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].request_id, 1);
    EXPECT_EQ(events[0].raw_message, raw);
    EXPECT_TRUE(events[0].success);
}

TEST_F(MessageProcessorTest, UnchangedPayloadKeepsOriginalText) {
    MessageProcessor processor = processor_with({fake("p", "passthrough")});
    const std::string raw = R"({"id":1,  "method":"tools/list"})";

    FrameDecision decision = processor.process(make_message(Direction::ClientToServer, raw));
    EXPECT_EQ(decision.action, FrameAction::Forward);
    EXPECT_EQ(decision.frame, raw);
    EXPECT_FALSE(decision.modified);
}

TEST_F(MessageProcessorTest, ModifiedPayloadIsReserialized) {
    MessageProcessor processor = processor_with({fake("t", "transformer")});

    FrameDecision decision = processor.process(
        make_message(Direction::ServerToClient, R"({"id":1,"result":{}})"));
    EXPECT_EQ(decision.action, FrameAction::Forward);
    EXPECT_TRUE(decision.modified);
    EXPECT_TRUE(json::parse(decision.frame)["transformed"].get<bool>());

    auto events = events_->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(events[0].modified);
    EXPECT_EQ(events[0].direction, Direction::ServerToClient);
}

TEST_F(MessageProcessorTest, RejectedRequestIsAnsweredWithEnvelope) {
    MessageProcessor processor = processor_with({fake("validator", "validator")});

    FrameDecision decision = processor.process(
        make_message(Direction::ClientToServer, R"({"jsonrpc":"2.0","id":"req-7","method":"files/delete"})"));
    EXPECT_EQ(decision.action, FrameAction::Reply);
    EXPECT_EQ(decision.status, 403);

    json envelope = json::parse(decision.frame);
    EXPECT_EQ(envelope["id"], "req-7");
    EXPECT_EQ(envelope["error"]["code"], -32001);
    EXPECT_EQ(envelope["error"]["data"]["rejection_reason"], "Delete operations not allowed");

    auto events = events_->events();
    ASSERT_EQ(events.size(), 1);
    EXPECT_FALSE(events[0].success);
    EXPECT_EQ(events[0].status, 403);
    EXPECT_EQ(events[0].error, "Delete operations not allowed");
}

TEST_F(MessageProcessorTest, FailedResponseIsReplacedByEnvelope) {
    MessageProcessor processor = processor_with({fake("bad", "bad-status")});

    FrameDecision decision = processor.process(
        make_message(Direction::ServerToClient, R"({"jsonrpc":"2.0","id":4,"result":{"ok":true}})"));
    EXPECT_EQ(decision.action, FrameAction::Forward);
    EXPECT_EQ(decision.status, 500);

    json envelope = json::parse(decision.frame);
    EXPECT_EQ(envelope["id"], 4);
    EXPECT_EQ(envelope["error"]["code"], -32603);
    EXPECT_FALSE(envelope.contains("result"));
}

TEST_F(MessageProcessorTest, BinaryStderrStillYieldsEnvelope) {
    MessageProcessor processor = processor_with({fake("binary", "invalid-utf8")});

    FrameDecision decision;
    ASSERT_NO_THROW(decision = processor.process(
        make_message(Direction::ClientToServer, R"({"jsonrpc":"2.0","id":8,"method":"ping"})")));
    EXPECT_EQ(decision.action, FrameAction::Reply);
    EXPECT_EQ(decision.status, 500);

    json envelope = json::parse(decision.frame);
    EXPECT_EQ(envelope["id"], 8);
    const std::string reason = envelope["error"]["data"]["rejection_reason"].get<std::string>();
    EXPECT_NE(reason.find("broken bytes"), std::string::npos) << reason;
    EXPECT_NE(reason.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(MessageProcessorTest, RejectedNotificationIsDropped) {
    MessageProcessor processor = processor_with({fake("r", "reject")});

    FrameDecision decision = processor.process(
        make_message(Direction::ClientToServer, R"({"jsonrpc":"2.0","method":"notifications/cancelled"})"));
    EXPECT_EQ(decision.action, FrameAction::Drop);
    EXPECT_TRUE(decision.frame.empty());
}

TEST_F(MessageProcessorTest, UnparseableFrameIsForwardedUnchanged) {
    MessageProcessor processor = processor_with({fake("r", "reject")});

    FrameDecision decision = processor.process(make_message(Direction::ClientToServer, "garbage"));
    EXPECT_EQ(decision.action, FrameAction::Forward);
    EXPECT_EQ(decision.frame, "garbage");
}

TEST_F(MessageProcessorTest, NullLoggerIsAllowed) {
    auto chain = std::make_shared<Chain>(std::vector<ProcessorConfig>{}, "server", "session_1");
    MessageProcessor processor(chain, nullptr);

    FrameDecision decision = processor.process(make_message(Direction::ClientToServer, R"({"id":1})"));
    EXPECT_EQ(decision.action, FrameAction::Forward);
    EXPECT_FALSE(processor.has_processors());
}
