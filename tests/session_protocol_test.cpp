#include "clinic_relay/session_protocol.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

namespace clinic_relay {
namespace {

using testing::eventually;
using testing::FakeEngineFactory;
using testing::RecordingOutbound;

class SessionProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        documents_.put("P0001", "patient_info.md", "# Patient Profile\nName: Ada");
        documents_.put("P0042", "patient_info.md", "# Patient Profile\nName: Bob");
        protocol_ = std::make_unique<SessionProtocol>(outbound_, documents_, engines_.factory(),
                                                      ProtocolOptions{"Transcriber", "P0001"});
    }

    void start(const std::string& patient_id = "P0001") {
        protocol_->on_text(json{{"type", "start"}, {"patient_id", patient_id}}.dump());
    }

    MemoryBlobStore blobs_;
    DocumentStore documents_{blobs_};
    FakeEngineFactory engines_;
    std::shared_ptr<RecordingOutbound> outbound_ = std::make_shared<RecordingOutbound>();
    std::unique_ptr<SessionProtocol> protocol_;
};

TEST_F(SessionProtocolTest, AudioBeforeStartIsDropped) {
    for (int i = 0; i < 5; ++i) protocol_->on_binary("pcm");

    EXPECT_EQ(engines_.created(), 0u);
    EXPECT_EQ(protocol_->dropped_chunks(), 5u);
    EXPECT_EQ(protocol_->state(), SessionState::Idle);

    start();
    EXPECT_TRUE(engines_.log(0)->chunks().empty());
}

TEST_F(SessionProtocolTest, StartActivatesSessionAndAcknowledges) {
    start("P0042");

    EXPECT_EQ(protocol_->state(), SessionState::Active);
    EXPECT_EQ(protocol_->patient_id(), "P0042");
    ASSERT_EQ(engines_.created(), 1u);
    EXPECT_EQ(engines_.log(0)->seed.patient_info, "# Patient Profile\nName: Bob");
    EXPECT_EQ(engines_.log(0)->seed.options["type"], "start");
    EXPECT_EQ(outbound_->system_messages_containing("Transcriber initialized for P0042"), 1u);
}

TEST_F(SessionProtocolTest, StartWithoutPatientIdUsesDefault) {
    protocol_->on_text(R"({"type":"start"})");

    EXPECT_EQ(protocol_->state(), SessionState::Active);
    EXPECT_EQ(protocol_->patient_id(), "P0001");
}

TEST_F(SessionProtocolTest, AudioAfterStartReachesEngine) {
    start();
    protocol_->on_binary("chunk-1");
    protocol_->on_binary("chunk-2");

    EXPECT_EQ(engines_.log(0)->chunks(), (std::vector<std::string>{"chunk-1", "chunk-2"}));
    EXPECT_EQ(protocol_->forwarded_chunks(), 2u);
}

TEST_F(SessionProtocolTest, SecondStartLeavesOriginalEngineInCharge) {
    start("P0001");
    start("P0042");

    EXPECT_EQ(engines_.created(), 1u);
    EXPECT_EQ(protocol_->patient_id(), "P0001");
    EXPECT_EQ(outbound_->system_messages_containing("already running"), 1u);

    protocol_->on_binary("chunk");
    EXPECT_EQ(engines_.log(0)->chunks(), std::vector<std::string>{"chunk"});
}

TEST_F(SessionProtocolTest, MalformedJsonKeepsActiveSession) {
    start();
    protocol_->on_text(R"({"type":)");
    protocol_->on_text("not json at all");

    EXPECT_EQ(protocol_->state(), SessionState::Active);
    EXPECT_EQ(engines_.log(0)->stop_calls.load(), 0);

    protocol_->on_binary("after-garbage");
    EXPECT_EQ(engines_.log(0)->chunks(), std::vector<std::string>{"after-garbage"});
}

TEST_F(SessionProtocolTest, UnrecognizedShapesAreIgnored) {
    protocol_->on_text(R"({"type":"pause"})");
    protocol_->on_text(R"({"status":false})");
    protocol_->on_text(R"([1,2,3])");
    protocol_->on_text(R"("start")");

    EXPECT_EQ(protocol_->state(), SessionState::Idle);
    EXPECT_EQ(outbound_->count(), 0u);
    EXPECT_EQ(engines_.created(), 0u);
}

TEST_F(SessionProtocolTest, StopWithoutSessionWarns) {
    protocol_->on_text(R"({"status":true})");

    EXPECT_EQ(protocol_->state(), SessionState::Idle);
    EXPECT_EQ(outbound_->system_messages_containing("No active session"), 1u);
    EXPECT_EQ(engines_.created(), 0u);
}

TEST_F(SessionProtocolTest, StopSignalFinishesGracefully) {
    start();
    protocol_->on_text(R"({"status":true})");

    auto log = engines_.log(0);
    EXPECT_EQ(protocol_->state(), SessionState::Finishing);
    EXPECT_EQ(log->finish_calls.load(), 1);
    EXPECT_EQ(log->stop_calls.load(), 0);

    protocol_->on_binary("late audio");
    EXPECT_TRUE(log->chunks().empty());

    // A second stop while draining is not a warning.
    protocol_->on_text(R"({"status":true})");
    EXPECT_EQ(outbound_->system_messages_containing("No active session"), 0u);
}

TEST_F(SessionProtocolTest, FinishedSessionIsReapedAndCanRestart) {
    start();
    protocol_->on_text(R"({"status":true})");
    engines_.engine(0)->end(false);
    auto first = engines_.log(0);
    ASSERT_TRUE(eventually([&] { return !first->running.load() && first->runs.load() == 1; }));
    ASSERT_TRUE(eventually([&] {
        protocol_->on_binary("chunk");
        return protocol_->state() == SessionState::Idle;
    }));
    EXPECT_EQ(first->destroyed.load(), 1);

    start("P0042");
    EXPECT_EQ(protocol_->state(), SessionState::Active);
    EXPECT_EQ(engines_.created(), 2u);
}

TEST_F(SessionProtocolTest, EngineFailureEndsSessionWithoutClosingConnection) {
    start();
    ASSERT_TRUE(eventually([&] { return engines_.log(0)->running.load(); }));
    engines_.engine(0)->end(true);

    ASSERT_TRUE(eventually([&] {
        return outbound_->system_messages_containing("simulated engine failure") == 1;
    }));
    ASSERT_TRUE(eventually([&] {
        protocol_->on_binary("chunk");
        return protocol_->state() == SessionState::Idle;
    }));
    EXPECT_EQ(engines_.log(0)->destroyed.load(), 1);
}

TEST_F(SessionProtocolTest, MissingSeedContextFailsStart) {
    start("P9999");

    EXPECT_EQ(protocol_->state(), SessionState::Idle);
    EXPECT_EQ(engines_.created(), 0u);
    EXPECT_EQ(outbound_->system_messages_containing("Failed to start session for P9999"), 1u);

    protocol_->on_binary("chunk");
    EXPECT_EQ(protocol_->dropped_chunks(), 1u);
}

TEST_F(SessionProtocolTest, EngineConstructionFailureFailsStart) {
    engines_.fail_construction = true;
    start();

    EXPECT_EQ(protocol_->state(), SessionState::Idle);
    EXPECT_EQ(outbound_->system_messages_containing("engine unavailable"), 1u);
}

TEST_F(SessionProtocolTest, DisconnectTearsDownEngine) {
    start();
    auto log = engines_.log(0);

    protocol_->on_close("client went away");

    EXPECT_EQ(protocol_->state(), SessionState::Closed);
    EXPECT_EQ(log->stop_calls.load(), 1);
    EXPECT_EQ(log->destroyed.load(), 1);

    protocol_->on_binary("chunk");
    protocol_->on_text(R"({"type":"start"})");
    protocol_->on_close("again");
    EXPECT_EQ(engines_.created(), 1u);
    EXPECT_EQ(log->stop_calls.load(), 1);
}

TEST_F(SessionProtocolTest, ErrorTakesTheSameTeardownPath) {
    start();
    auto log = engines_.log(0);

    protocol_->on_error("broken pipe");

    EXPECT_EQ(protocol_->state(), SessionState::Closed);
    EXPECT_EQ(log->destroyed.load(), 1);
}

TEST_F(SessionProtocolTest, CloseAfterTransportErrorIsHarmless) {
    start();
    auto log = engines_.log(0);

    protocol_->on_error("connection reset by peer");
    protocol_->on_close("uncleanly");
    protocol_->on_error("late error");

    EXPECT_EQ(protocol_->state(), SessionState::Closed);
    EXPECT_EQ(log->stop_calls.load(), 1);
    EXPECT_EQ(log->destroyed.load(), 1);
    EXPECT_EQ(engines_.created(), 1u);
}

TEST_F(SessionProtocolTest, DestructionStopsRunningEngine) {
    start();
    auto log = engines_.log(0);

    protocol_.reset();

    EXPECT_EQ(log->stop_calls.load(), 1);
    EXPECT_EQ(log->destroyed.load(), 1);
}

TEST_F(SessionProtocolTest, EngineEventsReachTheClientInOrder) {
    engines_.events_on_run = {json{{"seq", 1}}, json{{"seq", 2}}, json{{"seq", 3}}};
    start();

    ASSERT_TRUE(eventually([&] { return outbound_->count() == 4u; }));
    auto messages = outbound_->messages();
    EXPECT_EQ(messages[0], json({{"type", "system"}, {"message", "Transcriber initialized for P0001"}}));
    EXPECT_EQ(messages[1]["seq"], 1);
    EXPECT_EQ(messages[2]["seq"], 2);
    EXPECT_EQ(messages[3]["seq"], 3);
}

} // namespace
} // namespace clinic_relay
