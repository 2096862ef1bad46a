#include "clinic_relay/session_bridge.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

namespace clinic_relay {
namespace {

using testing::eventually;
using testing::FakeEngineFactory;
using testing::RecordingOutbound;

class SessionBridgeTest : public ::testing::Test {
protected:
    std::unique_ptr<SessionBridge> make_bridge() {
        return std::make_unique<SessionBridge>(
            SessionSeed{"P0001", "# Patient Profile", json{{"type", "start"}}},
            engines_.factory(), outbound_);
    }

    FakeEngineFactory engines_;
    std::shared_ptr<RecordingOutbound> outbound_ = std::make_shared<RecordingOutbound>();
};

TEST_F(SessionBridgeTest, StartRunsEngineOnItsOwnThread) {
    auto bridge = make_bridge();
    bridge->start();

    ASSERT_EQ(engines_.created(), 1u);
    auto log = engines_.log(0);
    EXPECT_TRUE(eventually([&] { return log->running.load(); }));
    EXPECT_TRUE(bridge->live());
    EXPECT_EQ(log->seed.patient_id, "P0001");
    EXPECT_EQ(log->seed.patient_info, "# Patient Profile");
}

TEST_F(SessionBridgeTest, EventsArriveInProductionOrder) {
    std::vector<json> produced;
    for (int i = 0; i < 200; ++i) produced.push_back(json{{"type", "transcript"}, {"seq", i}});
    engines_.events_on_run = produced;

    auto bridge = make_bridge();
    bridge->start();

    ASSERT_TRUE(eventually([&] { return outbound_->count() == produced.size(); }));
    auto delivered = outbound_->messages();
    EXPECT_EQ(delivered, produced);
}

TEST_F(SessionBridgeTest, GreetingPrecedesEngineEvents) {
    engines_.events_on_run = {json{{"seq", 1}}, json{{"seq", 2}}};

    auto bridge = make_bridge();
    bridge->start(system_message("ready"));

    ASSERT_TRUE(eventually([&] { return outbound_->count() == 3u; }));
    auto delivered = outbound_->messages();
    EXPECT_EQ(delivered[0], json({{"type", "system"}, {"message", "ready"}}));
    EXPECT_EQ(delivered[1]["seq"], 1);
    EXPECT_EQ(delivered[2]["seq"], 2);
}

TEST_F(SessionBridgeTest, FailedStartSendsNoGreeting) {
    engines_.fail_construction = true;
    auto bridge = make_bridge();

    EXPECT_THROW(bridge->start(system_message("ready")), EngineError);
    EXPECT_EQ(outbound_->count(), 0u);
}

TEST_F(SessionBridgeTest, FeedReachesEngineOnlyWhileLive) {
    auto bridge = make_bridge();
    bridge->start();

    EXPECT_TRUE(bridge->feed("chunk-1"));
    bridge->finish();
    EXPECT_FALSE(bridge->feed("chunk-2"));

    EXPECT_EQ(engines_.log(0)->chunks(), std::vector<std::string>{"chunk-1"});
    EXPECT_EQ(engines_.log(0)->finish_calls.load(), 1);
}

TEST_F(SessionBridgeTest, StopIsIdempotent) {
    auto bridge = make_bridge();
    bridge->start();
    auto log = engines_.log(0);

    bridge->stop();
    bridge->stop();
    bridge.reset(); // destructor stops again

    EXPECT_EQ(log->stop_calls.load(), 1);
    EXPECT_EQ(log->destroyed.load(), 1);
    EXPECT_FALSE(log->running.load());
}

TEST_F(SessionBridgeTest, StopAfterEngineExitedOnItsOwn) {
    auto bridge = make_bridge();
    bridge->start();
    auto log = engines_.log(0);
    ASSERT_TRUE(eventually([&] { return log->running.load(); }));

    engines_.engine(0)->end(false);
    ASSERT_TRUE(eventually([&] { return bridge->exited(); }));
    EXPECT_FALSE(bridge->failed());
    EXPECT_FALSE(bridge->live());

    bridge->stop();
    bridge->stop();
    EXPECT_EQ(log->destroyed.load(), 1);
}

TEST_F(SessionBridgeTest, EngineFailureIsReportedAndContained) {
    auto bridge = make_bridge();
    bridge->start();
    ASSERT_TRUE(eventually([&] { return engines_.log(0)->running.load(); }));

    engines_.engine(0)->end(true);

    ASSERT_TRUE(eventually([&] { return bridge->exited(); }));
    EXPECT_TRUE(bridge->failed());
    EXPECT_TRUE(eventually([&] {
        return outbound_->system_messages_containing("simulated engine failure") == 1;
    }));
    bridge->stop();
}

TEST_F(SessionBridgeTest, FactoryFailurePropagatesFromStart) {
    engines_.fail_construction = true;
    auto bridge = make_bridge();

    EXPECT_THROW(bridge->start(), EngineError);
    EXPECT_FALSE(bridge->live());
    EXPECT_FALSE(bridge->feed("chunk"));
    bridge->stop();
}

TEST_F(SessionBridgeTest, SystemMessageShape) {
    EXPECT_EQ(json::parse(system_message("hello")),
              json({{"type", "system"}, {"message", "hello"}}));
}

} // namespace
} // namespace clinic_relay
