#include "clinic_relay/script_engine.hpp"
#include "clinic_relay/session_protocol.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <thread>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace clinic_relay {
namespace {

using testing::eventually;
using testing::RecordingOutbound;

class Collector {
public:
    EventSink sink() {
        return [this](json event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        };
    }
    std::vector<json> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<json> events_;
};

TEST(ScriptEngineTest, ReplaysScriptThenReportsFinished) {
    Collector collector;
    json script = json::array({
        {{"role", "doctor"}, {"text", "How are you feeling?"}},
        {{"role", "patient"}, {"text", "Tired."}, {"delay_ms", 5}},
        "free text line"
    });
    ScriptEngine engine(script, 1ms, collector.sink());

    engine.run();

    auto events = collector.events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0], script[0]);
    EXPECT_EQ(events[1], script[1]);
    EXPECT_EQ(events[2], json({{"type", "script"}, {"data", "free text line"}}));
    EXPECT_EQ(events[3], json({{"type", "status"}, {"status", "finished"}}));
    EXPECT_FALSE(engine.live());
}

TEST(ScriptEngineTest, FinishEndsPlaybackEarly) {
    Collector collector;
    json script = json::array({{{"n", 1}}, {{"n", 2}}, {{"n", 3}}});
    ScriptEngine engine(script, 10s, collector.sink());

    std::thread runner([&engine] { engine.run(); });
    ASSERT_TRUE(eventually([&] { return collector.events().size() == 1; }));
    engine.finish();
    runner.join();

    auto events = collector.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], script[0]);
    EXPECT_EQ(events[1]["status"], "finished");
}

TEST(ScriptEngineTest, StopEndsPlaybackSilently) {
    Collector collector;
    ScriptEngine engine(json::array({{{"n", 1}}, {{"n", 2}}}), 10s, collector.sink());

    std::thread runner([&engine] { engine.run(); });
    ASSERT_TRUE(eventually([&] { return collector.events().size() == 1; }));
    engine.stop();
    runner.join();

    EXPECT_EQ(collector.events().size(), 1u);
}

TEST(ScriptEngineTest, CountsAudioWhileLive) {
    Collector collector;
    ScriptEngine engine(json::array(), 1ms, collector.sink());

    EXPECT_TRUE(engine.feed("abcd"));
    engine.finish();
    EXPECT_FALSE(engine.feed("efgh"));
    EXPECT_EQ(engine.audio_bytes(), 4u);
}

TEST(ScriptEngineTest, RejectsNonArrayScript) {
    Collector collector;
    EXPECT_THROW(ScriptEngine(json::object(), 1ms, collector.sink()), EngineError);
}

TEST(ScriptFactoryTest, PlaybackSessionStreamsPatientScript) {
    MemoryBlobStore blobs;
    DocumentStore documents(blobs);
    documents.put("P0007", "patient_info.md", "# Patient Profile");
    documents.put("P0007", "visit.json", R"([{"type":"transcript","text":"hello"}])");

    auto outbound = std::make_shared<RecordingOutbound>();
    SessionProtocol protocol(outbound, documents, make_script_factory(documents, 1ms),
                             ProtocolOptions{"Audio simulation", "P0001"});

    protocol.on_text(R"({"type":"start","patient_id":"P0007","script_file":"visit.json"})");
    EXPECT_EQ(protocol.state(), SessionState::Active);

    ASSERT_TRUE(eventually([&] {
        for (const auto& msg : outbound->messages()) {
            if (msg.value("status", "") == "finished") return true;
        }
        return false;
    }));
    EXPECT_EQ(outbound->system_messages_containing("Audio simulation initialized for P0007"), 1u);
    bool saw_line = false;
    for (const auto& msg : outbound->messages()) {
        if (msg.value("text", "") == "hello") saw_line = true;
    }
    EXPECT_TRUE(saw_line);
}

TEST(ScriptFactoryTest, MissingScriptFailsSessionStart) {
    MemoryBlobStore blobs;
    DocumentStore documents(blobs);
    documents.put("P0007", "patient_info.md", "# Patient Profile");

    auto outbound = std::make_shared<RecordingOutbound>();
    SessionProtocol protocol(outbound, documents, make_script_factory(documents, 1ms),
                             ProtocolOptions{"Audio simulation", "P0001"});

    protocol.on_text(R"({"type":"start","patient_id":"P0007"})");

    EXPECT_EQ(protocol.state(), SessionState::Idle);
    EXPECT_EQ(outbound->system_messages_containing("scenario_script.json"), 1u);
}

} // namespace
} // namespace clinic_relay
