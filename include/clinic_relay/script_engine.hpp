#pragma once

#include "clinic_relay/document_store.hpp"
#include "clinic_relay/recognition_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace clinic_relay {

/// Scripted playback: replays a JSON array as timed events instead of
/// recognizing audio. Elements that are objects are emitted unchanged; an
/// element's "delay_ms" overrides the pause before it.
class ScriptEngine : public RecognitionEngine {
public:
    ScriptEngine(nlohmann::json script, std::chrono::milliseconds interval, EventSink sink);

    void run() override;
    bool feed(std::string chunk) override;
    void finish() override;
    void stop() override;
    bool live() const override { return live_.load(); }

    std::uint64_t audio_bytes() const { return audio_bytes_.load(); }

private:
    /// false when woken by finish() or stop().
    bool wait_for(std::chrono::milliseconds delay);

    nlohmann::json script_;
    std::chrono::milliseconds interval_;
    EventSink sink_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool finishing_ = false;
    bool stopping_ = false;

    std::atomic<bool> live_{true};
    std::atomic<std::uint64_t> audio_bytes_{0};
};

/// Factory for the playback endpoint. Loads the start frame's "script_file"
/// (default scenario_script.json) from the patient's documents.
EngineFactory make_script_factory(DocumentStore& documents, std::chrono::milliseconds interval);

} // namespace clinic_relay
