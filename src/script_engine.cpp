#include "clinic_relay/script_engine.hpp"

#include <crow/logging.h>

using json = nlohmann::json;

namespace clinic_relay {

ScriptEngine::ScriptEngine(json script, std::chrono::milliseconds interval, EventSink sink)
    : script_(std::move(script)), interval_(interval), sink_(std::move(sink)) {
    if (!script_.is_array()) {
        throw EngineError("Playback script must be a JSON array");
    }
}

void ScriptEngine::run() {
    std::size_t emitted = 0;
    for (const auto& element : script_) {
        if (emitted > 0 || element.contains("delay_ms")) {
            auto delay = interval_;
            if (element.is_object() && element.contains("delay_ms") &&
                element["delay_ms"].is_number_integer()) {
                delay = std::chrono::milliseconds(element["delay_ms"].get<std::int64_t>());
            }
            if (!wait_for(delay)) break;
        }
        sink_(element.is_object() ? element : json{{"type", "script"}, {"data", element}});
        ++emitted;
    }

    bool stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped = stopping_;
    }
    live_ = false;
    CROW_LOG_INFO << "[playback] emitted " << emitted << " of " << script_.size()
                  << " script events (" << audio_bytes_.load() << " audio bytes received)";
    if (!stopped) {
        sink_(json{{"type", "status"}, {"status", "finished"}});
    }
}

bool ScriptEngine::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return finishing_ || stopping_; });
    return !finishing_ && !stopping_;
}

bool ScriptEngine::feed(std::string chunk) {
    if (!live_) return false;
    audio_bytes_ += chunk.size();
    return true;
}

void ScriptEngine::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishing_ = true;
    }
    live_ = false;
    cv_.notify_all();
}

void ScriptEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    live_ = false;
    cv_.notify_all();
}

EngineFactory make_script_factory(DocumentStore& documents, std::chrono::milliseconds interval) {
    return [&documents, interval](const SessionSeed& seed,
                                  EventSink sink) -> std::unique_ptr<RecognitionEngine> {
        std::string script_file = "scenario_script.json";
        if (seed.options.is_object() && seed.options.contains("script_file") &&
            seed.options["script_file"].is_string()) {
            script_file = seed.options["script_file"].get<std::string>();
        }

        auto document = documents.get(seed.patient_id, script_file);
        if (!document) {
            throw DocumentError("No playback script " + script_file + " for patient " +
                                seed.patient_id);
        }
        json script = json::parse(document->content, nullptr, false);
        if (script.is_discarded()) {
            throw EngineError("Playback script " + script_file + " is not valid JSON");
        }
        CROW_LOG_INFO << "[playback] loaded " << script_file << " for " << seed.patient_id;
        return std::make_unique<ScriptEngine>(std::move(script), interval, std::move(sink));
    };
}

} // namespace clinic_relay
