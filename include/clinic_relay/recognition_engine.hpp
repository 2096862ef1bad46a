#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace clinic_relay {

/// Raised when an engine cannot be constructed or loses its backend.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Everything an engine needs to start a session for one patient.
struct SessionSeed {
    std::string patient_id;
    std::string patient_info;  // seed document text
    nlohmann::json options;    // the start frame, variant-specific fields included
};

/// Receives engine events. Called from the engine's own threads.
using EventSink = std::function<void(nlohmann::json)>;

/// A recognition backend driven by one session.
///
/// run() is the blocking ingestion routine and executes on a thread owned by
/// the SessionBridge. feed(), finish(), stop() and live() are called from the
/// connection's thread and must not block on run().
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    /// Consumes audio until finished or stopped. May throw EngineError.
    virtual void run() = 0;

    /// Queues a chunk. false if the engine no longer accepts audio.
    virtual bool feed(std::string chunk) = 0;

    /// Stop accepting audio and flush pending results, then let run() return.
    virtual void finish() = 0;

    /// Make run() return as soon as possible, abandoning pending work.
    virtual void stop() = 0;

    virtual bool live() const = 0;
};

using EngineFactory =
    std::function<std::unique_ptr<RecognitionEngine>(const SessionSeed&, EventSink)>;

} // namespace clinic_relay
