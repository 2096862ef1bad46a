#pragma once

#include "clinic_relay/outbound.hpp"
#include "clinic_relay/recognition_engine.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace clinic_relay {

/// Owns one RecognitionEngine for the lifetime of a session.
///
/// The engine's run() executes on a dedicated thread. Events it emits are
/// queued and drained, in production order, into the connection's Outbound.
/// stop() tears everything down exactly once; later calls are no-ops.
class SessionBridge {
public:
    SessionBridge(SessionSeed seed, EngineFactory factory, std::shared_ptr<Outbound> outbound);
    ~SessionBridge();

    SessionBridge(const SessionBridge&) = delete;
    SessionBridge& operator=(const SessionBridge&) = delete;

    /// Builds the engine and launches its ingestion thread. A non-empty
    /// greeting frame is queued once the engine exists, ahead of any event.
    /// Throws if the engine cannot be constructed; nothing is sent then.
    void start(const std::string& greeting = "");

    /// false when the engine is not live; the chunk is discarded.
    bool feed(std::string chunk);

    void finish();
    void stop();

    bool live() const;

    /// The engine thread has returned, either normally or by failure.
    bool exited() const { return exited_.load(); }
    bool failed() const { return failed_.load(); }

    const std::string& patient_id() const { return seed_.patient_id; }

private:
    void run_engine();
    void deliver(nlohmann::json event);
    void deliver_frame(std::string frame);

    SessionSeed seed_;
    EngineFactory factory_;
    std::shared_ptr<Outbound> outbound_;

    std::unique_ptr<RecognitionEngine> engine_;
    std::thread worker_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> exited_{false};
    std::atomic<bool> failed_{false};

    std::mutex queue_mutex_;
    std::deque<std::string> pending_;
    std::mutex delivery_mutex_;
};

/// {"type":"system","message":...}
std::string system_message(const std::string& message);

} // namespace clinic_relay
