#pragma once

#include "clinic_relay/document_store.hpp"
#include "clinic_relay/outbound.hpp"
#include "clinic_relay/recognition_engine.hpp"
#include "clinic_relay/session_bridge.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace clinic_relay {

enum class SessionState { Idle, Active, Finishing, Closed };

const char* to_string(SessionState state);

struct ProtocolOptions {
    std::string variant = "Transcriber"; // used in acknowledgments and logs
    std::string default_patient_id = "P0001";
};

/// Per-connection frame dispatcher and session state machine.
///
///   Idle --start--> Active --{"status":true}--> Finishing
///   Active/Finishing --engine thread exits--> Idle
///   any --close/error--> Closed
///
/// All frame handlers are invoked from the connection's thread, one at a
/// time. None of them throws: failures are logged and reported to the client
/// as system frames.
class SessionProtocol {
public:
    SessionProtocol(std::shared_ptr<Outbound> outbound, DocumentStore& documents,
                    EngineFactory factory, ProtocolOptions options = {});
    ~SessionProtocol();

    SessionProtocol(const SessionProtocol&) = delete;
    SessionProtocol& operator=(const SessionProtocol&) = delete;

    void on_text(const std::string& frame);
    void on_binary(std::string frame);

    /// Transport disconnect.
    void on_close(const std::string& reason);

    /// Unrecoverable transport or handler error; same teardown as on_close.
    void on_error(const std::string& what);

    SessionState state() const { return state_; }
    const std::string& patient_id() const { return patient_id_; }

    std::uint64_t forwarded_chunks() const { return forwarded_chunks_; }
    std::uint64_t dropped_chunks() const { return dropped_chunks_; }

private:
    void handle_start(const nlohmann::json& message);
    void handle_stop();
    void reap_exited_session();
    void teardown();
    void send_system(const std::string& message);

    std::shared_ptr<Outbound> outbound_;
    DocumentStore& documents_;
    EngineFactory factory_;
    ProtocolOptions options_;

    SessionState state_ = SessionState::Idle;
    std::string patient_id_;
    std::unique_ptr<SessionBridge> bridge_;

    std::uint64_t forwarded_chunks_ = 0;
    std::uint64_t dropped_chunks_ = 0;
};

} // namespace clinic_relay
