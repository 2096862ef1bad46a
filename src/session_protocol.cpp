#include "clinic_relay/session_protocol.hpp"

#include <crow/logging.h>

using json = nlohmann::json;

namespace clinic_relay {

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Active:
        return "active";
    case SessionState::Finishing:
        return "finishing";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

SessionProtocol::SessionProtocol(std::shared_ptr<Outbound> outbound, DocumentStore& documents,
                                 EngineFactory factory, ProtocolOptions options)
    : outbound_(std::move(outbound)),
      documents_(documents),
      factory_(std::move(factory)),
      options_(std::move(options)) {}

SessionProtocol::~SessionProtocol() {
    teardown();
}

// ============================================================================
// FRAME DISPATCH
// ============================================================================

void SessionProtocol::on_text(const std::string& frame) {
    if (state_ == SessionState::Closed) return;
    reap_exited_session();

    json message = json::parse(frame, nullptr, false);
    if (message.is_discarded()) {
        CROW_LOG_ERROR << "[" << options_.variant << "] received invalid JSON from client ("
                       << frame.size() << " bytes)";
        return;
    }
    if (!message.is_object()) return;

    // Manual stop signal: {"status": true}
    auto status = message.find("status");
    if (status != message.end() && status->is_boolean() && status->get<bool>()) {
        handle_stop();
        return;
    }

    auto type = message.find("type");
    if (type != message.end() && type->is_string() && type->get<std::string>() == "start") {
        handle_start(message);
    }
}

void SessionProtocol::on_binary(std::string frame) {
    if (state_ == SessionState::Closed) return;
    reap_exited_session();

    if (state_ == SessionState::Active && bridge_ && bridge_->live() &&
        bridge_->feed(std::move(frame))) {
        ++forwarded_chunks_;
        return;
    }
    ++dropped_chunks_;
}

void SessionProtocol::on_close(const std::string& reason) {
    if (state_ == SessionState::Closed) return;
    CROW_LOG_INFO << "[" << options_.variant << "] client disconnected"
                  << (reason.empty() ? "" : ": ") << reason;
    teardown();
}

void SessionProtocol::on_error(const std::string& what) {
    if (state_ == SessionState::Closed) return;
    CROW_LOG_ERROR << "[" << options_.variant << "] connection error: " << what;
    teardown();
}

// ============================================================================
// CONTROL MESSAGES
// ============================================================================

void SessionProtocol::handle_start(const json& message) {
    if (bridge_) {
        CROW_LOG_WARNING << "[" << options_.variant << "] start ignored, session for "
                         << patient_id_ << " is " << to_string(state_);
        send_system("Session already running for " + patient_id_);
        return;
    }

    std::string patient_id = options_.default_patient_id;
    auto pid = message.find("patient_id");
    if (pid != message.end() && pid->is_string() && !pid->get<std::string>().empty()) {
        patient_id = pid->get<std::string>();
    }
    CROW_LOG_INFO << "[" << options_.variant << "] starting session for " << patient_id;

    try {
        SessionSeed seed{patient_id, documents_.seed_context(patient_id), message};
        auto bridge = std::make_unique<SessionBridge>(std::move(seed), factory_, outbound_);
        // The acknowledgment rides the bridge's event queue so it precedes every engine event.
        bridge->start(system_message(options_.variant + " initialized for " + patient_id));
        bridge_ = std::move(bridge);
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "[" << options_.variant << "] failed to start session for "
                       << patient_id << ": " << e.what();
        send_system("Failed to start session for " + patient_id + ": " + e.what());
        return;
    }

    patient_id_ = patient_id;
    state_ = SessionState::Active;
}

void SessionProtocol::handle_stop() {
    if (state_ == SessionState::Active && bridge_) {
        CROW_LOG_INFO << "[" << options_.variant << "] client requested end of session for "
                      << patient_id_;
        bridge_->finish();
        state_ = SessionState::Finishing;
        return;
    }
    if (state_ == SessionState::Finishing) {
        CROW_LOG_INFO << "[" << options_.variant << "] session already finishing";
        return;
    }
    CROW_LOG_WARNING << "[" << options_.variant
                     << "] client sent stop signal, but no session is running";
    send_system("No active session to stop.");
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SessionProtocol::reap_exited_session() {
    if (!bridge_ || !bridge_->exited()) return;

    if (bridge_->failed()) {
        CROW_LOG_WARNING << "[" << options_.variant << "] session for " << patient_id_
                         << " ended by engine failure";
    } else {
        CROW_LOG_INFO << "[" << options_.variant << "] session for " << patient_id_ << " finished";
    }
    bridge_->stop();
    bridge_.reset();
    state_ = SessionState::Idle;
}

void SessionProtocol::teardown() {
    if (state_ == SessionState::Closed) return;
    if (bridge_) {
        CROW_LOG_INFO << "[" << options_.variant << "] stopping engine for " << patient_id_;
        bridge_->stop();
        bridge_.reset();
    }
    state_ = SessionState::Closed;
}

void SessionProtocol::send_system(const std::string& message) {
    try {
        outbound_->send_text(system_message(message));
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "[" << options_.variant << "] could not send system message: "
                         << e.what();
    }
}

} // namespace clinic_relay
