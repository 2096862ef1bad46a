#pragma once

#include "clinic_relay/document_store.hpp"
#include "clinic_relay/outbound.hpp"
#include "clinic_relay/session_protocol.hpp"

#include <crow.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace clinic_relay {

/// Outbound bound to a Crow connection. Crow's send_text() posts the frame
/// onto the connection's io context; detach() must run before Crow destroys
/// the connection, after which frames are dropped.
class ConnectionOutbound : public Outbound {
public:
    explicit ConnectionOutbound(crow::websocket::connection& conn);

    void send_text(const std::string& frame) override;
    void detach();

private:
    std::mutex mutex_;
    crow::websocket::connection* conn_;
};

/// Crow WebSocket handlers for one session variant: one SessionProtocol per
/// connection, kept in the connection's userdata.
class SessionEndpoint {
public:
    SessionEndpoint(std::string route, DocumentStore& documents, EngineFactory factory,
                    ProtocolOptions options);

    void on_open(crow::websocket::connection& conn);
    void on_message(crow::websocket::connection& conn, const std::string& msg, bool is_binary);
    void on_close(crow::websocket::connection& conn, const std::string& reason);
    /// Transport failure. Crow still calls on_close afterwards, which frees the state.
    void on_error(crow::websocket::connection& conn, const std::string& error);

    const std::string& route() const { return route_; }

private:
    struct ConnState {
        std::shared_ptr<ConnectionOutbound> outbound;
        std::unique_ptr<SessionProtocol> protocol;
        std::int64_t text_frames = 0;
        std::int64_t binary_frames = 0;
    };

    std::string route_;
    DocumentStore& documents_;
    EngineFactory factory_;
    ProtocolOptions options_;
};

} // namespace clinic_relay
