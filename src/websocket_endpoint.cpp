#include "clinic_relay/websocket_endpoint.hpp"

namespace clinic_relay {

ConnectionOutbound::ConnectionOutbound(crow::websocket::connection& conn) : conn_(&conn) {}

void ConnectionOutbound::send_text(const std::string& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) return;
    conn_->send_text(frame);
}

void ConnectionOutbound::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    conn_ = nullptr;
}

SessionEndpoint::SessionEndpoint(std::string route, DocumentStore& documents,
                                 EngineFactory factory, ProtocolOptions options)
    : route_(std::move(route)),
      documents_(documents),
      factory_(std::move(factory)),
      options_(std::move(options)) {}

void SessionEndpoint::on_open(crow::websocket::connection& conn) {
    CROW_LOG_INFO << "Client connected to " << route_ << " from " << conn.get_remote_ip();

    auto outbound = std::make_shared<ConnectionOutbound>(conn);
    auto* state = new ConnState{
        outbound,
        std::make_unique<SessionProtocol>(outbound, documents_, factory_, options_)
    };
    conn.userdata(state);
}

void SessionEndpoint::on_message(crow::websocket::connection& conn, const std::string& msg,
                                 bool is_binary) {
    auto* state = static_cast<ConnState*>(conn.userdata());
    if (!state) return;

    try {
        if (is_binary) {
            std::int64_t count = ++state->binary_frames;
            if (count % 10 == 0) {
                CROW_LOG_DEBUG << "[client->" << route_ << "] message #" << count
                               << " (binary: true, size: " << msg.size() << ")";
            }
            state->protocol->on_binary(msg);
        } else {
            std::int64_t count = ++state->text_frames;
            CROW_LOG_DEBUG << "[client->" << route_ << "] message #" << count
                           << " (binary: false, size: " << msg.size() << ")";
            state->protocol->on_text(msg);
        }
    } catch (const std::exception& e) {
        state->protocol->on_error(e.what());
    }
}

void SessionEndpoint::on_error(crow::websocket::connection& conn, const std::string& error) {
    auto* state = static_cast<ConnState*>(conn.userdata());
    if (!state) return;

    state->outbound->detach();
    state->protocol->on_error(error);
}

void SessionEndpoint::on_close(crow::websocket::connection& conn, const std::string& reason) {
    CROW_LOG_INFO << "Client disconnected from " << route_;

    auto* state = static_cast<ConnState*>(conn.userdata());
    if (!state) return;

    // No frame may reach the connection once Crow starts destroying it.
    state->outbound->detach();
    state->protocol->on_close(reason);

    delete state;
    conn.userdata(nullptr);
}

} // namespace clinic_relay
