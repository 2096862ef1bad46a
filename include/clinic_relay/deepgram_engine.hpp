#pragma once

#include "clinic_relay/chunk_queue.hpp"
#include "clinic_relay/recognition_engine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace clinic_relay {

struct DeepgramOptions {
    std::string api_key;
    std::string host = "api.deepgram.com";
    std::string port = "443";
    std::size_t queue_capacity = 512;
    /// Bound on resolve + TCP connect + TLS and WebSocket handshakes.
    std::chrono::milliseconds connect_timeout{10000};
};

/// Builds the /v1/listen path: defaults overridden by same-named start-frame fields.
std::string build_deepgram_path(const nlohmann::json& options, const std::string& patient_id);

/// Streams session audio to Deepgram's live transcription API and emits every
/// result message Deepgram sends back.
///
/// run() connects, starts a reader thread and then writes queued audio until
/// the queue is closed (finish) or cancelled (stop). stop() may be called at
/// any point, including while the connection is still being established.
class DeepgramEngine : public RecognitionEngine {
public:
    DeepgramEngine(DeepgramOptions options, SessionSeed seed, EventSink sink);
    ~DeepgramEngine() override;

    void run() override;
    bool feed(std::string chunk) override;
    void finish() override;
    void stop() override;
    bool live() const override { return live_.load(); }

private:
    using Stream = boost::beast::websocket::stream<
        boost::beast::ssl_stream<boost::asio::ip::tcp::socket>>;

    void connect();
    void read_loop();
    void write_loop();
    void shutdown_socket();

    DeepgramOptions options_;
    SessionSeed seed_;
    EventSink sink_;
    ChunkQueue audio_;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    std::unique_ptr<Stream> ws_;
    std::mutex socket_mutex_;
    bool connected_ = false; // guarded by socket_mutex_

    std::atomic<bool> live_{true};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> remote_closed_{false};
    std::string read_error_; // written by the reader, read after it is joined
    std::atomic<std::int64_t> client_to_dg_count_{0};
    std::atomic<std::int64_t> dg_to_client_count_{0};
};

/// Factory for the transcriber endpoint. Throws EngineError without an API key.
EngineFactory make_deepgram_factory(DeepgramOptions options);

} // namespace clinic_relay
