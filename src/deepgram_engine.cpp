#include "clinic_relay/deepgram_engine.hpp"
#include "clinic_relay/url.hpp"

#include <crow/logging.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <thread>
#include <utility>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace clinic_relay {

std::string build_deepgram_path(const json& options, const std::string& patient_id) {
    // Defaults for Deepgram query parameters
    std::vector<std::pair<std::string, std::string>> defaults = {
        {"model",        "nova-3"},
        {"language",     "en"},
        {"smart_format", "true"},
        {"punctuate",    "true"},
        {"diarize",      "false"},
        {"filler_words", "false"},
        {"encoding",     "linear16"},
        {"sample_rate",  "16000"},
        {"channels",     "1"}
    };

    std::string path = "/v1/listen?";
    for (auto& [name, default_val] : defaults) {
        std::string val = default_val;
        if (options.is_object() && options.contains(name)) {
            const json& given = options.at(name);
            val = given.is_string() ? given.get<std::string>() : given.dump();
        }
        path += name + "=" + url_encode(val) + "&";
    }
    // Deepgram echoes "extra" metadata back on every result.
    path += "extra=" + url_encode("patient_id:" + patient_id);
    return path;
}

DeepgramEngine::DeepgramEngine(DeepgramOptions options, SessionSeed seed, EventSink sink)
    : options_(std::move(options)),
      seed_(std::move(seed)),
      sink_(std::move(sink)),
      audio_(options_.queue_capacity),
      ssl_ctx_(ssl::context::tlsv12_client),
      resolver_(ioc_) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

DeepgramEngine::~DeepgramEngine() {
    stop();
}

void DeepgramEngine::connect() {
    std::string path = build_deepgram_path(seed_.options, seed_.patient_id);
    CROW_LOG_INFO << "[transcriber] connecting to Deepgram STT for " << seed_.patient_id
                  << " (seed context: " << seed_.patient_info.size() << " chars): " << path;

    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        ws_ = std::make_unique<Stream>(ioc_, ssl_ctx_);
    }
    Stream& ws = *ws_;

    // Set SNI hostname for TLS
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), options_.host.c_str())) {
        throw EngineError("Failed to set SNI hostname");
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(options_.host));

    // WebSocket handshake with auth header
    std::string api_key = options_.api_key;
    std::string host = options_.host;
    ws.set_option(websocket::stream_base::decorator(
        [api_key, host](websocket::request_type& req) {
            req.set(http::field::authorization, "Token " + api_key);
            req.set(http::field::host, host);
        }));

    // Resolve, TCP connect, TLS and WebSocket handshakes run as one async chain
    // on ioc_ so that stop() (ioc_.stop()) or the deadline can abandon it.
    auto result = std::make_shared<beast::error_code>(net::error::would_block);
    resolver_.async_resolve(options_.host, options_.port,
        [&ws, host, path, result](beast::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) { *result = ec; return; }
            net::async_connect(beast::get_lowest_layer(ws), endpoints,
                [&ws, host, path, result](beast::error_code ec, const tcp::endpoint&) {
                    if (ec) { *result = ec; return; }
                    ws.next_layer().async_handshake(ssl::stream_base::client,
                        [&ws, host, path, result](beast::error_code ec) {
                            if (ec) { *result = ec; return; }
                            ws.async_handshake(host, path,
                                [result](beast::error_code ec) { *result = ec; });
                        });
                });
        });
    ioc_.run_for(options_.connect_timeout);

    if (*result == net::error::would_block) {
        if (stopping_) return;
        throw EngineError("timed out after " + std::to_string(options_.connect_timeout.count()) +
                          " ms");
    }
    if (*result) {
        throw beast::system_error(*result);
    }

    std::lock_guard<std::mutex> lock(socket_mutex_);
    connected_ = true;
}

void DeepgramEngine::run() {
    if (stopping_) {
        live_ = false;
        return;
    }
    try {
        connect();
    } catch (const std::exception& e) {
        live_ = false;
        if (stopping_) return;
        throw EngineError(std::string("Failed to connect to Deepgram: ") + e.what());
    }
    if (stopping_) {
        // stop() raced the end of the handshake.
        shutdown_socket();
        live_ = false;
        return;
    }
    CROW_LOG_INFO << "[transcriber] connected to Deepgram STT API";

    std::thread reader(&DeepgramEngine::read_loop, this);

    std::string write_error;
    try {
        write_loop();
    } catch (const std::exception& e) {
        write_error = e.what();
        shutdown_socket();
    }
    reader.join();
    live_ = false;

    if (stopping_) return;
    if (!write_error.empty()) {
        throw EngineError("Deepgram write failed: " + write_error);
    }
    if (!read_error_.empty()) {
        throw EngineError("Deepgram stream closed: " + read_error_);
    }
}

void DeepgramEngine::write_loop() {
    while (auto chunk = audio_.pop()) {
        std::int64_t count = ++client_to_dg_count_;
        if (count % 10 == 0) {
            CROW_LOG_DEBUG << "[client->deepgram] message #" << count
                           << " (binary: true, size: " << chunk->size() << ")";
        }
        ws_->binary(true);
        ws_->write(net::buffer(*chunk));
    }

    if (stopping_ || remote_closed_) return;

    // finish(): ask Deepgram to flush final results; it closes the stream afterwards.
    CROW_LOG_INFO << "[client->deepgram] CloseStream";
    ws_->text(true);
    ws_->write(net::buffer(std::string(R"({"type":"CloseStream"})")));
}

void DeepgramEngine::read_loop() {
    try {
        for (;;) {
            beast::flat_buffer buffer;
            beast::error_code ec;
            ws_->read(buffer, ec);

            if (ec) {
                if (ec != websocket::error::closed &&
                    ec != net::error::operation_aborted &&
                    ec != net::ssl::error::stream_truncated &&
                    !stopping_) {
                    read_error_ = ec.message();
                    CROW_LOG_ERROR << "[deepgram->client] read error: " << ec.message();
                }
                break;
            }
            if (!ws_->got_text()) continue;

            std::string msg = beast::buffers_to_string(buffer.data());
            std::int64_t count = ++dg_to_client_count_;
            CROW_LOG_DEBUG << "[deepgram->client] message #" << count
                           << " (binary: false, size: " << msg.size() << ")";

            json event = json::parse(msg, nullptr, false);
            if (event.is_discarded()) {
                CROW_LOG_WARNING << "[deepgram->client] dropped non-JSON message #" << count;
                continue;
            }
            sink_(std::move(event));
        }
    } catch (const std::exception& e) {
        if (!stopping_) {
            read_error_ = e.what();
            CROW_LOG_ERROR << "[deepgram->client] exception: " << e.what();
        }
    }

    remote_closed_ = true;
    live_ = false;
    audio_.cancel(); // wakes the writer
}

bool DeepgramEngine::feed(std::string chunk) {
    if (!live_) return false;
    return audio_.push(std::move(chunk));
}

void DeepgramEngine::finish() {
    live_ = false;
    audio_.close();
}

void DeepgramEngine::stop() {
    stopping_ = true;
    live_ = false;
    audio_.cancel();
    ioc_.stop(); // abandons a handshake still in progress
    shutdown_socket();
}

void DeepgramEngine::shutdown_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    // Before the handshake completes the socket belongs to ioc_; ioc_.stop() covers it.
    if (!ws_ || !connected_) return;
    beast::error_code ec;
    beast::get_lowest_layer(*ws_).shutdown(tcp::socket::shutdown_both, ec);
}

EngineFactory make_deepgram_factory(DeepgramOptions options) {
    return [options](const SessionSeed& seed, EventSink sink) -> std::unique_ptr<RecognitionEngine> {
        if (options.api_key.empty()) {
            throw EngineError("DEEPGRAM_API_KEY is not configured");
        }
        return std::make_unique<DeepgramEngine>(options, seed, std::move(sink));
    };
}

} // namespace clinic_relay
