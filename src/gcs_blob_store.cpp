#include "clinic_relay/gcs_blob_store.hpp"
#include "clinic_relay/url.hpp"

#include <crow/logging.h>
#include <nlohmann/json.hpp>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace clinic_relay {

GcsBlobStore::GcsBlobStore(std::string bucket, std::string access_token, std::string host,
                           std::string port, std::chrono::milliseconds timeout)
    : bucket_(std::move(bucket)),
      access_token_(std::move(access_token)),
      host_(std::move(host)),
      port_(std::move(port)),
      timeout_(timeout),
      ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

std::string GcsBlobStore::object_path(const std::string& key) const {
    return "/storage/v1/b/" + url_encode(bucket_) + "/o/" + url_encode(key);
}

/// Performs one HTTPS request against the storage API.
/// Transport failures, timeouts and 5xx/auth answers surface as StorageError.
GcsBlobStore::Reply GcsBlobStore::request(http::verb method, const std::string& target,
                                          const std::string& body,
                                          const std::string& content_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve(host_, port_);

        beast::ssl_stream<beast::tcp_stream> stream(ioc_, ssl_ctx_);
        // Set SNI hostname for TLS
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
            throw StorageError("Failed to set SNI hostname");
        }
        stream.set_verify_callback(ssl::host_name_verification(host_));

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::authorization, "Bearer " + access_token_);
        req.set(http::field::user_agent, "clinic_relay");
        if (!content_type.empty()) req.set(http::field::content_type, content_type);
        req.body() = body;
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(256 * 1024 * 1024);

        // The tcp_stream deadline only governs async operations, so the whole
        // exchange runs as one async chain on ioc_.
        beast::error_code result;
        const char* stage = "connect";
        auto& socket = beast::get_lowest_layer(stream);
        socket.expires_after(timeout_);
        socket.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
            if (ec) { result = ec; return; }
            stage = "TLS handshake";
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code ec) {
                if (ec) { result = ec; return; }
                stage = "write";
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) { result = ec; return; }
                    stage = "read";
                    http::async_read(stream, buffer, parser,
                                     [&](beast::error_code ec, std::size_t) { result = ec; });
                });
            });
        });
        ioc_.restart();
        ioc_.run();

        if (result) {
            throw StorageError("GCS " + std::string(http::to_string(method)) + " " + target +
                               " failed during " + stage + ": " + result.message());
        }
        auto res = parser.release();

        // Peers routinely skip close_notify; dropping the connection is enough.
        beast::error_code ec;
        socket.socket().close(ec);

        unsigned status = res.result_int();
        if (status >= 500 || status == 401 || status == 403) {
            throw StorageError("GCS " + std::string(http::to_string(method)) + " " + target +
                               " failed with HTTP " + std::to_string(status) + ": " + res.body());
        }
        return Reply{status, std::move(res.body())};
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageError("GCS request to " + host_ + " failed: " + std::string(e.what()));
    }
}

std::optional<std::string> GcsBlobStore::get(const std::string& key) {
    Reply reply = request(http::verb::get, object_path(key) + "?alt=media");
    if (reply.status == 404) return std::nullopt;
    if (reply.status != 200) {
        throw StorageError("GCS get " + key + " returned HTTP " + std::to_string(reply.status));
    }
    return std::move(reply.body);
}

void GcsBlobStore::put(const std::string& key, const std::string& data,
                       const std::string& content_type) {
    std::string target = "/upload/storage/v1/b/" + url_encode(bucket_) +
                         "/o?uploadType=media&name=" + url_encode(key);
    Reply reply = request(http::verb::post, target, data,
                          content_type.empty() ? "application/octet-stream" : content_type);
    if (reply.status != 200) {
        throw StorageError("GCS upload " + key + " returned HTTP " + std::to_string(reply.status) +
                           ": " + reply.body);
    }
}

bool GcsBlobStore::exists(const std::string& key) {
    Reply reply = request(http::verb::get, object_path(key) + "?fields=name");
    if (reply.status == 404) return false;
    if (reply.status != 200) {
        throw StorageError("GCS stat " + key + " returned HTTP " + std::to_string(reply.status));
    }
    return true;
}

std::vector<BlobInfo> GcsBlobStore::list(const std::string& prefix) {
    std::vector<BlobInfo> result;
    std::string page_token;
    do {
        std::string target = "/storage/v1/b/" + url_encode(bucket_) +
                             "/o?fields=items(name,size,updated),nextPageToken&prefix=" +
                             url_encode(prefix);
        if (!page_token.empty()) target += "&pageToken=" + url_encode(page_token);

        Reply reply = request(http::verb::get, target);
        if (reply.status != 200) {
            throw StorageError("GCS list " + prefix + " returned HTTP " +
                               std::to_string(reply.status));
        }

        json page = json::parse(reply.body, nullptr, false);
        if (page.is_discarded()) {
            throw StorageError("GCS list " + prefix + " returned malformed JSON");
        }
        for (const auto& item : page.value("items", json::array())) {
            BlobInfo info;
            info.key = item.value("name", "");
            // The JSON API encodes uint64 sizes as strings.
            info.size = std::stoull(item.value("size", "0"));
            info.updated = item.value("updated", "");
            result.push_back(std::move(info));
        }
        page_token = page.value("nextPageToken", "");
    } while (!page_token.empty());

    return result;
}

bool GcsBlobStore::remove(const std::string& key) {
    Reply reply = request(http::verb::delete_, object_path(key));
    if (reply.status == 404) return false;
    if (reply.status != 204 && reply.status != 200) {
        throw StorageError("GCS delete " + key + " returned HTTP " + std::to_string(reply.status));
    }
    CROW_LOG_DEBUG << "[storage] deleted gs://" << bucket_ << "/" << key;
    return true;
}

} // namespace clinic_relay
