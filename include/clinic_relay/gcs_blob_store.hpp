#pragma once

#include "clinic_relay/blob_store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <mutex>
#include <string>

namespace clinic_relay {

/// Google Cloud Storage JSON API client (storage/v1) over HTTPS.
/// One TLS connection per request; authenticated with a bearer access token.
/// Each request (connect through response) must finish within timeout.
class GcsBlobStore : public BlobStore {
public:
    GcsBlobStore(std::string bucket, std::string access_token,
                 std::string host = "storage.googleapis.com", std::string port = "443",
                 std::chrono::milliseconds timeout = std::chrono::seconds(30));

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& data,
             const std::string& content_type) override;
    bool exists(const std::string& key) override;
    std::vector<BlobInfo> list(const std::string& prefix) override;
    bool remove(const std::string& key) override;

private:
    struct Reply {
        unsigned status;
        std::string body;
    };

    Reply request(boost::beast::http::verb method, const std::string& target,
                  const std::string& body = "", const std::string& content_type = "");
    std::string object_path(const std::string& key) const;

    std::string bucket_;
    std::string access_token_;
    std::string host_;
    std::string port_;
    std::chrono::milliseconds timeout_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::mutex mutex_;
};

} // namespace clinic_relay
