#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clinic_relay {

/// Raised when the underlying object store is unreachable or misbehaves.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BlobInfo {
    std::string key;
    std::uint64_t size = 0;
    std::string updated; // ISO-8601, empty when unknown
};

/// Key/value blob API over a flat, '/'-separated key space.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /// Returns the blob's bytes, or nullopt if no blob exists at key.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /// Creates or overwrites the blob at key.
    virtual void put(const std::string& key, const std::string& data,
                     const std::string& content_type) = 0;

    virtual bool exists(const std::string& key) = 0;

    /// All blobs whose key starts with prefix, sorted by key.
    virtual std::vector<BlobInfo> list(const std::string& prefix) = 0;

    /// Deletes the blob at key. Returns false if it did not exist.
    virtual bool remove(const std::string& key) = 0;

    /// Best-effort bulk delete. Returns the number of blobs removed.
    virtual std::size_t remove_all(const std::vector<std::string>& keys);
};

class MemoryBlobStore : public BlobStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& data,
             const std::string& content_type) override;
    bool exists(const std::string& key) override;
    std::vector<BlobInfo> list(const std::string& prefix) override;
    bool remove(const std::string& key) override;

private:
    struct Entry {
        std::string data;
        std::string updated;
    };

    std::mutex mutex_;
    std::map<std::string, Entry> blobs_;
};

/// Stores each blob as a file under root; the key is the relative path.
/// Keys must be relative, non-empty, must not end in '/' and must not contain
/// ".." segments (std::invalid_argument otherwise).
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::filesystem::path root);

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& data,
             const std::string& content_type) override;
    bool exists(const std::string& key) override;
    std::vector<BlobInfo> list(const std::string& prefix) override;
    bool remove(const std::string& key) override;

private:
    std::filesystem::path resolve(const std::string& key) const;

    std::filesystem::path root_;
};

/// Current UTC time formatted as ISO-8601 with a trailing 'Z'.
std::string iso8601_now();

} // namespace clinic_relay
