#include "clinic_relay/blob_store.hpp"

#include <crow/logging.h>

#include <ctime>

namespace clinic_relay {

std::string iso8601_now() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

std::size_t BlobStore::remove_all(const std::vector<std::string>& keys) {
    std::size_t removed = 0;
    for (const auto& key : keys) {
        try {
            if (remove(key)) ++removed;
        } catch (const StorageError& e) {
            CROW_LOG_WARNING << "[storage] bulk delete skipped " << key << ": " << e.what();
        }
    }
    return removed;
}

// ============================================================================
// MemoryBlobStore
// ============================================================================

std::optional<std::string> MemoryBlobStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return it->second.data;
}

void MemoryBlobStore::put(const std::string& key, const std::string& data,
                          const std::string& /*content_type*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[key] = Entry{data, iso8601_now()};
}

bool MemoryBlobStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.count(key) > 0;
}

std::vector<BlobInfo> MemoryBlobStore::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BlobInfo> result;
    for (auto it = blobs_.lower_bound(prefix); it != blobs_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        result.push_back(BlobInfo{it->first, it->second.data.size(), it->second.updated});
    }
    return result;
}

bool MemoryBlobStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.erase(key) > 0;
}

} // namespace clinic_relay
