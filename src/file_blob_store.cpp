#include "clinic_relay/blob_store.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace clinic_relay {

namespace {

std::string format_mtime(const fs::file_time_type& ftime) {
    // file_clock has no portable conversion in C++17; shift by the clock offset.
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    std::time_t t = std::chrono::system_clock::to_time_t(sys);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

} // namespace

FileBlobStore::FileBlobStore(fs::path root) : root_(root.lexically_normal()) {
    if (!root_.has_filename() && root_.has_parent_path()) root_ = root_.parent_path();
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError("Cannot create storage root " + root_.string() + ": " + ec.message());
    }
}

fs::path FileBlobStore::resolve(const std::string& key) const {
    // Keys must already be canonical: fs::path would fold "a//b" and "a/./b"
    // onto "a/b", which list() then reports under a different key.
    std::size_t start = 0;
    for (;;) {
        auto slash = key.find('/', start);
        std::string segment = key.substr(start, slash == std::string::npos ? slash : slash - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw std::invalid_argument("Invalid blob key: '" + key + "'");
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return root_ / fs::path(key);
}

std::optional<std::string> FileBlobStore::get(const std::string& key) {
    fs::path path = resolve(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void FileBlobStore::put(const std::string& key, const std::string& data,
                        const std::string& /*content_type*/) {
    fs::path path = resolve(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StorageError("Cannot write " + path.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw StorageError("Short write to " + path.string());
    }
}

bool FileBlobStore::exists(const std::string& key) {
    std::error_code ec;
    return fs::is_regular_file(resolve(key), ec);
}

std::vector<BlobInfo> FileBlobStore::list(const std::string& prefix) {
    std::vector<BlobInfo> result;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, ec);
    if (ec) {
        throw StorageError("Cannot list " + root_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        std::string key = fs::relative(entry.path(), root_, ec).generic_string();
        if (ec || key.compare(0, prefix.size(), prefix) != 0) continue;

        BlobInfo info;
        info.key = key;
        info.size = static_cast<std::uint64_t>(entry.file_size(ec));
        auto mtime = entry.last_write_time(ec);
        if (!ec) info.updated = format_mtime(mtime);
        result.push_back(std::move(info));
    }

    std::sort(result.begin(), result.end(),
              [](const BlobInfo& a, const BlobInfo& b) { return a.key < b.key; });
    return result;
}

bool FileBlobStore::remove(const std::string& key) {
    fs::path path = resolve(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;

    if (!fs::remove(path, ec) || ec) {
        throw StorageError("Cannot delete " + path.string() + ": " + ec.message());
    }

    // Prune directories left empty, so a deleted patient leaves no folder behind.
    for (fs::path dir = path.parent_path(); !dir.empty() && dir != root_ && fs::is_empty(dir, ec) && !ec;
         dir = dir.parent_path()) {
        if (!fs::remove(dir, ec)) break;
    }
    return true;
}

} // namespace clinic_relay
