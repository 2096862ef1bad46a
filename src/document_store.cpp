#include "clinic_relay/document_store.hpp"

#include <crow/logging.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace clinic_relay {

namespace {

const char* const kSeedTemplate = "# Patient Profile\nName: \nAge: ";

std::string extension_of(const std::string& file_name) {
    auto dot = file_name.rfind('.');
    std::string ext = (dot == std::string::npos) ? file_name : file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

void check_patient_id(const std::string& patient_id) {
    if (patient_id.empty() || patient_id == "." || patient_id == ".." ||
        patient_id.find('/') != std::string::npos) {
        throw std::invalid_argument("Invalid patient id: '" + patient_id + "'");
    }
}

// File names may name a subfolder ("scans/xray.png") but every segment must be real.
void check_file_name(const std::string& file_name) {
    std::size_t start = 0;
    for (;;) {
        auto slash = file_name.find('/', start);
        std::string segment =
            file_name.substr(start, slash == std::string::npos ? slash : slash - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw std::invalid_argument("Invalid file name: '" + file_name + "'");
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
}

} // namespace

MediaKind media_kind_for(const std::string& file_name) {
    std::string ext = extension_of(file_name);
    if (ext == "json") return MediaKind::Json;
    if (ext == "md" || ext == "txt") return MediaKind::Text;
    if (ext == "png" || ext == "jpg" || ext == "jpeg") return MediaKind::Image;
    return MediaKind::Binary;
}

std::string content_type_for(const std::string& file_name) {
    switch (media_kind_for(file_name)) {
    case MediaKind::Json:
        return "application/json";
    case MediaKind::Text:
        return "text/markdown";
    case MediaKind::Image:
        return extension_of(file_name) == "png" ? "image/png" : "image/jpeg";
    case MediaKind::Binary:
        break;
    }
    return "application/octet-stream";
}

DocumentStore::DocumentStore(BlobStore& blobs, std::string root, std::string seed_file)
    : blobs_(blobs), root_(std::move(root)), seed_file_(std::move(seed_file)) {}

std::string DocumentStore::key_for(const std::string& patient_id,
                                   const std::string& file_name) const {
    check_file_name(file_name);
    return prefix_for(patient_id) + file_name;
}

std::string DocumentStore::prefix_for(const std::string& patient_id) const {
    check_patient_id(patient_id);
    return root_ + "/" + patient_id + "/";
}

std::optional<Document> DocumentStore::get(const std::string& patient_id,
                                           const std::string& file_name) {
    std::string key = key_for(patient_id, file_name);
    auto content = blobs_.get(key);
    if (!content) {
        CROW_LOG_WARNING << "[documents] file not found: " << key;
        return std::nullopt;
    }
    return Document{key, media_kind_for(file_name), content_type_for(file_name),
                    std::move(*content)};
}

void DocumentStore::put(const std::string& patient_id, const std::string& file_name,
                        const std::string& content) {
    std::string key = key_for(patient_id, file_name);
    blobs_.put(key, content, content_type_for(file_name));
    CROW_LOG_INFO << "[documents] saved " << key << " (" << content.size() << " bytes)";
}

std::vector<DocumentEntry> DocumentStore::list(const std::string& patient_id) {
    std::string prefix = prefix_for(patient_id);
    std::vector<DocumentEntry> entries;
    for (const auto& blob : blobs_.list(prefix)) {
        std::string name = blob.key.substr(prefix.size());
        if (name.empty()) continue; // the folder marker itself
        entries.push_back(DocumentEntry{name, blob.key, blob.size, blob.updated});
    }
    return entries;
}

bool DocumentStore::remove(const std::string& patient_id, const std::string& file_name) {
    std::string key = key_for(patient_id, file_name);
    if (!blobs_.remove(key)) return false;
    CROW_LOG_INFO << "[documents] deleted " << key;
    return true;
}

bool DocumentStore::create_patient(const std::string& patient_id) {
    if (patient_exists(patient_id)) return false;
    blobs_.put(key_for(patient_id, seed_file_), kSeedTemplate, "text/markdown");
    CROW_LOG_INFO << "[documents] created patient " << patient_id;
    return true;
}

std::size_t DocumentStore::delete_patient(const std::string& patient_id) {
    std::vector<std::string> keys;
    for (const auto& blob : blobs_.list(prefix_for(patient_id))) {
        keys.push_back(blob.key);
    }
    if (keys.empty()) return 0;

    std::size_t removed = blobs_.remove_all(keys);
    if (removed < keys.size()) {
        CROW_LOG_WARNING << "[documents] deleted " << removed << " of " << keys.size()
                         << " files for patient " << patient_id;
    } else {
        CROW_LOG_INFO << "[documents] deleted patient folder " << prefix_for(patient_id);
    }
    return keys.size();
}

std::vector<std::string> DocumentStore::list_patients() {
    std::string prefix = root_ + "/";
    std::set<std::string> names;
    for (const auto& blob : blobs_.list(prefix)) {
        auto slash = blob.key.find('/', prefix.size());
        if (slash == std::string::npos) continue; // a loose blob, not a folder
        std::string name = blob.key.substr(prefix.size(), slash - prefix.size());
        if (!name.empty()) names.insert(name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

bool DocumentStore::patient_exists(const std::string& patient_id) {
    return !blobs_.list(prefix_for(patient_id)).empty();
}

std::string DocumentStore::seed_context(const std::string& patient_id) {
    auto content = blobs_.get(key_for(patient_id, seed_file_));
    if (!content) {
        throw DocumentError("No " + seed_file_ + " for patient " + patient_id);
    }
    return *content;
}

} // namespace clinic_relay
