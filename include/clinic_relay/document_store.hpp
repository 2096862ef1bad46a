#pragma once

#include "clinic_relay/blob_store.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clinic_relay {

/// Raised when a document required to run a session is missing.
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class MediaKind { Json, Text, Image, Binary };

struct Document {
    std::string path; // blob key
    MediaKind kind;
    std::string content_type;
    std::string content;
};

struct DocumentEntry {
    std::string name; // relative to the patient folder
    std::string full_path;
    std::uint64_t size;
    std::string updated;
};

/// Media kind from the lowercase text after the last '.' of a file name.
MediaKind media_kind_for(const std::string& file_name);

/// Response content type for a file name (image/png, text/markdown, ...).
std::string content_type_for(const std::string& file_name);

/// Per-patient files stored as blobs at "<root>/<patient_id>/<file_name>".
/// A patient exists iff at least one blob lives under "<root>/<patient_id>/".
class DocumentStore {
public:
    DocumentStore(BlobStore& blobs, std::string root = "patient_profile",
                  std::string seed_file = "patient_info.md");

    /// Throws std::invalid_argument for an empty patient id, one containing '/',
    /// or a file name with empty, "." or ".." segments.
    std::string key_for(const std::string& patient_id, const std::string& file_name) const;
    std::string prefix_for(const std::string& patient_id) const;

    /// nullopt when no blob exists at the derived key.
    std::optional<Document> get(const std::string& patient_id, const std::string& file_name);

    void put(const std::string& patient_id, const std::string& file_name,
             const std::string& content);

    std::vector<DocumentEntry> list(const std::string& patient_id);

    /// false when the file does not exist.
    bool remove(const std::string& patient_id, const std::string& file_name);

    /// false when the patient already has at least one blob.
    bool create_patient(const std::string& patient_id);

    /// Number of blobs deleted; 0 means the patient did not exist.
    std::size_t delete_patient(const std::string& patient_id);

    std::vector<std::string> list_patients();

    bool patient_exists(const std::string& patient_id);

    /// Text of the patient's seed file. Throws DocumentError when absent.
    std::string seed_context(const std::string& patient_id);

    const std::string& seed_file() const { return seed_file_; }

private:
    BlobStore& blobs_;
    std::string root_;
    std::string seed_file_;
};

} // namespace clinic_relay
