#include "clinic_relay/config.hpp"

#include <crow/logging.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace clinic_relay {

namespace {

std::string env_or(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) return default_val;
    return value;
}

long env_number_or(const char* name, long default_val) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) return default_val;
    try {
        long parsed = std::stol(value);
        if (parsed > 0) return parsed;
    } catch (const std::exception&) {
    }
    CROW_LOG_WARNING << "Ignoring invalid " << name << "=" << value
                     << ", using " << default_val;
    return default_val;
}

} // namespace

void load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        // Remove surrounding quotes if present
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        setenv(key.c_str(), val.c_str(), 0); // Don't overwrite existing
    }
}

Config load_config() {
    load_dotenv();

    Config cfg;
    cfg.port = static_cast<int>(env_number_or("PORT", 8081));
    cfg.host = env_or("HOST", "0.0.0.0");
    cfg.log_level = env_or("LOG_LEVEL", "info");

    cfg.deepgram_api_key = env_or("DEEPGRAM_API_KEY", "");
    cfg.deepgram_host = env_or("DEEPGRAM_HOST", "api.deepgram.com");

    cfg.storage_backend = env_or("STORAGE_BACKEND", "filesystem");
    cfg.storage_root = env_or("STORAGE_ROOT", "./data");
    cfg.gcs_bucket = env_or("GCS_BUCKET", "clinic_sim");
    cfg.gcs_access_token = env_or("GCS_ACCESS_TOKEN", "");

    cfg.document_prefix = env_or("DOCUMENT_PREFIX", "patient_profile");
    cfg.seed_file = env_or("SEED_FILE", "patient_info.md");
    cfg.default_patient_id = env_or("DEFAULT_PATIENT_ID", "P0001");

    cfg.playback_interval_ms = static_cast<int>(env_number_or("PLAYBACK_INTERVAL_MS", 1000));
    cfg.audio_queue_capacity = static_cast<std::size_t>(env_number_or("AUDIO_QUEUE_CAPACITY", 512));

    cfg.metadata_file = env_or("METADATA_FILE", "relay.toml");
    cfg.admin_ui_file = env_or("ADMIN_UI_FILE", "admin_ui.html");

    if (cfg.storage_backend != "filesystem" && cfg.storage_backend != "gcs" &&
        cfg.storage_backend != "memory") {
        throw std::runtime_error("STORAGE_BACKEND must be one of filesystem, gcs, memory (got '" +
                                 cfg.storage_backend + "')");
    }
    if (cfg.storage_backend == "gcs" && cfg.gcs_access_token.empty()) {
        throw std::runtime_error("GCS_ACCESS_TOKEN environment variable is required for the gcs backend");
    }
    while (!cfg.document_prefix.empty() && cfg.document_prefix.back() == '/') {
        cfg.document_prefix.pop_back();
    }

    return cfg;
}

} // namespace clinic_relay
