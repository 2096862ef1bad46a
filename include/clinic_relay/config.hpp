#pragma once

#include <cstddef>
#include <string>

namespace clinic_relay {

struct Config {
    int port;
    std::string host;
    std::string log_level;

    std::string deepgram_api_key;
    std::string deepgram_host;

    std::string storage_backend;
    std::string storage_root;
    std::string gcs_bucket;
    std::string gcs_access_token;

    std::string document_prefix;
    std::string seed_file;
    std::string default_patient_id;

    int playback_interval_ms;
    std::size_t audio_queue_capacity;

    std::string metadata_file;
    std::string admin_ui_file;
};

/// Reads a .env file and sets environment variables (existing variables win).
void load_dotenv(const std::string& path = ".env");

/// Loads configuration from the environment, with defaults.
/// Throws std::runtime_error on an unusable storage configuration.
Config load_config();

} // namespace clinic_relay
