/**
 * clinic_relay - Backend Server
 *
 * Relays live session audio from a WebSocket client to a recognition engine
 * and streams its results back, and serves the per-patient document store
 * used to seed those sessions.
 *
 * Routes:
 *   WS     /ws/transcriber                 - Live transcription session (Deepgram)
 *   WS     /ws/simulation/audio            - Scripted playback session
 *   POST   /api/get-patient-file           - Fetch one patient file
 *   GET    /api/admin/list-files/<pid>     - List a patient's files
 *   POST   /api/admin/save-file            - Create or overwrite a file
 *   DELETE /api/admin/delete-file          - Delete a file
 *   GET    /api/admin/list-patients        - List patient folders
 *   POST   /api/admin/create-patient       - Create a patient folder
 *   DELETE /api/admin/delete-patient       - Delete a patient folder
 *   GET    /admin                          - Admin UI
 *   GET    /api/metadata                   - Project metadata from relay.toml
 *   GET    /health                         - Health check
 */

#include "clinic_relay/blob_store.hpp"
#include "clinic_relay/config.hpp"
#include "clinic_relay/deepgram_engine.hpp"
#include "clinic_relay/document_api.hpp"
#include "clinic_relay/document_store.hpp"
#include "clinic_relay/gcs_blob_store.hpp"
#include "clinic_relay/metadata.hpp"
#include "clinic_relay/script_engine.hpp"
#include "clinic_relay/websocket_endpoint.hpp"

#include <crow.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace clinic_relay;

// ============================================================================
// STARTUP HELPERS
// ============================================================================

/// Maps LOG_LEVEL to Crow's log levels; unknown names mean info.
static crow::LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return crow::LogLevel::Debug;
    if (name == "warning") return crow::LogLevel::Warning;
    if (name == "error") return crow::LogLevel::Error;
    if (name == "critical") return crow::LogLevel::Critical;
    return crow::LogLevel::Info;
}

/// Creates the blob backend named by STORAGE_BACKEND.
static std::unique_ptr<BlobStore> make_blob_store(const Config& cfg) {
    if (cfg.storage_backend == "gcs") {
        return std::make_unique<GcsBlobStore>(cfg.gcs_bucket, cfg.gcs_access_token);
    }
    if (cfg.storage_backend == "memory") {
        return std::make_unique<MemoryBlobStore>();
    }
    return std::make_unique<FileBlobStore>(cfg.storage_root);
}

static std::string storage_location(const Config& cfg) {
    if (cfg.storage_backend == "gcs") return "gs://" + cfg.gcs_bucket + "/" + cfg.document_prefix;
    if (cfg.storage_backend == "memory") return "memory";
    return cfg.storage_root + "/" + cfg.document_prefix;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    Config cfg;
    std::unique_ptr<BlobStore> blobs;
    try {
        cfg = load_config();
        blobs = make_blob_store(cfg);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n"
                  << "Please copy sample.env to .env and review the settings" << std::endl;
        return 1;
    }

    crow::logger::setLogLevel(parse_log_level(cfg.log_level));
    if (cfg.deepgram_api_key.empty()) {
        CROW_LOG_WARNING << "DEEPGRAM_API_KEY is not set; /ws/transcriber sessions will fail to start";
    }

    DocumentStore documents(*blobs, cfg.document_prefix, cfg.seed_file);
    DocumentApi document_api(documents, cfg.admin_ui_file);

    DeepgramOptions deepgram;
    deepgram.api_key = cfg.deepgram_api_key;
    deepgram.host = cfg.deepgram_host;
    deepgram.queue_capacity = cfg.audio_queue_capacity;

    SessionEndpoint transcriber("/ws/transcriber", documents, make_deepgram_factory(deepgram),
                                ProtocolOptions{"Transcriber", cfg.default_patient_id});
    SessionEndpoint playback("/ws/simulation/audio", documents,
                             make_script_factory(documents,
                                                 std::chrono::milliseconds(cfg.playback_interval_ms)),
                             ProtocolOptions{"Audio simulation", cfg.default_patient_id});

    crow::SimpleApp app;

    // ========================================================================
    // WS /ws/transcriber - Live transcription session
    // ========================================================================
    CROW_ROUTE(app, "/ws/transcriber")
        .websocket()
        .onopen([&transcriber](crow::websocket::connection& conn) {
            transcriber.on_open(conn);
        })
        .onmessage([&transcriber](crow::websocket::connection& conn, const std::string& msg, bool is_binary) {
            transcriber.on_message(conn, msg, is_binary);
        })
        .onerror([&transcriber](crow::websocket::connection& conn, const std::string& error) {
            transcriber.on_error(conn, error);
        })
        .onclose([&transcriber](crow::websocket::connection& conn, const std::string& reason) {
            transcriber.on_close(conn, reason);
        });

    // ========================================================================
    // WS /ws/simulation/audio - Scripted playback session
    // ========================================================================
    CROW_ROUTE(app, "/ws/simulation/audio")
        .websocket()
        .onopen([&playback](crow::websocket::connection& conn) {
            playback.on_open(conn);
        })
        .onmessage([&playback](crow::websocket::connection& conn, const std::string& msg, bool is_binary) {
            playback.on_message(conn, msg, is_binary);
        })
        .onerror([&playback](crow::websocket::connection& conn, const std::string& error) {
            playback.on_error(conn, error);
        })
        .onclose([&playback](crow::websocket::connection& conn, const std::string& reason) {
            playback.on_close(conn, reason);
        });

    // ========================================================================
    // Document store
    // ========================================================================
    CROW_ROUTE(app, "/api/get-patient-file").methods(crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
    ([&document_api](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) return preflight_response();
        return document_api.get_file(req);
    });

    CROW_ROUTE(app, "/api/admin/list-files/<string>").methods(crow::HTTPMethod::GET)
    ([&document_api](const crow::request&, const std::string& pid) {
        return document_api.list_files(pid);
    });

    CROW_ROUTE(app, "/api/admin/save-file").methods(crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
    ([&document_api](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) return preflight_response();
        return document_api.save_file(req);
    });

    CROW_ROUTE(app, "/api/admin/delete-file").methods(crow::HTTPMethod::DELETE, crow::HTTPMethod::OPTIONS)
    ([&document_api](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) return preflight_response();
        return document_api.delete_file(req);
    });

    CROW_ROUTE(app, "/api/admin/list-patients").methods(crow::HTTPMethod::GET)
    ([&document_api](const crow::request&) {
        return document_api.list_patients();
    });

    CROW_ROUTE(app, "/api/admin/create-patient").methods(crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
    ([&document_api](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) return preflight_response();
        return document_api.create_patient(req);
    });

    CROW_ROUTE(app, "/api/admin/delete-patient").methods(crow::HTTPMethod::DELETE, crow::HTTPMethod::OPTIONS)
    ([&document_api](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) return preflight_response();
        return document_api.delete_patient(req);
    });

    CROW_ROUTE(app, "/admin").methods(crow::HTTPMethod::GET)
    ([&document_api](const crow::request&) {
        return document_api.admin_page();
    });

    // ========================================================================
    // GET /api/metadata - Project metadata from relay.toml
    // ========================================================================
    CROW_ROUTE(app, "/api/metadata").methods(crow::HTTPMethod::GET, crow::HTTPMethod::OPTIONS)
    ([&cfg](const crow::request& req) {
        if (req.method == crow::HTTPMethod::OPTIONS) return preflight_response();

        try {
            return json_response(200, load_metadata(cfg.metadata_file));
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "Error reading metadata: " << e.what();
            return json_response(500, json{
                {"error", "INTERNAL_SERVER_ERROR"},
                {"message", std::string("Failed to read metadata: ") + e.what()}
            });
        }
    });

    // ========================================================================
    // GET /health - Health check
    // ========================================================================
    CROW_ROUTE(app, "/health").methods(crow::HTTPMethod::GET)
    ([](const crow::request&) {
        return json_response(200, json{{"status", "ok"}});
    });

    // ========================================================================
    // START SERVER
    // ========================================================================

    std::cout << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Backend API Server running at http://localhost:" << cfg.port << std::endl;
    std::cout << std::endl;
    std::cout << "  WS     /ws/transcriber" << std::endl;
    std::cout << "  WS     /ws/simulation/audio" << std::endl;
    std::cout << "  POST   /api/get-patient-file" << std::endl;
    std::cout << "  GET    /api/admin/list-files/<pid>" << std::endl;
    std::cout << "  POST   /api/admin/save-file" << std::endl;
    std::cout << "  DELETE /api/admin/delete-file" << std::endl;
    std::cout << "  GET    /api/admin/list-patients" << std::endl;
    std::cout << "  POST   /api/admin/create-patient" << std::endl;
    std::cout << "  DELETE /api/admin/delete-patient" << std::endl;
    std::cout << "  GET    /admin" << std::endl;
    std::cout << "  GET    /api/metadata" << std::endl;
    std::cout << "  GET    /health" << std::endl;
    std::cout << std::endl;
    std::cout << "Documents: " << storage_location(cfg) << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::endl;

    app.port(cfg.port)
       .bindaddr(cfg.host)
       .multithreaded()
       .run();

    return 0;
}
