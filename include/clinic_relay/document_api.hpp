#pragma once

#include "clinic_relay/document_store.hpp"

#include <crow.h>
#include <nlohmann/json.hpp>

#include <string>

namespace clinic_relay {

/// JSON response with the CORS header every route carries.
crow::response json_response(int code, const nlohmann::json& body);

/// Answer to a CORS preflight request.
crow::response preflight_response();

/// HTTP handlers for the patient document store.
///
/// Missing documents and patients become 404/400 bodies; storage failures
/// become 500 {"error": ...}. No handler throws.
class DocumentApi {
public:
    DocumentApi(DocumentStore& documents, std::string admin_ui_file);

    /// POST {pid, file_name}; body typed by the file extension.
    crow::response get_file(const crow::request& req);

    crow::response list_files(const std::string& pid);

    /// POST {pid, file_name, content}
    crow::response save_file(const crow::request& req);

    /// DELETE ?pid=&file_name=
    crow::response delete_file(const crow::request& req);

    crow::response list_patients();

    /// POST {pid}
    crow::response create_patient(const crow::request& req);

    /// DELETE ?pid=
    crow::response delete_patient(const crow::request& req);

    /// GET /admin
    crow::response admin_page() const;

private:
    DocumentStore& documents_;
    std::string admin_ui_file_;
};

} // namespace clinic_relay
