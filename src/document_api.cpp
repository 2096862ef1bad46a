#include "clinic_relay/document_api.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace clinic_relay {

namespace {

json parse_body(const crow::request& req) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return body;
}

std::string require_field(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Missing or non-string field: ") + field);
    }
    return it->get<std::string>();
}

std::string require_param(const crow::request& req, const char* name) {
    const char* value = req.url_params.get(name);
    if (!value || std::string(value).empty()) {
        throw std::invalid_argument(std::string("Missing query parameter: ") + name);
    }
    return value;
}

crow::response error_response(int code, const std::string& message) {
    return json_response(code, json{{"error", message}});
}

} // namespace

crow::response json_response(int code, const json& body) {
    crow::response res(code);
    res.set_header("Content-Type", "application/json");
    res.add_header("Access-Control-Allow-Origin", "*");
    res.body = body.dump();
    return res;
}

crow::response preflight_response() {
    crow::response res(200);
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.add_header("Access-Control-Allow-Headers", "Content-Type");
    return res;
}

DocumentApi::DocumentApi(DocumentStore& documents, std::string admin_ui_file)
    : documents_(documents), admin_ui_file_(std::move(admin_ui_file)) {}

crow::response DocumentApi::get_file(const crow::request& req) {
    try {
        json body = parse_body(req);
        std::string pid = require_field(body, "pid");
        std::string file_name = require_field(body, "file_name");

        CROW_LOG_INFO << "Fetching document " << documents_.key_for(pid, file_name);
        auto document = documents_.get(pid, file_name);
        if (!document) {
            return json_response(404, json{{"error", "File not found"},
                                           {"path", documents_.key_for(pid, file_name)}});
        }

        if (document->kind == MediaKind::Json) {
            return json_response(200, json::parse(document->content));
        }
        crow::response res(200);
        res.set_header("Content-Type", document->content_type);
        res.add_header("Access-Control-Allow-Origin", "*");
        res.body = std::move(document->content);
        return res;
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Storage API Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::list_files(const std::string& pid) {
    try {
        json files = json::array();
        for (const auto& entry : documents_.list(pid)) {
            files.push_back({
                {"name", entry.name},
                {"full_path", entry.full_path},
                {"size", entry.size},
                {"updated", entry.updated.empty() ? json(nullptr) : json(entry.updated)}
            });
        }
        return json_response(200, json{{"files", files}});
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "List Files Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::save_file(const crow::request& req) {
    try {
        json body = parse_body(req);
        std::string pid = require_field(body, "pid");
        std::string file_name = require_field(body, "file_name");
        std::string content = require_field(body, "content");

        documents_.put(pid, file_name, content);
        return json_response(200, json{{"message", "File saved successfully"},
                                       {"path", documents_.key_for(pid, file_name)}});
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Save File Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::delete_file(const crow::request& req) {
    try {
        std::string pid = require_param(req, "pid");
        std::string file_name = require_param(req, "file_name");

        if (!documents_.remove(pid, file_name)) {
            return error_response(404, "File not found");
        }
        return json_response(200, json{{"message", "File deleted successfully"}});
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Delete File Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::list_patients() {
    try {
        return json_response(200, json{{"patients", documents_.list_patients()}});
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "List Patients Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::create_patient(const crow::request& req) {
    try {
        std::string pid = require_field(parse_body(req), "pid");

        if (!documents_.create_patient(pid)) {
            return error_response(400, "Patient already exists");
        }
        return json_response(200, json{{"message", "Patient created"}, {"pid", pid}});
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Create Patient Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::delete_patient(const crow::request& req) {
    try {
        std::string pid = require_param(req, "pid");

        std::size_t deleted = documents_.delete_patient(pid);
        if (deleted == 0) {
            return error_response(404, "Patient not found");
        }
        return json_response(200, json{{"message", "Deleted " + std::to_string(deleted) +
                                                       " files for patient " + pid}});
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Delete Patient Error: " << e.what();
        return error_response(500, e.what());
    }
}

crow::response DocumentApi::admin_page() const {
    std::ifstream file(admin_ui_file_);
    crow::response res;
    res.set_header("Content-Type", "text/html; charset=utf-8");
    if (!file.is_open()) {
        res.code = 404;
        res.body = "<h1>Error: " + admin_ui_file_ + " not found on server.</h1>";
        return res;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    res.code = 200;
    res.body = ss.str();
    return res;
}

} // namespace clinic_relay
