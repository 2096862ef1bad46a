#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace clinic_relay {

/// Reads the [meta] table of a TOML file as a JSON object.
/// Throws std::runtime_error when the file or the table is missing.
nlohmann::json load_metadata(const std::string& path);

} // namespace clinic_relay
