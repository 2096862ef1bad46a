#include "clinic_relay/metadata.hpp"

#include <toml++/toml.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace clinic_relay {

namespace {

json scalar_to_json(const toml::node& val) {
    if (val.is_string()) return std::string(val.as_string()->get());
    if (val.is_integer()) return val.as_integer()->get();
    if (val.is_floating_point()) return val.as_floating_point()->get();
    if (val.is_boolean()) return val.as_boolean()->get();
    return nullptr;
}

} // namespace

json load_metadata(const std::string& path) {
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path + ": " + std::string(e.description()));
    }

    auto meta_node = tbl["meta"];
    if (!meta_node.is_table()) {
        throw std::runtime_error("Missing [meta] section in " + path);
    }

    // Convert TOML table to JSON object
    json result = json::object();
    auto& meta = *meta_node.as_table();
    for (auto&& [key, val] : meta) {
        std::string k(key.str());
        if (val.is_array()) {
            json arr = json::array();
            for (auto&& elem : *val.as_array()) {
                json item = scalar_to_json(elem);
                if (!item.is_null()) arr.push_back(std::move(item));
            }
            result[k] = arr;
        } else {
            json item = scalar_to_json(val);
            if (!item.is_null()) result[k] = std::move(item);
        }
    }
    return result;
}

} // namespace clinic_relay
