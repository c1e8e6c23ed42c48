#ifndef WIDEPATH_SERIALIZATION_JSON_SERIALIZATION_HPP
#define WIDEPATH_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <common/errors.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>

namespace widepath::json {

// Read JSON from file
inline nlohmann::json read_json_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw InputNotFoundError(path);
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
}

}  // namespace widepath::json

#endif // WIDEPATH_SERIALIZATION_JSON_SERIALIZATION_HPP
