#ifndef KEYSHAPE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define KEYSHAPE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace keyshape::json {

// Parse JSON text; source names the input in error messages
inline nlohmann::json parse_json(const std::string& text, const std::string& source) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + source + ": " + e.what());
    }
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_json(buffer.str(), path);
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
}

}  // namespace keyshape::json

#endif // KEYSHAPE_SERIALIZATION_JSON_SERIALIZATION_HPP
