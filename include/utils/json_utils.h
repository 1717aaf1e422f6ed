// json_utils.h - helpers for JSON index files and safe value extraction
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace modelfetch {

// Parse JSON string; returns std::nullopt on error and fills error message if provided.
std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error = nullptr);

// Read and parse a JSON file. std::nullopt when missing or malformed.
std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path, std::string* error = nullptr);

// Write to "<path>.tmp" then rename over path. Returns false on I/O failure.
bool write_json_atomic(const std::filesystem::path& path, const nlohmann::json& j, std::string* error = nullptr);

// Get value if present and convertible; otherwise fallback is returned.
template <typename T>
T get_or(const nlohmann::json& j, const std::string& key, const T& fallback) {
    if (!j.is_object() || !j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

}  // namespace modelfetch
