// json_utils.h - helpers for safe JSON parsing and extraction
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace modelswitch {

// Parse JSON string; returns std::nullopt on error and fills error message if provided.
std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error = nullptr);

// Read and parse an order-preserving JSON document from disk.
// Throws std::runtime_error naming the path when the file is missing or malformed.
nlohmann::ordered_json read_json_file(const std::filesystem::path& path);

// Get value if present and convertible; otherwise fallback is returned.
template <typename T, typename Json>
T get_or(const Json& j, const std::string& key, const T& fallback) {
    if (!j.is_object() || !j.contains(key)) return fallback;
    try {
        return j.at(key).template get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

// Check that all required keys exist; returns true if all present.
// missing_key receives the first missing key when provided.
template <typename Json>
bool has_required_keys(const Json& j,
                       const std::vector<std::string>& keys,
                       std::string* missing_key = nullptr) {
    for (const auto& k : keys) {
        if (!j.contains(k)) {
            if (missing_key) *missing_key = k;
            return false;
        }
    }
    return true;
}

}  // namespace modelswitch
