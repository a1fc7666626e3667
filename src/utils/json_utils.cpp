#include "utils/json_utils.h"

#include <fstream>
#include <stdexcept>

namespace modelswitch {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        auto j = nlohmann::json::parse(body);
        return j;
    } catch (const std::exception& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

nlohmann::ordered_json read_json_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    try {
        return nlohmann::ordered_json::parse(ifs);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

}  // namespace modelswitch
