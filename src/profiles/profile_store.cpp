#include "profiles/profile_store.h"

#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "utils/json_utils.h"
#include "utils/url.h"

namespace modelswitch {

EndpointDescriptor Profile::toDescriptor() const {
    EndpointDescriptor descriptor;
    descriptor.name = name;
    descriptor.base_url = base_url;
    descriptor.token = token;
    descriptor.timeout_override = timeout;
    return descriptor;
}

ProfileStore::ProfileStore(std::vector<Profile> profiles) : profiles_(std::move(profiles)) {}

ProfileStore ProfileStore::loadFromFile(const std::filesystem::path& path) {
    auto root = read_json_file(path);
    if (!root.is_object()) {
        throw std::runtime_error("Profile file " + path.string() + " must contain a JSON object");
    }

    std::vector<Profile> profiles;
    for (const auto& item : root.items()) {
        const auto& value = item.value();
        if (!value.is_object()) {
            throw std::runtime_error("Profile '" + item.key() + "' in " + path.string() +
                                     " must be an object");
        }
        std::string missing;
        if (!has_required_keys(value, {kBaseUrlKey}, &missing)) {
            throw std::runtime_error("Profile '" + item.key() + "' is missing " + missing);
        }

        Profile profile;
        profile.name = item.key();
        profile.base_url = get_or<std::string>(value, kBaseUrlKey, "");
        profile.token = get_or<std::string>(value, kAuthTokenKey, "");
        const auto timeout_ms = get_or<long long>(value, "timeout_ms", 0);
        if (timeout_ms > 0) {
            profile.timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (profile.base_url.empty()) {
            throw std::runtime_error("Profile '" + item.key() + "' has an empty " + kBaseUrlKey);
        }
        profiles.push_back(std::move(profile));
    }

    spdlog::debug("Loaded {} profiles from {}", profiles.size(), path.string());
    return ProfileStore(std::move(profiles));
}

std::filesystem::path ProfileStore::defaultPath() {
    if (const char* env = std::getenv("MODELSWITCH_PROFILES")) {
        if (*env) return env;
    }
    return std::filesystem::path("model_config.json");
}

const Profile* ProfileStore::find(const std::string& name) const {
    for (const auto& profile : profiles_) {
        if (profile.name == name) return &profile;
    }
    return nullptr;
}

std::optional<std::string> ProfileStore::findByBaseUrl(const std::string& base_url) const {
    if (base_url.empty()) return std::nullopt;
    const auto wanted = normalizeBaseUrl(base_url);
    for (const auto& profile : profiles_) {
        if (normalizeBaseUrl(profile.base_url) == wanted) {
            return profile.name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ProfileStore::activeFromEnvironment() const {
    const char* env = std::getenv(kBaseUrlKey);
    if (!env || !*env) return std::nullopt;
    return findByBaseUrl(env);
}

std::vector<EndpointDescriptor> ProfileStore::descriptors(const std::vector<std::string>& names) const {
    std::vector<EndpointDescriptor> out;
    if (names.empty()) {
        out.reserve(profiles_.size());
        for (const auto& profile : profiles_) {
            out.push_back(profile.toDescriptor());
        }
        return out;
    }

    out.reserve(names.size());
    for (const auto& name : names) {
        const auto* profile = find(name);
        if (!profile) {
            throw std::invalid_argument("unknown profile: " + name);
        }
        out.push_back(profile->toDescriptor());
    }
    return out;
}

}  // namespace modelswitch
