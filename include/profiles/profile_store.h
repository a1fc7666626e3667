#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "probe/endpoint.h"

namespace modelswitch {

constexpr const char* kBaseUrlKey = "ANTHROPIC_BASE_URL";
constexpr const char* kAuthTokenKey = "ANTHROPIC_AUTH_TOKEN";

struct Profile {
    std::string name;
    std::string base_url;
    std::string token;
    std::optional<std::chrono::milliseconds> timeout;

    EndpointDescriptor toDescriptor() const;
};

/// Read-only view of the profile file.
///
/// The file is a JSON object mapping profile name to the environment it
/// activates:
///
///   { "work": { "ANTHROPIC_BASE_URL": "https://...", "ANTHROPIC_AUTH_TOKEN": "sk-..." } }
///
/// File order is preserved. An optional "timeout_ms" member overrides the
/// per-endpoint probe timeout for that profile.
class ProfileStore {
public:
    ProfileStore() = default;
    explicit ProfileStore(std::vector<Profile> profiles);

    /// Throws std::runtime_error when the file is missing or malformed.
    static ProfileStore loadFromFile(const std::filesystem::path& path);

    /// MODELSWITCH_PROFILES, else ./model_config.json
    static std::filesystem::path defaultPath();

    const std::vector<Profile>& profiles() const { return profiles_; }
    bool empty() const { return profiles_.empty(); }

    const Profile* find(const std::string& name) const;

    /// First profile whose base URL matches, ignoring case of scheme/host,
    /// default ports and trailing slashes.
    std::optional<std::string> findByBaseUrl(const std::string& base_url) const;

    /// Name of the profile the current environment points at
    /// (ANTHROPIC_BASE_URL), if any.
    std::optional<std::string> activeFromEnvironment() const;

    /// Descriptors for the named profiles in the given order, or for every
    /// profile when names is empty. Throws std::invalid_argument for an
    /// unknown name.
    std::vector<EndpointDescriptor> descriptors(const std::vector<std::string>& names = {}) const;

private:
    std::vector<Profile> profiles_;
};

}  // namespace modelswitch
