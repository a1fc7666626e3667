// url.h - minimal http(s) URL helpers
#pragma once

#include <optional>
#include <string>

namespace modelswitch {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;  // always starts with '/'

    // scheme://host:port, as accepted by httplib::Client
    std::string origin() const;
};

// Parse an absolute http/https URL. Returns std::nullopt for anything else.
std::optional<HttpUrl> parseUrl(const std::string& url);

// Join a base path and a request path with exactly one '/' between them.
std::string joinUrlPath(const std::string& base_path, const std::string& path);

// Lower-case scheme/host and strip trailing slashes so two spellings of the
// same endpoint compare equal.
std::string normalizeBaseUrl(const std::string& url);

}  // namespace modelswitch
