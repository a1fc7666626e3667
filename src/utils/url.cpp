#include "utils/url.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace modelswitch {

namespace {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace

std::string HttpUrl::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::optional<HttpUrl> parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:?#]+)(?::(\d+))?([^?#]*)(?:[?#].*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, re)) {
        return std::nullopt;
    }

    HttpUrl parsed;
    parsed.scheme = toLowerAscii(match[1].str());
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }
    parsed.host = match[2].str();
    if (match[3].matched) {
        try {
            parsed.port = std::stoi(match[3].str());
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (parsed.port <= 0 || parsed.port > 65535) {
            return std::nullopt;
        }
    } else {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    }
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

std::string joinUrlPath(const std::string& base_path, const std::string& path) {
    std::string base = trimTrailingSlash(base_path);
    if (path.empty()) {
        return base.empty() ? "/" : base;
    }
    if (path.front() == '/') {
        return base + path;
    }
    return base + "/" + path;
}

std::string normalizeBaseUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        return trimTrailingSlash(url);
    }
    const bool default_port = (parsed->scheme == "https" && parsed->port == 443) ||
                              (parsed->scheme == "http" && parsed->port == 80);
    std::string out = parsed->scheme + "://" + toLowerAscii(parsed->host);
    if (!default_port) {
        out += ":" + std::to_string(parsed->port);
    }
    return out + trimTrailingSlash(parsed->path);
}

}  // namespace modelswitch
