#include "probe/http_prober.h"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/json_utils.h"
#include "utils/url.h"

namespace modelswitch {

namespace {

using Clock = std::chrono::steady_clock;

struct Attempt {
    httplib::Error error{httplib::Error::Success};
    std::optional<int> status;
    std::chrono::microseconds elapsed{0};
    std::string body;
};

std::chrono::microseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

bool hostResolves(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (result) {
        ::freeaddrinfo(result);
    }
    return rc == 0;
}

// getaddrinfo cannot be cancelled, so the lookup runs on a detached thread
// and the caller stops waiting when the budget is spent. nullopt means the
// resolver did not answer in time.
std::optional<bool> hostResolvesWithin(const std::string& host, std::chrono::milliseconds budget) {
    struct Lookup {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<bool> resolved;
    };
    auto lookup = std::make_shared<Lookup>();
    try {
        std::thread([lookup, host]() {
            const bool ok = hostResolves(host);
            std::lock_guard<std::mutex> lock(lookup->mutex);
            lookup->resolved = ok;
            lookup->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::debug("DNS check for {} not started: {}", host, e.what());
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(lookup->mutex);
    lookup->cv.wait_for(lock, budget, [&lookup]() { return lookup->resolved.has_value(); });
    return lookup->resolved;
}

bool isTlsError(httplib::Error error) {
    return error == httplib::Error::SSLConnection ||
           error == httplib::Error::SSLLoadingCerts ||
           error == httplib::Error::SSLServerVerification;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url,
                                            std::chrono::milliseconds timeout,
                                            bool verify_certificate) {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(url.origin());
    if (!client->is_valid()) {
        return nullptr;
    }

    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    // Lets the warm-up connection carry the measured request.
    client->set_keep_alive(true);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client->enable_server_certificate_verification(verify_certificate);
#else
    (void)verify_certificate;
#endif
    return client;
}

httplib::Headers buildHeaders(const EndpointDescriptor& endpoint,
                              const HttpProbeOptions& options,
                              bool streaming) {
    httplib::Headers headers{
        {"anthropic-version", options.api_version},
        {"Accept", streaming ? "text/event-stream" : "application/json"},
    };
    if (!endpoint.token.empty()) {
        headers.emplace("x-api-key", endpoint.token);
        headers.emplace("Authorization", "Bearer " + endpoint.token);
    }
    return headers;
}

std::string buildBody(const HttpProbeOptions& options, bool streaming) {
    nlohmann::json body;
    body["model"] = options.probe_model;
    body["max_tokens"] = 1;
    body["messages"] = nlohmann::json::array({{{"role", "user"}, {"content", "ping"}}});
    body["stream"] = streaming;
    return body.dump();
}

void warmupConnection(httplib::Client& client,
                      const HttpUrl& url,
                      const EndpointDescriptor& endpoint,
                      const HttpProbeOptions& options) {
    auto res = client.Get(url.path, buildHeaders(endpoint, options, false));
    if (!res) {
        spdlog::debug("Probe {}: warm-up failed ({})", endpoint.name, httplib::to_string(res.error()));
        // A half-answered warm-up must not hold the socket the probe reuses.
        client.stop();
    }
}

Attempt sendProbe(httplib::Client& client,
                  const HttpUrl& url,
                  const EndpointDescriptor& endpoint,
                  const HttpProbeOptions& options,
                  bool streaming) {
    httplib::Request req;
    req.method = "POST";
    req.path = joinUrlPath(url.path, options.probe_path);
    req.headers = buildHeaders(endpoint, options, streaming);
    req.set_header("Content-Type", "application/json");
    req.body = buildBody(options, streaming);

    Attempt attempt;
    const auto start = Clock::now();
    if (streaming) {
        req.response_handler = [&attempt, start](const httplib::Response& res) {
            attempt.elapsed = since(start);
            attempt.status = res.status;
            return false;  // headers are the first byte; the event stream is not needed
        };
    }

    auto res = client.send(req);
    if (res) {
        if (!attempt.status) {
            attempt.elapsed = since(start);
            attempt.status = res->status;
        }
        attempt.body = res->body;
        return attempt;
    }

    if (attempt.status && res.error() == httplib::Error::Canceled) {
        return attempt;
    }
    attempt.status.reset();
    attempt.error = res.error();
    attempt.elapsed = since(start);
    return attempt;
}

ErrorKind classifyTransportError(const Attempt& attempt,
                                 const HttpUrl& url,
                                 std::chrono::milliseconds timeout) {
    if (isTlsError(attempt.error)) {
        return ErrorKind::TlsFailure;
    }
    const bool near_deadline = attempt.elapsed >= timeout * 9 / 10;
    if (attempt.error == httplib::Error::Connection) {
        if (near_deadline) {
            return ErrorKind::Timeout;
        }
        // httplib reports failed lookups and refused connections alike; ask
        // the resolver again with whatever is left of the probe timeout.
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(timeout - attempt.elapsed);
        const auto resolved = hostResolvesWithin(url.host, remaining);
        if (!resolved) {
            return ErrorKind::Timeout;
        }
        return *resolved ? ErrorKind::ConnectionRefused : ErrorKind::DnsFailure;
    }
    // Read/Write and the rest: a silent peer is a timeout, a peer that hung
    // up without a valid status line is a malformed answer.
    return near_deadline ? ErrorKind::Timeout : ErrorKind::MalformedResponse;
}

std::string describeHttpError(int status, const std::string& body) {
    std::string detail = "HTTP " + std::to_string(status);
    if (auto json = parse_json(body)) {
        if (json->is_object() && json->contains("error")) {
            const auto& err = (*json)["error"];
            std::string message;
            if (err.is_object()) {
                message = get_or<std::string>(err, "message", "");
            } else if (err.is_string()) {
                message = err.get<std::string>();
            }
            if (!message.empty()) {
                detail += ": " + message;
            }
        }
    }
    return detail;
}

ProbeOutcome toOutcome(const EndpointDescriptor& endpoint,
                       const HttpUrl& url,
                       const Attempt& attempt,
                       ProbeMode mode,
                       std::chrono::milliseconds timeout,
                       const StatusPolicy& policy) {
    if (!attempt.status) {
        auto out = ProbeOutcome::unreachable(endpoint.name,
                                             classifyTransportError(attempt, url, timeout),
                                             httplib::to_string(attempt.error));
        out.mode = mode;
        return out;
    }

    ProbeOutcome out;
    out.name = endpoint.name;
    out.mode = mode;
    out.reachable = true;
    out.latency = attempt.elapsed;
    out.http_status = *attempt.status;
    if (policy.isRateLimited(*attempt.status)) {
        out.error_kind = ErrorKind::RateLimited;
    }
    if (*attempt.status >= 400) {
        out.raw_detail = describeHttpError(*attempt.status, attempt.body);
    }
    return out;
}

}  // namespace

std::optional<TlsPolicy> parseTlsPolicy(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "strict") return TlsPolicy::Strict;
    if (lower == "relaxed") return TlsPolicy::Relaxed;
    if (lower == "insecure") return TlsPolicy::Insecure;
    return std::nullopt;
}

const char* to_string(TlsPolicy policy) {
    switch (policy) {
        case TlsPolicy::Strict:
            return "strict";
        case TlsPolicy::Relaxed:
            return "relaxed";
        case TlsPolicy::Insecure:
            return "insecure";
    }
    return "unknown";
}

HttpProber::HttpProber(HttpProbeOptions options) : options_(std::move(options)) {}

ProbeOutcome HttpProber::probe(const EndpointDescriptor& endpoint,
                               std::chrono::milliseconds timeout) {
    timeout = std::min(timeout, kMaxProbeTimeout);
    auto url = parseUrl(endpoint.base_url);
    if (!url) {
        return ProbeOutcome::unreachable(endpoint.name, ErrorKind::Internal,
                                         "invalid base URL: " + endpoint.base_url);
    }

    const bool https = url->scheme == "https";
    const bool verify = https && options_.tls_policy != TlsPolicy::Insecure;
    auto client = makeClient(*url, timeout, verify);
    if (!client) {
        return ProbeOutcome::unreachable(endpoint.name,
                                         https ? ErrorKind::TlsFailure : ErrorKind::Internal,
                                         https ? "HTTPS is not supported in this build"
                                               : "failed to create HTTP client");
    }

    if (options_.warmup) {
        warmupConnection(*client, *url, endpoint, options_);
    }

    Attempt attempt = sendProbe(*client, *url, endpoint, options_, /*streaming=*/true);

    if (verify && options_.tls_policy == TlsPolicy::Relaxed && isTlsError(attempt.error)) {
        spdlog::warn("Probe {}: TLS verification failed ({}), retrying without verification",
                     endpoint.name, httplib::to_string(attempt.error));
        client = makeClient(*url, timeout, /*verify_certificate=*/false);
        if (client) {
            attempt = sendProbe(*client, *url, endpoint, options_, /*streaming=*/true);
        }
    }

    ProbeMode mode = ProbeMode::Streaming;
    if (client && attempt.status && options_.status_policy.requiresFallback(*attempt.status)) {
        spdlog::debug("Probe {}: streaming request rejected with {}, retrying without streaming",
                      endpoint.name, *attempt.status);
        attempt = sendProbe(*client, *url, endpoint, options_, /*streaming=*/false);
        mode = ProbeMode::NonStreaming;
    }

    auto outcome = toOutcome(endpoint, *url, attempt, mode, timeout, options_.status_policy);
    if (outcome.reachable) {
        spdlog::debug("Probe {}: status={} latency={}us mode={}", endpoint.name,
                      outcome.http_status.value_or(0), outcome.latency->count(), to_string(mode));
    } else {
        spdlog::debug("Probe {}: unreachable ({}) {}", endpoint.name,
                      to_string(*outcome.error_kind), outcome.raw_detail.value_or(""));
    }
    return outcome;
}

}  // namespace modelswitch
