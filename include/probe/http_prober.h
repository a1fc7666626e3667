#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "probe/prober.h"
#include "probe/status_policy.h"

namespace modelswitch {

/// How certificate problems are handled.
enum class TlsPolicy {
    Strict,    // verification failure is a tlsFailure
    Relaxed,   // verification failure is retried once without verification
    Insecure,  // never verify
};

std::optional<TlsPolicy> parseTlsPolicy(const std::string& text);
const char* to_string(TlsPolicy policy);

struct HttpProbeOptions {
    bool warmup{false};
    TlsPolicy tls_policy{TlsPolicy::Relaxed};
    StatusPolicy status_policy;
    std::string probe_path{"/v1/messages"};
    std::string probe_model{"claude-3-5-haiku-latest"};
    std::string api_version{"2023-06-01"};
};

/// Probes an Anthropic-compatible messages endpoint.
///
/// The primary measurement is a one-token streaming request whose latency is
/// taken when the response headers arrive; the body is never awaited. An
/// endpoint that rejects the streaming form with a status listed in
/// StatusPolicy::fallback_statuses is measured once more without streaming.
///
/// Each call builds its own client, so credentials never cross endpoints and
/// concurrent calls share nothing but the read-only options.
class HttpProber : public Prober {
public:
    explicit HttpProber(HttpProbeOptions options = {});

    ProbeOutcome probe(const EndpointDescriptor& endpoint,
                       std::chrono::milliseconds timeout) override;

    const HttpProbeOptions& options() const { return options_; }

private:
    HttpProbeOptions options_;
};

}  // namespace modelswitch
