#pragma once

#include <chrono>

#include "probe/endpoint.h"

namespace modelswitch {

/// Measures one endpoint. Implementations are shared by all workers of a
/// batch and must tolerate concurrent calls.
///
/// probe() reports expected network failures through the returned outcome's
/// error_kind; an exception escaping probe() is treated by the scheduler as
/// an internal fault of that single endpoint.
class Prober {
public:
    virtual ~Prober() = default;

    virtual ProbeOutcome probe(const EndpointDescriptor& endpoint,
                               std::chrono::milliseconds timeout) = 0;
};

}  // namespace modelswitch
