#pragma once
#include "BridgeEvent.hpp"

// Receives every event destined for the host. Implementations must be callable
// from any destination strand and from the host strand.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void publish(BridgeEvent event) = 0;
};
