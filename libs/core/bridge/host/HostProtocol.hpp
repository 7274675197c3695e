#pragma once
#include <string>
#include <string_view>
#include "HostCommand.hpp"
#include "bridge/events/BridgeEvent.hpp"

// Line-delimited JSON codec for the host channel. Pure: no I/O, no state.
class HostProtocol {
public:
    // Parse one complete line (without its terminator)
    static ParseResult parse(std::string_view line);

    // One event as a single JSON line (without the terminator)
    static std::string serialize(const BridgeEvent& event);
};
