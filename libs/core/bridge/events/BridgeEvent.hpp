#pragma once
#include <cstddef>
#include <optional>
#include <string>

enum class EventKind {
    Sent,          // payload handed to an open connection
    Queued,        // payload waiting for the connection to open
    Error,         // protocol, address or delivery error
    Dropped,       // oldest pending payload evicted by queue overflow
    Connected,     // connection reached Open
    Disconnected,  // connection left Open/Connecting (failure or explicit close)
    Message,       // inbound frame from the remote endpoint
    Status,        // answer to a list command
    Removed        // destination erased from the registry
};

// One outbound line to the host
struct BridgeEvent {
    EventKind                  kind = EventKind::Error;
    std::optional<std::string> destination;
    std::optional<std::string> detail;
    std::optional<std::string> correlationId;
    std::optional<std::size_t> pending;
};

inline const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::Sent:         return "sent";
        case EventKind::Queued:       return "queued";
        case EventKind::Error:        return "error";
        case EventKind::Dropped:      return "dropped";
        case EventKind::Connected:    return "connected";
        case EventKind::Disconnected: return "disconnected";
        case EventKind::Message:      return "message";
        case EventKind::Status:       return "status";
        case EventKind::Removed:      return "removed";
    }
    return "error";
}
