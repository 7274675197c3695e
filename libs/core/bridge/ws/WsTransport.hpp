#pragma once
#include <deque>
#include <functional>
#include <string>
#include "Endpoint.hpp"

// Pure transport interface (no routing or retry logic).
// One instance carries one connection attempt; reconnects use a fresh instance.
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // own the data to avoid dangling views
    using StatusCb  = std::function<void(bool)>;        // true once on open, false once when down
    using ErrorCb   = std::function<void(std::string)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    virtual void connect(const Endpoint& endpoint) = 0;
    virtual void close() = 0;
    virtual void send(std::string msg) = 0; // serialized by implementation

    // Payloads accepted by send() but not confirmed written, oldest first.
    // Only meaningful after the status callback reported false.
    virtual std::deque<std::string> takeUnsent() = 0;

    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;
};
