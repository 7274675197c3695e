#pragma once
/*
wsbridge — ConnectionManager
Role: Drives each Destination through Disconnected/Connecting/Open/Closing/Failed.
Inputs/Outputs: Payloads from MessageRouter; connection, drop, error and inbound-frame events to IEventSink.
Threading: Every public call except beginShutdown/waitForIdle/liveTransports must run on the
           destination's strand. Transport callbacks are re-posted onto that strand and filtered
           by transport generation, so a late callback from a discarded transport is ignored.
Retry: Failed schedules a reconnect with BackoffPolicy; Open resets it. Address errors never retry.
Related: Destination.hpp, WsTransport.hpp, BackoffPolicy.hpp, TargetResolver.hpp.
*/
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "bridge/events/IEventSink.hpp"
#include "bridge/registry/Destination.hpp"
#include "bridge/registry/TargetResolver.hpp"
#include "WsTransport.hpp"

enum class SendOutcome { SentImmediately, Enqueued, Rejected };

class ConnectionManager {
public:
    using Strand = Destination::Strand;
    using TransportFactory = std::function<std::shared_ptr<WsTransport>(Strand, const Endpoint&)>;

    ConnectionManager(TransportFactory factory,
                      TargetResolver& resolver,
                      IEventSink& sink,
                      size_t queueCapacity);

    // Transmit now when Open, queue otherwise; Disconnected/Failed also start a connect.
    SendOutcome send(const std::shared_ptr<Destination>& dest,
                     std::string payload,
                     const std::optional<std::string>& correlationId = std::nullopt);

    // Start connecting unless already Open/Connecting. False when the target does not resolve.
    bool connect(const std::shared_ptr<Destination>& dest,
                 const std::optional<std::string>& correlationId = std::nullopt);

    // Explicit close: Open/Connecting -> Closing -> Disconnected. Pending payloads are kept.
    void close(const std::shared_ptr<Destination>& dest);

    // Close and forget: drops the transport and pending payloads. Returns how many were discarded.
    size_t teardown(const std::shared_ptr<Destination>& dest);

    // Cancel the retry timer and close the transport; no new retries after beginShutdown().
    void shutdown(const std::shared_ptr<Destination>& dest);

    void beginShutdown() { m_shuttingDown.store(true); }
    int liveTransports() const { return m_liveTransports.load(); }

    // Blocks until no transport is live or the deadline passes. Returns true when idle.
    bool waitForIdle(std::chrono::milliseconds timeout);

    size_t queueCapacity() const { return m_queueCapacity; }

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

private:
    // Transport callbacks (on strand)
    void onTransportStatus(const std::shared_ptr<Destination>& dest, uint64_t generation, bool up);
    void onTransportError(const std::shared_ptr<Destination>& dest, uint64_t generation, std::string error);
    void onTransportMessage(const std::shared_ptr<Destination>& dest, uint64_t generation, std::string payload);

    // Helpers
    void enterFailed(const std::shared_ptr<Destination>& dest);
    void scheduleRetry(const std::shared_ptr<Destination>& dest);
    void flushPending(const std::shared_ptr<Destination>& dest);
    void enqueue(const std::shared_ptr<Destination>& dest, std::string payload);
    void requeueFront(const std::shared_ptr<Destination>& dest, std::deque<std::string> unsent);
    void trimToCapacity(const std::shared_ptr<Destination>& dest);
    void releaseTransport(const std::shared_ptr<Destination>& dest);

    TransportFactory    m_factory;
    TargetResolver&     m_resolver;
    IEventSink&         m_sink;
    const size_t        m_queueCapacity;

    std::atomic<bool>   m_shuttingDown{false};
    std::atomic<int>    m_liveTransports{0};
    std::mutex          m_idleMutex;
    std::condition_variable m_idleCv;
};
