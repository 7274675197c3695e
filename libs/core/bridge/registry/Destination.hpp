#pragma once
/*
wsbridge — Destination
Role: One named endpoint: its connection state, pending payload FIFO, retry timer and live transport.
Threading: Everything except id() and strand() is confined to strand(); ConnectionManager is the only writer.
Related: ConnectionManager.hpp, DestinationRegistry.hpp, WsTransport.hpp.
*/
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include "bridge/ws/BackoffPolicy.hpp"
#include "bridge/ws/Endpoint.hpp"
#include "bridge/ws/WsTransport.hpp"

enum class ConnectionState { Disconnected, Connecting, Open, Closing, Failed };

inline const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Open:         return "Open";
        case ConnectionState::Closing:      return "Closing";
        case ConnectionState::Failed:       return "Failed";
    }
    return "Disconnected";
}

class Destination {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    Destination(std::string id, Strand strand, BackoffConfig backoff)
        : m_id(std::move(id))
        , m_strand(std::move(strand))
        , m_retryTimer(m_strand)
        , m_backoff(backoff)
    {}

    Destination(const Destination&) = delete;
    Destination& operator=(const Destination&) = delete;

    const std::string& id() const { return m_id; }
    Strand& strand() { return m_strand; }

    // Strand-confined accessors
    ConnectionState state() const { return m_state; }
    const std::optional<Endpoint>& target() const { return m_target; }
    const std::optional<std::string>& lastError() const { return m_lastError; }
    const std::deque<std::string>& pendingSends() const { return m_pending; }
    bool hasTransport() const { return static_cast<bool>(m_transport); }
    bool retryScheduled() const { return m_retryScheduled; }
    const BackoffPolicy& backoff() const { return m_backoff; }

private:
    friend class ConnectionManager;

    const std::string               m_id;
    Strand                          m_strand;
    boost::asio::steady_timer       m_retryTimer;
    BackoffPolicy                   m_backoff;

    ConnectionState                 m_state = ConnectionState::Disconnected;
    std::optional<Endpoint>         m_target;
    std::optional<std::string>      m_lastError;
    std::deque<std::string>         m_pending;
    std::shared_ptr<WsTransport>    m_transport;

    uint64_t                        m_generation = 0;   // bumps whenever m_transport is replaced
    bool                            m_retryScheduled = false;
    bool                            m_reconnectAfterClose = false;
    std::optional<std::string>      m_reportedBadTarget; // last invalid value surfaced to the host
};
