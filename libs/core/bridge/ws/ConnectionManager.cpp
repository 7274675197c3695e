#include "ConnectionManager.hpp"
#include "BridgeLogging.hpp"
#include <boost/asio/post.hpp>
#include <QString>

namespace net = boost::asio;

namespace {

QString q(const std::string& s) { return QString::fromStdString(s); }

} // namespace

ConnectionManager::ConnectionManager(TransportFactory factory,
                                     TargetResolver& resolver,
                                     IEventSink& sink,
                                     size_t queueCapacity)
    : m_factory(std::move(factory))
    , m_resolver(resolver)
    , m_sink(sink)
    , m_queueCapacity(queueCapacity > 0 ? queueCapacity : 1)
{}

SendOutcome ConnectionManager::send(const std::shared_ptr<Destination>& dest,
                                    std::string payload,
                                    const std::optional<std::string>& correlationId) {
    switch (dest->m_state) {
        case ConnectionState::Open:
            dest->m_transport->send(std::move(payload));
            bLog_NetN(20, QString("Sent message to '%1'").arg(q(dest->id())));
            return SendOutcome::SentImmediately;

        case ConnectionState::Connecting:
            enqueue(dest, std::move(payload));
            return SendOutcome::Enqueued;

        case ConnectionState::Closing:
            // delivered after the close completes and a new connection opens
            dest->m_reconnectAfterClose = true;
            enqueue(dest, std::move(payload));
            return SendOutcome::Enqueued;

        case ConnectionState::Disconnected:
        case ConnectionState::Failed:
            break;
    }

    // A scheduled backoff retry is the pending connect attempt; do not cut it short
    if (dest->m_state == ConnectionState::Failed && dest->m_retryScheduled) {
        enqueue(dest, std::move(payload));
        return SendOutcome::Enqueued;
    }

    if (!connect(dest, correlationId)) {
        return SendOutcome::Rejected;
    }
    enqueue(dest, std::move(payload));
    return SendOutcome::Enqueued;
}

bool ConnectionManager::connect(const std::shared_ptr<Destination>& dest,
                                const std::optional<std::string>& correlationId) {
    switch (dest->m_state) {
        case ConnectionState::Open:
        case ConnectionState::Connecting:
            return true;
        case ConnectionState::Closing:
            dest->m_reconnectAfterClose = true;
            return true;
        case ConnectionState::Disconnected:
        case ConnectionState::Failed:
            break;
    }

    dest->m_retryTimer.cancel();
    dest->m_retryScheduled = false;

    auto resolution = m_resolver.resolve(dest->id());
    if (!resolution.endpoint) {
        dest->m_state = ConnectionState::Failed;
        dest->m_lastError = "invalid destination address '" + resolution.uri + "': " + resolution.error;

        // Surface once per offending value; a correlated request always gets its answer
        const bool firstReport = dest->m_reportedBadTarget != resolution.uri;
        if (firstReport || correlationId) {
            bLog_Warning(QString("Destination '%1': %2").arg(q(dest->id()), q(*dest->m_lastError)));
            m_sink.publish(BridgeEvent{EventKind::Error, dest->id(), dest->m_lastError, correlationId, std::nullopt});
        }
        dest->m_reportedBadTarget = resolution.uri;
        return false;
    }

    dest->m_reportedBadTarget.reset();
    dest->m_target = resolution.endpoint;

    releaseTransport(dest);
    const uint64_t generation = ++dest->m_generation;
    auto transport = m_factory(dest->m_strand, *resolution.endpoint);
    std::weak_ptr<Destination> weak = dest;

    transport->onStatus([this, weak, generation](bool up) {
        if (auto d = weak.lock()) {
            net::post(d->strand(), [this, d, generation, up]() { onTransportStatus(d, generation, up); });
        }
    });
    transport->onError([this, weak, generation](std::string err) {
        if (auto d = weak.lock()) {
            net::post(d->strand(), [this, d, generation, e = std::move(err)]() mutable {
                onTransportError(d, generation, std::move(e));
            });
        }
    });
    transport->onMessage([this, weak, generation](std::string payload) {
        if (auto d = weak.lock()) {
            net::post(d->strand(), [this, d, generation, p = std::move(payload)]() mutable {
                onTransportMessage(d, generation, std::move(p));
            });
        }
    });

    dest->m_transport = transport;
    ++m_liveTransports;
    dest->m_state = ConnectionState::Connecting;
    bLog_Net(QString("Connecting '%1' -> %2 (attempt %3)")
        .arg(q(dest->id()), q(resolution.endpoint->toString()))
        .arg(dest->m_backoff.attempts() + 1));
    transport->connect(*resolution.endpoint);
    return true;
}

void ConnectionManager::close(const std::shared_ptr<Destination>& dest) {
    dest->m_retryTimer.cancel();
    dest->m_retryScheduled = false;
    dest->m_reconnectAfterClose = false;

    switch (dest->m_state) {
        case ConnectionState::Open:
        case ConnectionState::Connecting:
            dest->m_state = ConnectionState::Closing;
            bLog_Net(QString("Closing '%1'").arg(q(dest->id())));
            dest->m_transport->close();
            break;
        case ConnectionState::Failed:
            dest->m_state = ConnectionState::Disconnected;
            m_sink.publish(BridgeEvent{EventKind::Disconnected, dest->id(), std::string("closed"),
                                       std::nullopt, dest->m_pending.size()});
            break;
        case ConnectionState::Closing:
        case ConnectionState::Disconnected:
            break;
    }
}

size_t ConnectionManager::teardown(const std::shared_ptr<Destination>& dest) {
    dest->m_retryTimer.cancel();
    dest->m_retryScheduled = false;
    dest->m_reconnectAfterClose = false;

    if (dest->m_transport) {
        dest->m_transport->close();
    }
    releaseTransport(dest);
    ++dest->m_generation;
    dest->m_state = ConnectionState::Disconnected;

    const size_t discarded = dest->m_pending.size();
    dest->m_pending.clear();
    bLog_Net(QString("Removed '%1' (%2 pending discarded)").arg(q(dest->id())).arg(discarded));
    return discarded;
}

void ConnectionManager::shutdown(const std::shared_ptr<Destination>& dest) {
    dest->m_retryTimer.cancel();
    dest->m_retryScheduled = false;
    dest->m_reconnectAfterClose = false;

    if (dest->m_state == ConnectionState::Open || dest->m_state == ConnectionState::Connecting) {
        dest->m_state = ConnectionState::Closing;
        dest->m_transport->close();
    } else if (dest->m_state == ConnectionState::Failed) {
        dest->m_state = ConnectionState::Disconnected;
    }
}

bool ConnectionManager::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_idleMutex);
    return m_idleCv.wait_for(lock, timeout, [this]{ return m_liveTransports.load() <= 0; });
}

void ConnectionManager::onTransportStatus(const std::shared_ptr<Destination>& dest, uint64_t generation, bool up) {
    if (generation != dest->m_generation) return;

    if (up) {
        if (dest->m_state != ConnectionState::Connecting) return;
        dest->m_state = ConnectionState::Open;
        dest->m_lastError.reset();
        dest->m_backoff.reset();
        bLog_Net(QString("Destination '%1' open (%2 pending)").arg(q(dest->id())).arg(dest->m_pending.size()));
        m_sink.publish(BridgeEvent{EventKind::Connected, dest->id(),
                                   dest->m_target ? std::optional<std::string>(dest->m_target->toString()) : std::nullopt,
                                   std::nullopt, dest->m_pending.size()});
        flushPending(dest);
        return;
    }

    auto unsent = dest->m_transport ? dest->m_transport->takeUnsent() : std::deque<std::string>{};
    releaseTransport(dest);
    ++dest->m_generation;
    requeueFront(dest, std::move(unsent));

    switch (dest->m_state) {
        case ConnectionState::Closing: {
            dest->m_state = ConnectionState::Disconnected;
            m_sink.publish(BridgeEvent{EventKind::Disconnected, dest->id(), std::string("closed"),
                                       std::nullopt, dest->m_pending.size()});
            const bool reconnect = dest->m_reconnectAfterClose && !dest->m_pending.empty() && !m_shuttingDown.load();
            dest->m_reconnectAfterClose = false;
            if (reconnect) connect(dest);
            break;
        }
        case ConnectionState::Open:
        case ConnectionState::Connecting:
            enterFailed(dest);
            break;
        case ConnectionState::Disconnected:
        case ConnectionState::Failed:
            break;
    }
}

void ConnectionManager::onTransportError(const std::shared_ptr<Destination>& dest, uint64_t generation, std::string error) {
    if (generation != dest->m_generation) return;
    bLog_Net(QString("Transport error on '%1': %2").arg(q(dest->id()), q(error)));
    dest->m_lastError = std::move(error);
}

void ConnectionManager::onTransportMessage(const std::shared_ptr<Destination>& dest, uint64_t generation, std::string payload) {
    if (generation != dest->m_generation) return;
    bLog_NetN(20, QString("Inbound frame from '%1' (%2 bytes)").arg(q(dest->id())).arg(payload.size()));
    m_sink.publish(BridgeEvent{EventKind::Message, dest->id(), std::move(payload), std::nullopt, std::nullopt});
}

void ConnectionManager::enterFailed(const std::shared_ptr<Destination>& dest) {
    dest->m_state = ConnectionState::Failed;
    if (!dest->m_lastError) {
        dest->m_lastError = "connection lost";
    }
    m_sink.publish(BridgeEvent{EventKind::Disconnected, dest->id(), dest->m_lastError,
                               std::nullopt, dest->m_pending.size()});
    scheduleRetry(dest);
}

void ConnectionManager::scheduleRetry(const std::shared_ptr<Destination>& dest) {
    if (m_shuttingDown.load()) return;

    const auto delay = dest->m_backoff.nextDelay();
    bLog_Net(QString("Scheduling reconnect of '%1' in %2ms (attempt %3)...")
        .arg(q(dest->id()))
        .arg(static_cast<qlonglong>(delay.count()))
        .arg(dest->m_backoff.attempts()));

    dest->m_retryScheduled = true;
    dest->m_retryTimer.expires_after(delay);
    std::weak_ptr<Destination> weak = dest;
    // NON-BLOCKING timer-based reconnect; the timer runs on the destination strand
    dest->m_retryTimer.async_wait([this, weak](boost::system::error_code ec) {
        auto d = weak.lock();
        if (ec || !d || m_shuttingDown.load()) return;
        d->m_retryScheduled = false;
        if (d->m_state != ConnectionState::Failed) return;
        bLog_Net(QString("Attempting reconnection of '%1'...").arg(q(d->id())));
        connect(d);
    });
}

void ConnectionManager::flushPending(const std::shared_ptr<Destination>& dest) {
    // The transport writes in order and hands back the unsent tail if a write fails
    while (!dest->m_pending.empty() && dest->m_state == ConnectionState::Open) {
        dest->m_transport->send(std::move(dest->m_pending.front()));
        dest->m_pending.pop_front();
    }
}

void ConnectionManager::enqueue(const std::shared_ptr<Destination>& dest, std::string payload) {
    dest->m_pending.push_back(std::move(payload));
    trimToCapacity(dest);
}

void ConnectionManager::requeueFront(const std::shared_ptr<Destination>& dest, std::deque<std::string> unsent) {
    if (unsent.empty()) return;
    bLog_Net(QString("Re-queued %1 unsent message(s) for '%2'").arg(unsent.size()).arg(q(dest->id())));
    for (auto it = unsent.rbegin(); it != unsent.rend(); ++it) {
        dest->m_pending.push_front(std::move(*it));
    }
    trimToCapacity(dest);
}

void ConnectionManager::trimToCapacity(const std::shared_ptr<Destination>& dest) {
    while (dest->m_pending.size() > m_queueCapacity) {
        dest->m_pending.pop_front();
        bLog_Warning(QString("Pending queue for '%1' full (%2), dropped oldest message")
            .arg(q(dest->id())).arg(m_queueCapacity));
        m_sink.publish(BridgeEvent{EventKind::Dropped, dest->id(),
                                   "pending queue full (capacity " + std::to_string(m_queueCapacity) + "), dropped oldest message",
                                   std::nullopt, dest->m_pending.size()});
    }
}

void ConnectionManager::releaseTransport(const std::shared_ptr<Destination>& dest) {
    if (!dest->m_transport) return;
    dest->m_transport.reset();
    if (--m_liveTransports <= 0) {
        std::lock_guard<std::mutex> lock(m_idleMutex);
        m_idleCv.notify_all();
    }
}
