/*
wsbridge — ConnectionManager Tests
Role: Verify the per-destination connection state machine, pending queue and reconnect policy
Testing Strategy: Fake transports driven by the test → poll the io_context → assert state and events
Coverage: Ordered sends, queue-then-flush, overflow, address errors, failures and retries,
          mid-flush failure, explicit close, teardown, stale callbacks, shutdown
*/
#include <gtest/gtest.h>
#include "bridge/ws/ConnectionManager.hpp"
#include "fixtures/fake_transport.hpp"
#include "fixtures/spy_event_sink.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace net = boost::asio;
using namespace std::chrono_literals;

class ConnectionManagerTest : public ::testing::Test {
protected:
    net::io_context ioc;
    TargetResolver resolver;
    SpyEventSink sink;
    FakeTransportFactory transports;
    // Retries far in the future so poll() never fires them
    BackoffConfig slowBackoff{std::chrono::hours(1), std::chrono::hours(2), 0ms};
    ConnectionManager mgr{transports.factory(), resolver, sink, 4};

    std::shared_ptr<Destination> destination(const std::string& id, BackoffConfig backoff) {
        return std::make_shared<Destination>(id, net::make_strand(ioc), backoff);
    }
    std::shared_ptr<Destination> destination(const std::string& id) { return destination(id, slowBackoff); }

    void drain() {
        ioc.restart();
        ioc.poll();
    }

    // Connect and complete the handshake
    void openConnection(const std::shared_ptr<Destination>& d) {
        ASSERT_TRUE(mgr.connect(d));
        transports.last().open();
        drain();
        ASSERT_EQ(d->state(), ConnectionState::Open);
    }
};

// =============================================================================
// Sending
// =============================================================================

TEST_F(ConnectionManagerTest, SendsWhileOpenAreTransmittedInOrder) {
    auto d = destination("ws://localhost:9001");
    openConnection(d);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(mgr.send(d, "msg-" + std::to_string(i)), SendOutcome::SentImmediately);
    }

    const auto& sent = transports.last().sent();
    ASSERT_EQ(sent.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(sent[i], "msg-" + std::to_string(i));
    }
    EXPECT_TRUE(d->pendingSends().empty());
}

TEST_F(ConnectionManagerTest, FirstSendConnectsAndDeliversOnceOpen) {
    auto d = destination("ws://localhost:9001/feed");

    EXPECT_EQ(mgr.send(d, "hello"), SendOutcome::Enqueued);
    EXPECT_EQ(d->state(), ConnectionState::Connecting);
    ASSERT_EQ(transports.count(), 1u);
    EXPECT_EQ(transports.last().connectCalls(), 1);
    EXPECT_EQ(transports.last().endpoint().host, "localhost");
    EXPECT_EQ(transports.last().endpoint().target, "/feed");
    EXPECT_EQ(d->pendingSends().size(), 1u);
    EXPECT_EQ(mgr.liveTransports(), 1);

    transports.last().open();
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Open);
    ASSERT_EQ(transports.last().sent().size(), 1u);
    EXPECT_EQ(transports.last().sent()[0], "hello");
    EXPECT_TRUE(d->pendingSends().empty());

    auto connected = sink.ofKind(EventKind::Connected);
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].destination.value_or(""), "ws://localhost:9001/feed");
    EXPECT_EQ(connected[0].detail.value_or(""), "ws://localhost:9001/feed");
}

TEST_F(ConnectionManagerTest, SendsWhileConnectingShareOneConnection) {
    auto d = destination("ws://h:1");
    mgr.send(d, "a");
    mgr.send(d, "b");
    mgr.send(d, "c");

    EXPECT_EQ(transports.count(), 1u);
    transports.last().open();
    drain();

    EXPECT_EQ(transports.last().sent(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ConnectionManagerTest, OverflowKeepsNewestAndReportsOneDrop) {
    auto d = destination("ws://h:1");
    for (int i = 1; i <= 5; ++i) {
        mgr.send(d, "m" + std::to_string(i));
    }

    ASSERT_EQ(d->pendingSends().size(), 4u);
    EXPECT_EQ(d->pendingSends().front(), "m2");
    EXPECT_EQ(d->pendingSends().back(), "m5");

    auto dropped = sink.ofKind(EventKind::Dropped);
    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0].destination.value_or(""), "ws://h:1");
    EXPECT_EQ(dropped[0].pending.value_or(0), 4u);
}

TEST_F(ConnectionManagerTest, ZeroCapacityIsClampedToOne) {
    ConnectionManager tiny{transports.factory(), resolver, sink, 0};
    EXPECT_EQ(tiny.queueCapacity(), 1u);

    auto d = destination("ws://h:1");
    tiny.send(d, "old");
    tiny.send(d, "new");
    ASSERT_EQ(d->pendingSends().size(), 1u);
    EXPECT_EQ(d->pendingSends().front(), "new");
    EXPECT_EQ(sink.count(EventKind::Dropped), 1u);
}

// =============================================================================
// Address Errors
// =============================================================================

TEST_F(ConnectionManagerTest, UnresolvableDestinationIsRejectedAndReportedOnce) {
    auto d = destination("studio");

    EXPECT_EQ(mgr.send(d, "one"), SendOutcome::Rejected);
    EXPECT_EQ(d->state(), ConnectionState::Failed);
    ASSERT_TRUE(d->lastError().has_value());
    EXPECT_NE(d->lastError()->find("invalid destination address 'studio'"), std::string::npos);
    EXPECT_FALSE(d->retryScheduled());
    EXPECT_EQ(transports.count(), 0u);
    EXPECT_TRUE(d->pendingSends().empty());

    EXPECT_EQ(mgr.send(d, "two"), SendOutcome::Rejected);
    EXPECT_EQ(sink.count(EventKind::Error), 1u);
}

TEST_F(ConnectionManagerTest, CorrelatedRejectionIsAlwaysAcknowledged) {
    auto d = destination("studio");
    mgr.send(d, "one");
    mgr.send(d, "two", std::string("req-2"));

    auto errors = sink.ofKind(EventKind::Error);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_FALSE(errors[0].correlationId.has_value());
    EXPECT_EQ(errors[1].correlationId.value_or(""), "req-2");
}

TEST_F(ConnectionManagerTest, NewOffendingValueIsReportedAgain) {
    resolver.setHostAliases({{"studio", "http://one"}});
    auto d = destination("studio");
    mgr.send(d, "x");

    resolver.setHostAliases({{"studio", "http://two"}});
    mgr.send(d, "y");
    EXPECT_EQ(sink.count(EventKind::Error), 2u);

    // Fixing the alias makes the next send connect
    resolver.setHostAliases({{"studio", "ws://studio.local:4455"}});
    EXPECT_EQ(mgr.send(d, "z"), SendOutcome::Enqueued);
    EXPECT_EQ(d->state(), ConnectionState::Connecting);
    EXPECT_EQ(transports.last().endpoint().port, "4455");
}

// =============================================================================
// Failures and Reconnects
// =============================================================================

TEST_F(ConnectionManagerTest, HandshakeFailureSchedulesRetryAndKeepsQueue) {
    auto d = destination("ws://h:1");
    mgr.send(d, "keep");

    transports.last().fail("connect: Connection refused");
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Failed);
    EXPECT_TRUE(d->retryScheduled());
    EXPECT_FALSE(d->hasTransport());
    EXPECT_EQ(d->backoff().attempts(), 1u);
    EXPECT_EQ(d->pendingSends().size(), 1u);
    EXPECT_EQ(mgr.liveTransports(), 0);

    auto down = sink.ofKind(EventKind::Disconnected);
    ASSERT_EQ(down.size(), 1u);
    EXPECT_EQ(down[0].detail.value_or(""), "connect: Connection refused");
    EXPECT_EQ(down[0].pending.value_or(0), 1u);
}

TEST_F(ConnectionManagerTest, SendWhileRetryPendingOnlyQueues) {
    auto d = destination("ws://h:1");
    mgr.connect(d);
    transports.last().fail("refused");
    drain();

    EXPECT_EQ(mgr.send(d, "later"), SendOutcome::Enqueued);
    EXPECT_EQ(transports.count(), 1u);
    EXPECT_EQ(d->state(), ConnectionState::Failed);
}

TEST_F(ConnectionManagerTest, RemoteCloseOfOpenConnectionFails) {
    auto d = destination("ws://h:1");
    openConnection(d);

    transports.last().fail("closed by peer");
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Failed);
    EXPECT_TRUE(d->retryScheduled());
    EXPECT_EQ(sink.ofKind(EventKind::Disconnected).back().detail.value_or(""), "closed by peer");
}

TEST_F(ConnectionManagerTest, DownWithoutErrorReportsConnectionLost) {
    auto d = destination("ws://h:1");
    openConnection(d);

    transports.last().closed();
    drain();

    EXPECT_EQ(sink.ofKind(EventKind::Disconnected).back().detail.value_or(""), "connection lost");
}

TEST_F(ConnectionManagerTest, RetryTimerReconnects) {
    auto d = destination("ws://h:1", BackoffConfig{1ms, 1ms, 0ms});
    mgr.send(d, "eventually");
    transports.last().fail("refused");
    drain();
    ASSERT_EQ(d->state(), ConnectionState::Failed);

    ioc.restart();
    ioc.run_for(500ms);

    ASSERT_EQ(transports.count(), 2u);
    EXPECT_EQ(d->state(), ConnectionState::Connecting);
    EXPECT_FALSE(d->retryScheduled());

    transports.last().open();
    drain();
    EXPECT_EQ(transports.last().sent(), (std::vector<std::string>{"eventually"}));
}

TEST_F(ConnectionManagerTest, BackoffGrowsAcrossFailuresAndResetsOnOpen) {
    auto d = destination("ws://h:1");
    mgr.connect(d);
    transports.last().fail("refused");
    drain();
    mgr.connect(d);
    transports.last().fail("refused");
    drain();
    EXPECT_EQ(d->backoff().attempts(), 2u);

    mgr.connect(d);
    transports.last().open();
    drain();
    EXPECT_EQ(d->backoff().attempts(), 0u);
    EXPECT_FALSE(d->lastError().has_value());
}

TEST_F(ConnectionManagerTest, FailedFlushRequeuesUnsentTailInOrder) {
    auto d = destination("ws://h:1");
    mgr.send(d, "m1");
    mgr.send(d, "m2");
    mgr.send(d, "m3");

    // Writes never complete on this connection
    transports.last().holdSends(true);
    transports.last().open();
    drain();
    EXPECT_TRUE(d->pendingSends().empty());
    EXPECT_EQ(transports.last().unsentCount(), 3u);

    transports.last().fail("write: Broken pipe");
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Failed);
    ASSERT_EQ(d->pendingSends().size(), 3u);
    EXPECT_EQ(d->pendingSends()[0], "m1");
    EXPECT_EQ(d->pendingSends()[2], "m3");

    mgr.send(d, "m4");
    mgr.connect(d);
    transports.last().open();
    drain();
    EXPECT_EQ(transports.last().sent(), (std::vector<std::string>{"m1", "m2", "m3", "m4"}));
}

TEST_F(ConnectionManagerTest, StaleTransportCallbacksAreIgnored) {
    auto d = destination("ws://h:1");
    mgr.connect(d);
    FakeTransport& first = transports.last();
    first.fail("refused");
    drain();

    mgr.connect(d);
    ASSERT_EQ(transports.count(), 2u);

    first.open();
    first.receive("ghost");
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Connecting);
    EXPECT_EQ(sink.count(EventKind::Connected), 0u);
    EXPECT_EQ(sink.count(EventKind::Message), 0u);
}

// =============================================================================
// Inbound Frames
// =============================================================================

TEST_F(ConnectionManagerTest, InboundFramesBecomeMessageEvents) {
    auto d = destination("ws://h:1");
    openConnection(d);

    transports.last().receive("{\"op\":5}");
    drain();

    auto messages = sink.ofKind(EventKind::Message);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].destination.value_or(""), "ws://h:1");
    EXPECT_EQ(messages[0].detail.value_or(""), "{\"op\":5}");
}

// =============================================================================
// Close, Teardown, Shutdown
// =============================================================================

TEST_F(ConnectionManagerTest, ExplicitCloseGoesThroughClosing) {
    auto d = destination("ws://h:1");
    openConnection(d);

    mgr.close(d);
    EXPECT_EQ(d->state(), ConnectionState::Closing);
    EXPECT_EQ(transports.last().closeCalls(), 1);

    transports.last().closed();
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(d->retryScheduled());
    EXPECT_EQ(sink.ofKind(EventKind::Disconnected).back().detail.value_or(""), "closed");
    EXPECT_EQ(transports.count(), 1u);
}

TEST_F(ConnectionManagerTest, SendDuringCloseReconnectsAfterwards) {
    auto d = destination("ws://h:1");
    openConnection(d);

    mgr.close(d);
    EXPECT_EQ(mgr.send(d, "late"), SendOutcome::Enqueued);

    transports.last().closed();
    drain();

    ASSERT_EQ(transports.count(), 2u);
    EXPECT_EQ(d->state(), ConnectionState::Connecting);
    transports.last().open();
    drain();
    EXPECT_EQ(transports.last().sent(), (std::vector<std::string>{"late"}));
}

TEST_F(ConnectionManagerTest, CloseOfFailedDestinationStopsRetrying) {
    auto d = destination("ws://h:1");
    mgr.connect(d);
    transports.last().fail("refused");
    drain();
    ASSERT_TRUE(d->retryScheduled());

    mgr.close(d);
    EXPECT_EQ(d->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(d->retryScheduled());
}

TEST_F(ConnectionManagerTest, TeardownDiscardsPendingAndTransport) {
    auto d = destination("ws://h:1");
    mgr.send(d, "a");
    mgr.send(d, "b");

    EXPECT_EQ(mgr.teardown(d), 2u);
    EXPECT_EQ(d->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(d->pendingSends().empty());
    EXPECT_FALSE(d->hasTransport());
    EXPECT_EQ(transports.last().closeCalls(), 1);
    EXPECT_EQ(mgr.liveTransports(), 0);

    // The closing transport's final callback belongs to a discarded generation
    transports.last().closed();
    drain();
    EXPECT_EQ(sink.count(EventKind::Disconnected), 0u);
}

TEST_F(ConnectionManagerTest, ShutdownClosesWithoutRetry) {
    auto d = destination("ws://h:1");
    openConnection(d);

    mgr.beginShutdown();
    mgr.shutdown(d);
    EXPECT_EQ(d->state(), ConnectionState::Closing);

    transports.last().closed();
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(d->retryScheduled());
    EXPECT_EQ(mgr.liveTransports(), 0);
    EXPECT_TRUE(mgr.waitForIdle(0ms));
}

TEST_F(ConnectionManagerTest, NoRetryIsScheduledAfterShutdownBegins) {
    auto d = destination("ws://h:1");
    mgr.connect(d);
    mgr.beginShutdown();

    transports.last().fail("refused");
    drain();

    EXPECT_EQ(d->state(), ConnectionState::Failed);
    EXPECT_FALSE(d->retryScheduled());
}

TEST_F(ConnectionManagerTest, WaitForIdleTimesOutWhileTransportsLive) {
    auto d = destination("ws://h:1");
    mgr.connect(d);
    EXPECT_FALSE(mgr.waitForIdle(10ms));
}
