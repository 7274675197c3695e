/*
wsbridge — MessageRouter Tests
Role: Verify command dispatch into the registry and connection manager, and the events it reports
Testing Strategy: Commands → router.handle() → poll the io_context → assert registry and event stream
Coverage: send/connect/disconnect/remove/list, settings aliases, closePlugin, correlation ids
*/
#include <gtest/gtest.h>
#include "bridge/router/MessageRouter.hpp"
#include "bridge/manifest/ManifestSchema.hpp"
#include "fixtures/fake_transport.hpp"
#include "fixtures/spy_event_sink.hpp"
#include <boost/asio/io_context.hpp>

namespace net = boost::asio;
using namespace std::chrono_literals;

class MessageRouterTest : public ::testing::Test {
protected:
    net::io_context ioc;
    TargetResolver resolver;
    SpyEventSink sink;
    FakeTransportFactory transports;
    DestinationRegistry registry{ioc.get_executor(), BackoffConfig{std::chrono::hours(1), std::chrono::hours(2), 0ms}};
    ConnectionManager mgr{transports.factory(), resolver, sink, 4};
    MessageRouter router{registry, mgr, resolver, sink};

    void handle(HostCommand cmd) {
        router.handle(cmd);
        ioc.restart();
        ioc.poll();
    }

    void openLast() {
        transports.last().open();
        ioc.restart();
        ioc.poll();
    }
};

// =============================================================================
// sendmessage
// =============================================================================

TEST_F(MessageRouterTest, SendToNewDestinationIsQueued) {
    handle(SendMessageCommand{"ws://h:1", "hello", std::string("c1")});

    EXPECT_EQ(registry.size(), 1u);
    ASSERT_EQ(transports.count(), 1u);

    auto queued = sink.ofKind(EventKind::Queued);
    ASSERT_EQ(queued.size(), 1u);
    EXPECT_EQ(queued[0].destination.value_or(""), "ws://h:1");
    EXPECT_EQ(queued[0].correlationId.value_or(""), "c1");
    EXPECT_EQ(queued[0].pending.value_or(0), 1u);
    EXPECT_EQ(queued[0].detail.value_or(""), "Connecting");

    openLast();
    EXPECT_EQ(transports.last().sent(), (std::vector<std::string>{"hello"}));
}

TEST_F(MessageRouterTest, SendToOpenDestinationIsSent) {
    handle(ConnectCommand{"ws://h:1", std::nullopt});
    openLast();
    sink.clear();

    handle(SendMessageCommand{"ws://h:1", "now", std::nullopt});

    ASSERT_EQ(sink.size(), 1u);
    EXPECT_EQ(sink.last().kind, EventKind::Sent);
    EXPECT_EQ(sink.last().pending.value_or(99), 0u);
    EXPECT_EQ(transports.last().sent(), (std::vector<std::string>{"now"}));
}

TEST_F(MessageRouterTest, SameDestinationReusesEntity) {
    handle(SendMessageCommand{"ws://h:1", "a", std::nullopt});
    auto first = registry.find("ws://h:1");
    handle(SendMessageCommand{"ws://h:1", "b", std::nullopt});

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("ws://h:1").get(), first.get());
    EXPECT_EQ(transports.count(), 1u);
    EXPECT_EQ(first->pendingSends().size(), 2u);
}

TEST_F(MessageRouterTest, SendsReachTheWireInCommandOrder) {
    handle(ConnectCommand{"ws://h:1", std::nullopt});
    openLast();

    for (int i = 0; i < 20; ++i) {
        router.handle(SendMessageCommand{"ws://h:1", std::to_string(i), std::nullopt});
    }
    ioc.restart();
    ioc.poll();

    const auto& sent = transports.last().sent();
    ASSERT_EQ(sent.size(), 20u);
    for (int i = 0; i < 20; ++i) EXPECT_EQ(sent[i], std::to_string(i));
}

TEST_F(MessageRouterTest, UnresolvableSendReportsErrorOnly) {
    handle(SendMessageCommand{"studio", "x", std::string("c9")});

    EXPECT_EQ(sink.count(EventKind::Queued), 0u);
    auto errors = sink.ofKind(EventKind::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].destination.value_or(""), "studio");
    EXPECT_EQ(errors[0].correlationId.value_or(""), "c9");
    EXPECT_EQ(transports.count(), 0u);
}

// =============================================================================
// connect / disconnect / remove
// =============================================================================

TEST_F(MessageRouterTest, ConnectReportsStatus) {
    handle(ConnectCommand{"ws://h:1", std::string("k")});

    EXPECT_EQ(transports.count(), 1u);
    auto status = sink.ofKind(EventKind::Status);
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].detail.value_or(""), "Connecting");
    EXPECT_EQ(status[0].correlationId.value_or(""), "k");
}

TEST_F(MessageRouterTest, ConnectToInvalidAddressReportsError) {
    handle(ConnectCommand{"nope", std::string("k")});

    EXPECT_EQ(sink.count(EventKind::Status), 0u);
    ASSERT_EQ(sink.count(EventKind::Error), 1u);
    EXPECT_EQ(sink.last().correlationId.value_or(""), "k");
}

TEST_F(MessageRouterTest, DisconnectClosesAndKeepsEntry) {
    handle(ConnectCommand{"ws://h:1", std::nullopt});
    openLast();

    handle(DisconnectCommand{"ws://h:1", std::string("d1")});
    EXPECT_EQ(transports.last().closeCalls(), 1);
    EXPECT_EQ(sink.last().kind, EventKind::Status);
    EXPECT_EQ(sink.last().detail.value_or(""), "Closing");
    EXPECT_EQ(sink.last().correlationId.value_or(""), "d1");

    transports.last().closed();
    ioc.restart();
    ioc.poll();
    EXPECT_EQ(registry.find("ws://h:1")->state(), ConnectionState::Disconnected);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(MessageRouterTest, DisconnectOfUnknownDestinationIsAnError) {
    handle(DisconnectCommand{"ws://ghost", std::string("g")});

    EXPECT_EQ(registry.size(), 0u);
    ASSERT_EQ(sink.size(), 1u);
    EXPECT_EQ(sink.last().kind, EventKind::Error);
    EXPECT_EQ(sink.last().detail.value_or(""), "unknown destination");
    EXPECT_EQ(sink.last().correlationId.value_or(""), "g");
}

TEST_F(MessageRouterTest, RemoveErasesAndReportsDiscardedCount) {
    handle(SendMessageCommand{"ws://h:1", "a", std::nullopt});
    handle(SendMessageCommand{"ws://h:1", "b", std::nullopt});

    handle(RemoveCommand{"ws://h:1", std::string("r")});

    EXPECT_EQ(registry.size(), 0u);
    auto removed = sink.ofKind(EventKind::Removed);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].destination.value_or(""), "ws://h:1");
    EXPECT_EQ(removed[0].detail.value_or(""), "discarded 2 pending");
    EXPECT_EQ(removed[0].correlationId.value_or(""), "r");
    EXPECT_EQ(mgr.liveTransports(), 0);
}

TEST_F(MessageRouterTest, RemoveOfUnknownDestinationIsAnError) {
    handle(RemoveCommand{"ws://ghost", std::nullopt});
    EXPECT_EQ(sink.count(EventKind::Error), 1u);
    EXPECT_EQ(sink.count(EventKind::Removed), 0u);
}

TEST_F(MessageRouterTest, SendAfterRemoveCreatesFreshDestination) {
    handle(SendMessageCommand{"ws://h:1", "a", std::nullopt});
    auto old = registry.find("ws://h:1");
    handle(RemoveCommand{"ws://h:1", std::nullopt});
    handle(SendMessageCommand{"ws://h:1", "b", std::nullopt});

    auto fresh = registry.find("ws://h:1");
    ASSERT_NE(fresh, nullptr);
    EXPECT_NE(fresh.get(), old.get());
    EXPECT_EQ(fresh->pendingSends().size(), 1u);
    EXPECT_EQ(transports.count(), 2u);
}

// =============================================================================
// list
// =============================================================================

TEST_F(MessageRouterTest, ListReportsEveryDestinationInInsertionOrder) {
    handle(ConnectCommand{"ws://b:1", std::nullopt});
    handle(SendMessageCommand{"bogus", "x", std::nullopt});
    handle(SendMessageCommand{"ws://a:1", "y", std::nullopt});
    sink.clear();

    handle(ListCommand{std::string("l")});

    auto status = sink.ofKind(EventKind::Status);
    ASSERT_EQ(status.size(), 3u);
    EXPECT_EQ(status[0].destination.value_or(""), "ws://b:1");
    EXPECT_EQ(status[0].detail.value_or(""), "Connecting");
    EXPECT_EQ(status[1].destination.value_or(""), "bogus");
    EXPECT_EQ(status[1].detail.value_or("").rfind("Failed: invalid destination address", 0), 0u);
    EXPECT_EQ(status[2].destination.value_or(""), "ws://a:1");
    EXPECT_EQ(status[2].pending.value_or(0), 1u);
    for (const auto& s : status) {
        EXPECT_EQ(s.correlationId.value_or(""), "l");
    }
}

TEST_F(MessageRouterTest, ListOfEmptyRegistryStillAnswers) {
    handle(ListCommand{std::string("l")});

    ASSERT_EQ(sink.size(), 1u);
    EXPECT_EQ(sink.last().kind, EventKind::Status);
    EXPECT_FALSE(sink.last().destination.has_value());
    EXPECT_EQ(sink.last().correlationId.value_or(""), "l");
}

// =============================================================================
// Host Settings and Lifecycle
// =============================================================================

TEST_F(MessageRouterTest, SettingsInstallHostAliases) {
    SettingsCommand settings;
    settings.initial = true;
    settings.pluginVersion = manifest::kVersion;
    settings.values = {{"Unrelated", "x"}, {std::string(manifest::kAliasSetting), "obs=ws://127.0.0.1:4455\nchat=wss://c.example/ws"}};
    handle(settings);

    EXPECT_EQ(resolver.hostAliases().size(), 2u);
    EXPECT_EQ(sink.size(), 0u);

    handle(SendMessageCommand{"obs", "SetScene", std::nullopt});
    ASSERT_EQ(transports.count(), 1u);
    EXPECT_EQ(transports.last().endpoint().host, "127.0.0.1");
    EXPECT_EQ(transports.last().endpoint().port, "4455");
}

TEST_F(MessageRouterTest, SettingsWithoutAliasFieldKeepAliases) {
    resolver.setHostAliases({{"obs", "ws://a"}});
    SettingsCommand settings;
    settings.values = {{"Other", "1"}};
    handle(settings);

    EXPECT_EQ(resolver.hostAliases().size(), 1u);
}

TEST_F(MessageRouterTest, ClosePluginRequestsShutdown) {
    std::string reason;
    router.onShutdownRequested([&reason](std::string r) { reason = std::move(r); });

    handle(ShutdownCommand{});
    EXPECT_EQ(reason, "closePlugin");
}

TEST_F(MessageRouterTest, ReportedEventOutlivesLaterEvents) {
    handle(ListCommand{std::string("first")});
    const auto first = sink.last();

    for (int i = 0; i < 100; ++i) {
        handle(ListCommand{std::to_string(i)});
    }
    EXPECT_EQ(first.correlationId.value_or(""), "first");
    EXPECT_EQ(sink.last().correlationId.value_or(""), "99");
}

TEST_F(MessageRouterTest, IgnoredMessagesHaveNoEffect) {
    handle(IgnoredCommand{"broadcast"});
    EXPECT_EQ(sink.size(), 0u);
    EXPECT_EQ(registry.size(), 0u);
}
