#include "MessageRouter.hpp"
#include "BridgeLogging.hpp"
#include "bridge/manifest/ManifestSchema.hpp"
#include <boost/asio/post.hpp>
#include <QString>
#include <type_traits>
#include <variant>

namespace net = boost::asio;

namespace {

QString q(const std::string& s) { return QString::fromStdString(s); }

} // namespace

MessageRouter::MessageRouter(DestinationRegistry& registry,
                             ConnectionManager& manager,
                             TargetResolver& resolver,
                             IEventSink& sink)
    : m_registry(registry)
    , m_manager(manager)
    , m_resolver(resolver)
    , m_sink(sink)
{}

void MessageRouter::handle(const HostCommand& command) {
    std::visit([this](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, SendMessageCommand>) {
            handleSend(cmd);
        } else if constexpr (std::is_same_v<T, ConnectCommand>) {
            handleConnect(cmd);
        } else if constexpr (std::is_same_v<T, DisconnectCommand>) {
            handleDisconnect(cmd);
        } else if constexpr (std::is_same_v<T, RemoveCommand>) {
            handleRemove(cmd);
        } else if constexpr (std::is_same_v<T, ListCommand>) {
            handleList(cmd);
        } else if constexpr (std::is_same_v<T, SettingsCommand>) {
            handleSettings(cmd);
        } else if constexpr (std::is_same_v<T, ShutdownCommand>) {
            bLog_App("Host requested plugin close");
            if (m_onShutdown) m_onShutdown("closePlugin");
        } else if constexpr (std::is_same_v<T, IgnoredCommand>) {
            bLog_Debug(QString("Ignoring host message type '%1'").arg(q(cmd.type)));
        }
    }, command);
}

void MessageRouter::handleSend(const SendMessageCommand& cmd) {
    auto dest = m_registry.getOrCreate(cmd.destination);
    net::post(dest->strand(), [this, dest, payload = cmd.message, corr = cmd.correlationId]() mutable {
        const auto outcome = m_manager.send(dest, std::move(payload), corr);
        switch (outcome) {
            case SendOutcome::SentImmediately:
                m_sink.publish(BridgeEvent{EventKind::Sent, dest->id(), std::nullopt, corr, dest->pendingSends().size()});
                break;
            case SendOutcome::Enqueued:
                m_sink.publish(BridgeEvent{EventKind::Queued, dest->id(), std::string(toString(dest->state())),
                                           corr, dest->pendingSends().size()});
                break;
            case SendOutcome::Rejected:
                // ConnectionManager already reported the address error
                bLog_DebugN(1, QString("Send to '%1' rejected").arg(q(dest->id())));
                break;
        }
    });
}

void MessageRouter::handleConnect(const ConnectCommand& cmd) {
    auto dest = m_registry.getOrCreate(cmd.destination);
    net::post(dest->strand(), [this, dest, corr = cmd.correlationId]() {
        if (m_manager.connect(dest, corr)) {
            m_sink.publish(statusOf(*dest, corr));
        }
    });
}

void MessageRouter::handleDisconnect(const DisconnectCommand& cmd) {
    auto dest = m_registry.find(cmd.destination);
    if (!dest) {
        unknownDestination(cmd.destination, cmd.correlationId);
        return;
    }
    net::post(dest->strand(), [this, dest, corr = cmd.correlationId]() {
        m_manager.close(dest);
        m_sink.publish(statusOf(*dest, corr));
    });
}

void MessageRouter::handleRemove(const RemoveCommand& cmd) {
    auto dest = m_registry.find(cmd.destination);
    if (!dest || !m_registry.remove(cmd.destination)) {
        unknownDestination(cmd.destination, cmd.correlationId);
        return;
    }
    // Erased now: a later command naming the same id creates a fresh entry
    net::post(dest->strand(), [this, dest, corr = cmd.correlationId]() {
        const size_t discarded = m_manager.teardown(dest);
        m_sink.publish(BridgeEvent{EventKind::Removed, dest->id(),
                                   "discarded " + std::to_string(discarded) + " pending",
                                   corr, std::nullopt});
    });
}

void MessageRouter::handleList(const ListCommand& cmd) {
    auto snapshot = std::make_shared<std::vector<std::shared_ptr<Destination>>>(m_registry.list());
    if (snapshot->empty()) {
        m_sink.publish(BridgeEvent{EventKind::Status, std::nullopt, std::string("no destinations"),
                                   cmd.correlationId, std::nullopt});
        return;
    }
    reportStatus(std::move(snapshot), 0, cmd.correlationId);
}

void MessageRouter::reportStatus(std::shared_ptr<std::vector<std::shared_ptr<Destination>>> snapshot,
                                 size_t index,
                                 std::optional<std::string> correlationId) {
    if (index >= snapshot->size()) return;
    auto dest = (*snapshot)[index];
    net::post(dest->strand(), [this, dest, snapshot = std::move(snapshot), index, corr = std::move(correlationId)]() mutable {
        m_sink.publish(statusOf(*dest, corr));
        reportStatus(std::move(snapshot), index + 1, std::move(corr));
    });
}

BridgeEvent MessageRouter::statusOf(const Destination& dest, const std::optional<std::string>& correlationId) const {
    std::string detail = toString(dest.state());
    if (dest.state() == ConnectionState::Failed && dest.lastError()) {
        detail += ": " + *dest.lastError();
    }
    return BridgeEvent{EventKind::Status, dest.id(), std::move(detail), correlationId, dest.pendingSends().size()};
}

void MessageRouter::unknownDestination(const std::string& id, const std::optional<std::string>& correlationId) {
    bLog_Warning(QString("No destination named '%1'").arg(q(id)));
    m_sink.publish(BridgeEvent{EventKind::Error, id, std::string("unknown destination"), correlationId, std::nullopt});
}

void MessageRouter::handleSettings(const SettingsCommand& cmd) {
    if (cmd.initial) {
        bLog_App(QString("Host connected (host version %1, plugin version %2)")
            .arg(q(cmd.hostVersion.value_or("unknown")))
            .arg(cmd.pluginVersion ? QString::number(*cmd.pluginVersion) : QString("unknown")));
        if (cmd.pluginVersion && *cmd.pluginVersion != manifest::kVersion) {
            bLog_Warning(QString("Host loaded plugin version %1, this bridge implements version %2")
                .arg(*cmd.pluginVersion).arg(manifest::kVersion));
        }
    }

    for (const auto& [name, value] : cmd.values) {
        if (name != manifest::kAliasSetting) continue;

        std::vector<std::string> errors;
        auto aliases = TargetResolver::parseAliasList(value, &errors);
        for (const auto& e : errors) {
            bLog_Warning(QString("Setting '%1': %2").arg(q(name), q(e)));
        }
        bLog_App(QString("Loaded %1 destination alias(es) from host settings").arg(aliases.size()));
        m_resolver.setHostAliases(std::move(aliases));
    }
}
