#pragma once
/*
wsbridge — MessageRouter
Role: Turns a parsed host command into registry lookups and ConnectionManager calls.
Inputs/Outputs: HostCommand from HostChannel; sent/queued/status/removed/error events to IEventSink.
Threading: handle() runs on the host channel strand. Per-destination work is posted to the
           destination strand, so per-destination order equals command order.
Related: HostCommand.hpp, DestinationRegistry.hpp, ConnectionManager.hpp, TargetResolver.hpp.
*/
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "bridge/events/IEventSink.hpp"
#include "bridge/host/HostCommand.hpp"
#include "bridge/registry/DestinationRegistry.hpp"
#include "bridge/registry/TargetResolver.hpp"
#include "bridge/ws/ConnectionManager.hpp"

class MessageRouter {
public:
    MessageRouter(DestinationRegistry& registry,
                  ConnectionManager& manager,
                  TargetResolver& resolver,
                  IEventSink& sink);

    void onShutdownRequested(std::function<void(std::string)> handler) { m_onShutdown = std::move(handler); }

    void handle(const HostCommand& command);

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

private:
    void handleSend(const SendMessageCommand& cmd);
    void handleConnect(const ConnectCommand& cmd);
    void handleDisconnect(const DisconnectCommand& cmd);
    void handleRemove(const RemoveCommand& cmd);
    void handleList(const ListCommand& cmd);
    void handleSettings(const SettingsCommand& cmd);

    // Walks the snapshot one strand at a time so status lines keep insertion order
    void reportStatus(std::shared_ptr<std::vector<std::shared_ptr<Destination>>> snapshot,
                      size_t index,
                      std::optional<std::string> correlationId);
    BridgeEvent statusOf(const Destination& dest, const std::optional<std::string>& correlationId) const;
    void unknownDestination(const std::string& id, const std::optional<std::string>& correlationId);

    DestinationRegistry&  m_registry;
    ConnectionManager&    m_manager;
    TargetResolver&       m_resolver;
    IEventSink&           m_sink;
    std::function<void(std::string)> m_onShutdown;
};
