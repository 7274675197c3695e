#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Closed set of commands the host can issue. Anything else is a ProtocolError.

struct SendMessageCommand {
    std::string destination;
    std::string message;
    std::optional<std::string> correlationId;
};

struct ConnectCommand {
    std::string destination;
    std::optional<std::string> correlationId;
};

struct DisconnectCommand {
    std::string destination;
    std::optional<std::string> correlationId;
};

struct RemoveCommand {
    std::string destination;
    std::optional<std::string> correlationId;
};

struct ListCommand {
    std::optional<std::string> correlationId;
};

// Host "info" (initial == true) and "settings" messages, flattened to name/value pairs
struct SettingsCommand {
    std::vector<std::pair<std::string, std::string>> values;
    bool initial = false;
    std::optional<int> pluginVersion;
    std::optional<std::string> hostVersion;
};

struct ShutdownCommand {};

// Host traffic that is valid but irrelevant to this plugin (broadcasts, page changes...)
struct IgnoredCommand {
    std::string type;
};

using HostCommand = std::variant<SendMessageCommand,
                                 ConnectCommand,
                                 DisconnectCommand,
                                 RemoveCommand,
                                 ListCommand,
                                 SettingsCommand,
                                 ShutdownCommand,
                                 IgnoredCommand>;

struct ProtocolError {
    std::string message;
    std::optional<std::string> correlationId;
};

using ParseResult = std::variant<HostCommand, ProtocolError>;
