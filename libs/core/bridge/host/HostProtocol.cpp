#include "HostProtocol.hpp"
#include "StringUtils.hpp"
#include "bridge/manifest/ManifestSchema.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

namespace keys {
    inline constexpr const char* kAction        = "action";
    inline constexpr const char* kType          = "type";
    inline constexpr const char* kDestination   = "destination";
    inline constexpr const char* kMessage       = "message";
    inline constexpr const char* kCorrelationId = "correlationId";
}

namespace actions {
    inline constexpr std::string_view kConnect    = "connect";
    inline constexpr std::string_view kDisconnect = "disconnect";
    inline constexpr std::string_view kRemove     = "remove";
    inline constexpr std::string_view kList       = "list";
}

// Host message types that carry nothing for this plugin
bool isIgnoredHostType(std::string_view type) {
    return type == "broadcast" || type == "listChange" || type == "down" || type == "up"
        || type == "connectorChange" || type == "shortConnectorIdNotification"
        || type == "notificationOptionClicked";
}

struct FieldError { std::string message; };

// Optional string field; absent or non-string reads as empty
std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Required string parameter: present, a string, and not the manifest's "unset" default
std::variant<std::string, FieldError> requireParameter(const json& j, const char* key, std::string_view unsetValue) {
    auto it = j.find(key);
    if (it == j.end()) {
        return FieldError{std::string("missing required field '") + key + "'"};
    }
    if (!it->is_string()) {
        return FieldError{std::string("field '") + key + "' must be a string"};
    }
    auto value = it->get<std::string>();
    if (value == unsetValue) {
        return FieldError{std::string("field '") + key + "' is not set"};
    }
    return value;
}

// Destination ids are trimmed; an id that is empty after trimming is rejected
std::variant<std::string, FieldError> requireDestination(const json& j) {
    auto raw = requireParameter(j, keys::kDestination, manifest::kDestinationDefault);
    if (auto* err = std::get_if<FieldError>(&raw)) return *err;
    auto id = StringUtils::trim(std::get<std::string>(raw));
    if (id.empty()) {
        return FieldError{"field 'destination' is empty"};
    }
    if (id == manifest::kDestinationDefault) {
        return FieldError{"field 'destination' is not set"};
    }
    return id;
}

ParseResult parseSimpleAction(const json& j, const std::string& action, const std::optional<std::string>& correlationId) {
    auto fail = [&](std::string msg) -> ParseResult { return ProtocolError{std::move(msg), correlationId}; };

    if (action == manifest::kSendMessageAction) {
        auto dest = requireDestination(j);
        if (auto* err = std::get_if<FieldError>(&dest)) return fail(err->message);
        auto msg = requireParameter(j, keys::kMessage, manifest::kMessageDefault);
        if (auto* err = std::get_if<FieldError>(&msg)) return fail(err->message);
        return HostCommand{SendMessageCommand{std::get<std::string>(std::move(dest)),
                                              std::get<std::string>(std::move(msg)),
                                              correlationId}};
    }

    if (action == actions::kList) {
        return HostCommand{ListCommand{correlationId}};
    }

    if (action == actions::kConnect || action == actions::kDisconnect || action == actions::kRemove) {
        auto dest = requireDestination(j);
        if (auto* err = std::get_if<FieldError>(&dest)) return fail(err->message);
        auto id = std::get<std::string>(std::move(dest));
        if (action == actions::kConnect)    return HostCommand{ConnectCommand{std::move(id), correlationId}};
        if (action == actions::kDisconnect) return HostCommand{DisconnectCommand{std::move(id), correlationId}};
        return HostCommand{RemoveCommand{std::move(id), correlationId}};
    }

    return fail("unknown action '" + action + "'");
}

// {"type":"action","pluginId":..,"actionId":..,"data":[{"id":..,"value":..},...]}
ParseResult parseHostAction(const json& j) {
    auto fail = [](std::string msg) -> ParseResult { return ProtocolError{std::move(msg), std::nullopt}; };

    const std::string pluginId = stringField(j, "pluginId");
    if (pluginId != manifest::kPluginId) {
        return fail("action for unknown plugin '" + pluginId + "'");
    }
    const std::string actionId = stringField(j, "actionId");
    if (actionId != manifest::kSendMessageActionId) {
        return fail("unknown action id '" + actionId + "'");
    }

    auto data = j.find("data");
    if (data == j.end() || !data->is_array()) {
        return fail("action data must be an array");
    }

    // Re-shape the data list into the simple command form and reuse its validation
    json flat = json::object();
    for (const auto& item : *data) {
        if (!item.is_object()) continue;
        const std::string id = stringField(item, "id");
        auto value = item.find("value");
        if (value == item.end()) continue;
        if (id == manifest::kDestinationDataId) flat[keys::kDestination] = *value;
        else if (id == manifest::kMessageDataId) flat[keys::kMessage] = *value;
    }
    return parseSimpleAction(flat, std::string(manifest::kSendMessageAction), std::nullopt);
}

// [{"name":"value"}, ...] -> name/value pairs; non-string values are skipped
std::vector<std::pair<std::string, std::string>> flattenSettings(const json& list) {
    std::vector<std::pair<std::string, std::string>> out;
    if (!list.is_array()) return out;
    for (const auto& entry : list) {
        if (!entry.is_object()) continue;
        for (auto it = entry.begin(); it != entry.end(); ++it) {
            if (it.value().is_string()) {
                out.emplace_back(it.key(), it.value().get<std::string>());
            }
        }
    }
    return out;
}

ParseResult parseHostMessage(const json& j, const std::string& type) {
    if (type == "action") {
        return parseHostAction(j);
    }
    if (type == "info") {
        SettingsCommand cmd;
        cmd.initial = true;
        if (auto it = j.find("settings"); it != j.end()) cmd.values = flattenSettings(*it);
        if (auto it = j.find("pluginVersion"); it != j.end() && it->is_number_integer()) cmd.pluginVersion = it->get<int>();
        if (auto it = j.find("tpVersionString"); it != j.end() && it->is_string()) cmd.hostVersion = it->get<std::string>();
        return HostCommand{std::move(cmd)};
    }
    if (type == "settings") {
        SettingsCommand cmd;
        if (auto it = j.find("values"); it != j.end()) cmd.values = flattenSettings(*it);
        return HostCommand{std::move(cmd)};
    }
    if (type == "closePlugin") {
        const std::string pluginId = stringField(j, "pluginId");
        if (pluginId != manifest::kPluginId) {
            return ProtocolError{"closePlugin for unknown plugin '" + pluginId + "'", std::nullopt};
        }
        return HostCommand{ShutdownCommand{}};
    }
    if (isIgnoredHostType(type)) {
        return HostCommand{IgnoredCommand{type}};
    }
    return ProtocolError{"unknown message type '" + type + "'", std::nullopt};
}

ParseResult parseCommand(const json& j) {
    if (!j.is_object()) {
        return ProtocolError{"command must be a JSON object", std::nullopt};
    }

    std::optional<std::string> correlationId;
    if (auto it = j.find(keys::kCorrelationId); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return ProtocolError{"field 'correlationId' must be a string", std::nullopt};
        }
        correlationId = it->get<std::string>();
    }

    if (auto it = j.find(keys::kAction); it != j.end()) {
        if (!it->is_string()) {
            return ProtocolError{"field 'action' must be a string", correlationId};
        }
        return parseSimpleAction(j, it->get<std::string>(), correlationId);
    }

    if (auto it = j.find(keys::kType); it != j.end()) {
        if (!it->is_string()) {
            return ProtocolError{"field 'type' must be a string", correlationId};
        }
        return parseHostMessage(j, it->get<std::string>());
    }

    return ProtocolError{"missing required field 'action'", correlationId};
}

} // namespace

ParseResult HostProtocol::parse(std::string_view line) {
    try {
        return parseCommand(json::parse(line.begin(), line.end()));
    } catch (const json::parse_error& e) {
        return ProtocolError{std::string("malformed JSON: ") + e.what(), std::nullopt};
    } catch (const json::exception& e) {
        // Well-formed JSON whose values have an unexpected type
        return ProtocolError{std::string("invalid command: ") + e.what(), std::nullopt};
    }
}

std::string HostProtocol::serialize(const BridgeEvent& event) {
    json j;
    j["event"] = toString(event.kind);
    if (event.destination)   j["destination"] = *event.destination;
    if (event.detail)        j["detail"] = *event.detail;
    if (event.correlationId) j["correlationId"] = *event.correlationId;
    if (event.pending)       j["pending"] = *event.pending;
    // Inbound frames are not guaranteed to be UTF-8; never let dump() throw on them
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
