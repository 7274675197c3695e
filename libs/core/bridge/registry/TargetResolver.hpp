#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "bridge/ws/Endpoint.hpp"

// Maps a destination id to a WebSocket endpoint. Host-provided aliases win over
// command-line aliases; an id without an alias must itself be a ws:// or wss:// URI.
class TargetResolver {
public:
    using AliasMap = std::map<std::string, std::string>;

    struct Resolution {
        std::string             uri;       // value that was parsed (alias target or the id)
        std::optional<Endpoint> endpoint;  // empty when uri is not a usable endpoint
        std::string             error;
    };

    TargetResolver() = default;
    explicit TargetResolver(AliasMap configured);

    Resolution resolve(const std::string& id) const;

    void setHostAliases(AliasMap aliases);
    AliasMap hostAliases() const;

    // "name=uri" entries separated by newlines, or by ';' when the next entry
    // starts with "name=ws://" or "name=wss://". Malformed entries are skipped
    // and described in errors when given.
    static AliasMap parseAliasList(std::string_view text, std::vector<std::string>* errors = nullptr);

private:
    mutable std::mutex m_mutex;
    AliasMap           m_configured;
    AliasMap           m_host;
};
