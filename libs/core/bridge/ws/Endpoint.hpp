#pragma once
#include <optional>
#include <string>
#include <string_view>

// A parsed ws:// or wss:// URI, split the way the transport consumes it
struct Endpoint {
    bool        secure = false;
    std::string host;          // IPv6 literals without brackets
    std::string port;          // numeric; 80/443 when the URI omits it
    std::string target = "/";  // path + query

    // Value for the HTTP Host header during the upgrade handshake
    std::string hostHeader() const;
    std::string toString() const;

    bool operator==(const Endpoint&) const = default;
};

// Returns nullopt and fills error (when given) if uri is not a usable WebSocket URI.
std::optional<Endpoint> parseEndpoint(std::string_view uri, std::string* error = nullptr);
