#include "Endpoint.hpp"
#include "StringUtils.hpp"

#include <cstdint>

namespace {

std::optional<Endpoint> fail(std::string* error, std::string msg) {
    if (error) *error = std::move(msg);
    return std::nullopt;
}

bool validHostChars(std::string_view host) {
    for (char c : host) {
        if (StringUtils::isAsciiSpace(c) || c == '/' || c == '@' || c == '[' || c == ']') return false;
    }
    return true;
}

} // namespace

std::string Endpoint::hostHeader() const {
    const bool v6 = host.find(':') != std::string::npos;
    std::string h = v6 ? "[" + host + "]" : host;
    const bool defaultPort = (secure && port == "443") || (!secure && port == "80");
    if (!defaultPort) {
        h += ":" + port;
    }
    return h;
}

std::string Endpoint::toString() const {
    const bool v6 = host.find(':') != std::string::npos;
    return std::string(secure ? "wss://" : "ws://") + (v6 ? "[" + host + "]" : host) + ":" + port + target;
}

std::optional<Endpoint> parseEndpoint(std::string_view uri, std::string* error) {
    Endpoint ep;
    std::string_view rest;
    if (StringUtils::startsWithIgnoreCase(uri, "wss://")) {
        ep.secure = true;
        rest = uri.substr(6);
    } else if (StringUtils::startsWithIgnoreCase(uri, "ws://")) {
        rest = uri.substr(5);
    } else {
        return fail(error, "scheme must be ws:// or wss://");
    }

    if (rest.find('#') != std::string_view::npos) {
        return fail(error, "fragment not allowed in WebSocket URI");
    }

    const size_t authorityEnd = rest.find_first_of("/?");
    const std::string_view authority = rest.substr(0, authorityEnd);
    std::string_view target = authorityEnd == std::string_view::npos ? std::string_view{} : rest.substr(authorityEnd);

    if (authority.find('@') != std::string_view::npos) {
        return fail(error, "user info not supported");
    }

    std::string_view host;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return fail(error, "unterminated IPv6 literal");
        }
        host = authority.substr(1, close - 1);
        const std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return fail(error, "unexpected characters after IPv6 literal");
            port = after.substr(1);
            if (port.empty()) return fail(error, "empty port");
        }
    } else {
        const size_t colon = authority.find(':');
        if (colon != std::string_view::npos) {
            if (authority.find(':', colon + 1) != std::string_view::npos) {
                return fail(error, "IPv6 host must be bracketed");
            }
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
            if (port.empty()) return fail(error, "empty port");
        } else {
            host = authority;
        }
        if (!validHostChars(host)) {
            return fail(error, "invalid host");
        }
    }

    if (host.empty()) {
        return fail(error, "missing host");
    }

    if (!port.empty()) {
        const auto value = StringUtils::parseUnsigned<uint32_t>(port);
        if (!value || *value == 0 || *value > 65535) {
            return fail(error, "invalid port");
        }
        ep.port = std::to_string(*value);
    } else {
        ep.port = ep.secure ? "443" : "80";
    }

    for (char c : target) {
        if (StringUtils::isAsciiSpace(c)) return fail(error, "whitespace in path");
    }

    ep.host = std::string(host);
    if (target.empty()) {
        ep.target = "/";
    } else if (target.front() == '?') {
        ep.target = "/" + std::string(target);
    } else {
        ep.target = std::string(target);
    }
    return ep;
}
