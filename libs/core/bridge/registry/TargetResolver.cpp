#include "TargetResolver.hpp"
#include "StringUtils.hpp"

namespace {

// True when text begins a new "name=ws://..." or "name=wss://..." entry
bool startsAliasEntry(std::string_view text) {
    text = StringUtils::trimView(text);
    const size_t eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) return false;
    const auto target = StringUtils::trimView(text.substr(eq + 1));
    return StringUtils::startsWithIgnoreCase(target, "ws://") || StringUtils::startsWithIgnoreCase(target, "wss://");
}

// Splits one line on ';' only where the next entry starts, so a ';' inside a
// URI query stays part of that URI
std::vector<std::string_view> splitEntries(std::string_view line) {
    std::vector<std::string_view> out;
    size_t start = 0;
    size_t from = 0;
    while (true) {
        const size_t semi = line.find(';', from);
        if (semi == std::string_view::npos) {
            out.push_back(line.substr(start));
            return out;
        }
        if (startsAliasEntry(line.substr(semi + 1))) {
            out.push_back(line.substr(start, semi - start));
            start = semi + 1;
        }
        from = semi + 1;
    }
}

} // namespace

TargetResolver::TargetResolver(AliasMap configured)
    : m_configured(std::move(configured))
{}

TargetResolver::Resolution TargetResolver::resolve(const std::string& id) const {
    Resolution out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_host.find(id); it != m_host.end()) {
            out.uri = it->second;
        } else if (auto it2 = m_configured.find(id); it2 != m_configured.end()) {
            out.uri = it2->second;
        } else {
            out.uri = id;
        }
    }
    out.endpoint = parseEndpoint(out.uri, &out.error);
    return out;
}

void TargetResolver::setHostAliases(AliasMap aliases) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_host = std::move(aliases);
}

TargetResolver::AliasMap TargetResolver::hostAliases() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_host;
}

TargetResolver::AliasMap TargetResolver::parseAliasList(std::string_view text, std::vector<std::string>* errors) {
    AliasMap out;
    for (auto line : StringUtils::split(text, "\n")) {
        for (auto entry : splitEntries(line)) {
            entry = StringUtils::trimView(entry);
            if (entry.empty() || entry.front() == '#') continue;

            const size_t eq = entry.find('=');
            if (eq == std::string_view::npos) {
                if (errors) errors->push_back("alias without '=': " + std::string(entry));
                continue;
            }
            auto name = StringUtils::trim(entry.substr(0, eq));
            auto uri = StringUtils::trim(entry.substr(eq + 1));
            if (name.empty() || uri.empty()) {
                if (errors) errors->push_back("alias with empty name or target: " + std::string(entry));
                continue;
            }
            out[std::move(name)] = std::move(uri);
        }
    }
    return out;
}
