#include "DestinationRegistry.hpp"
#include "BridgeLogging.hpp"
#include <algorithm>

DestinationRegistry::DestinationRegistry(Executor executor, BackoffConfig backoff)
    : m_executor(std::move(executor))
    , m_backoff(backoff)
{}

std::shared_ptr<Destination> DestinationRegistry::getOrCreate(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_byId.find(id);
    if (it != m_byId.end()) {
        return it->second;
    }

    auto dest = std::make_shared<Destination>(id, boost::asio::make_strand(m_executor), m_backoff);
    m_byId.emplace(id, dest);
    m_order.push_back(id);
    bLog_Debug(QString("Registered destination '%1' (%2 total)").arg(QString::fromStdString(id)).arg(m_order.size()));
    return dest;
}

std::shared_ptr<Destination> DestinationRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_byId.find(id);
    return it == m_byId.end() ? nullptr : it->second;
}

bool DestinationRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_byId.erase(id) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    return true;
}

std::vector<std::shared_ptr<Destination>> DestinationRegistry::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<Destination>> out;
    out.reserve(m_order.size());
    for (const auto& id : m_order) {
        out.push_back(m_byId.at(id));
    }
    return out;
}

size_t DestinationRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_byId.size();
}
