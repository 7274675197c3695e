#pragma once
#include <boost/asio/io_context.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Destination.hpp"

// Pure id -> Destination mapping. Creating an entry never opens a connection and
// never validates the id; resolution happens in ConnectionManager::connect.
class DestinationRegistry {
public:
    using Executor = boost::asio::io_context::executor_type;

    DestinationRegistry(Executor executor, BackoffConfig backoff);

    std::shared_ptr<Destination> getOrCreate(const std::string& id);
    std::shared_ptr<Destination> find(const std::string& id) const;
    bool remove(const std::string& id);

    // Snapshot in insertion order
    std::vector<std::shared_ptr<Destination>> list() const;
    size_t size() const;

    DestinationRegistry(const DestinationRegistry&) = delete;
    DestinationRegistry& operator=(const DestinationRegistry&) = delete;

private:
    Executor                    m_executor;
    BackoffConfig               m_backoff;

    mutable std::mutex          m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Destination>> m_byId;
    std::vector<std::string>    m_order;
};
