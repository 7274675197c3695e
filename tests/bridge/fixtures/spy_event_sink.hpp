#pragma once
#include "bridge/events/IEventSink.hpp"
#include <mutex>
#include <stdexcept>
#include <vector>

/// Spy sink that records every published event for verification in tests
class SpyEventSink : public IEventSink {
public:
    void publish(BridgeEvent event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    // Accessors for test verification
    std::vector<BridgeEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<BridgeEvent> ofKind(EventKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<BridgeEvent> out;
        for (const auto& e : events_) {
            if (e.kind == kind) out.push_back(e);
        }
        return out;
    }

    size_t count(EventKind kind) const { return ofKind(kind).size(); }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    // Copy, so a later publish cannot invalidate it
    BridgeEvent last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            throw std::runtime_error("SpyEventSink: No events recorded");
        }
        return events_.back();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<BridgeEvent> events_;
};
