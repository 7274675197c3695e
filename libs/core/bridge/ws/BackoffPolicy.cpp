#include "BackoffPolicy.hpp"
#include <algorithm>

BackoffPolicy::BackoffPolicy(BackoffConfig config, uint32_t seed)
    : m_config(config)
    , m_gen(seed)
{
    m_config.base = std::clamp(m_config.base, std::chrono::milliseconds(1), kMaxDelay);
    m_config.cap = std::clamp(m_config.cap, m_config.base, kMaxDelay);
    m_config.maxJitter = std::clamp(m_config.maxJitter, std::chrono::milliseconds(0), kMaxDelay);
}

std::chrono::milliseconds BackoffPolicy::nominalDelay() const {
    // Saturate at the cap instead of doubling past it
    auto delay = m_config.base;
    for (uint32_t i = 0; i < m_attempt && delay < m_config.cap; ++i) {
        if (delay > m_config.cap / 2) {
            delay = m_config.cap;
            break;
        }
        delay *= 2;
    }
    return std::min(delay, m_config.cap);
}

std::chrono::milliseconds BackoffPolicy::nextDelay() {
    auto delay = nominalDelay();
    ++m_attempt;
    if (m_config.maxJitter.count() > 0) {
        std::uniform_int_distribution<long long> dist(0, m_config.maxJitter.count());
        const auto jitter = std::chrono::milliseconds(dist(m_gen));
        delay = jitter > m_config.cap - delay ? m_config.cap : delay + jitter;
    }
    // Jitter on a short step may overshoot the next one
    delay = std::max(delay, m_lastDelay);
    m_lastDelay = delay;
    return delay;
}
