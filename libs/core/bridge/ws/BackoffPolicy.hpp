#pragma once
#include <chrono>
#include <cstdint>
#include <random>

struct BackoffConfig {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{60000};
    std::chrono::milliseconds maxJitter{250};
};

// Exponential reconnect backoff: base, 2*base, 4*base ... plus 0..maxJitter.
// The result never exceeds cap and never drops below the previous delay.
class BackoffPolicy {
public:
    // Upper bound for every configured duration
    static constexpr std::chrono::milliseconds kMaxDelay{24 * 60 * 60 * 1000};

    explicit BackoffPolicy(BackoffConfig config = {}, uint32_t seed = std::random_device{}());

    // Delay for the next retry; advances the attempt counter
    std::chrono::milliseconds nextDelay();

    // Delay without jitter that the next call to nextDelay() is based on
    std::chrono::milliseconds nominalDelay() const;

    void reset() { m_attempt = 0; m_lastDelay = std::chrono::milliseconds(0); }
    uint32_t attempts() const { return m_attempt; }
    const BackoffConfig& config() const { return m_config; }

private:
    BackoffConfig m_config;
    uint32_t      m_attempt = 0;
    std::chrono::milliseconds m_lastDelay{0};
    std::mt19937  m_gen;
};
