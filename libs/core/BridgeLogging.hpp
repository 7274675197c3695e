#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <string>

// =============================================================================
// WSBRIDGE LOGGING CATEGORIES
// =============================================================================
// stdout belongs to the host protocol. Every category is routed through the
// handler installed by wsbridge::logging::install(), which writes to stderr
// and/or a log file only.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: startup, config, shutdown
Q_DECLARE_LOGGING_CATEGORY(logHost)     // Host channel: inbound commands, outbound events
Q_DECLARE_LOGGING_CATEGORY(logNet)      // Network: WebSocket lifecycle, retries, sends
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING SYSTEM
// =============================================================================

namespace wsbridge::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;
    inline constexpr int kHost  = 1;
    inline constexpr int kNet   = 1;
    inline constexpr int kDebug = 10;

    inline int intervalFromEnv(const char* name, int fallback) {
        const char* env = std::getenv(name);
        if (!env) return fallback;
        const int v = std::atoi(env);
        return v > 0 ? v : fallback;
    }
}

// Logs the 1st, (N+1)th, (2N+1)th... message of a call site
#define BLOG_THROTTLED(cat, level, defaultInterval, ...)                             \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static const int _interval = ::wsbridge::log_throttle::intervalFromEnv(      \
            "WSBRIDGE_LOG_" #cat "_INTERVAL", (defaultInterval));                    \
        if ((_counter.fetch_add(1) % static_cast<uint32_t>(_interval)) == 0) {       \
            level(log##cat).noquote() << __VA_ARGS__;                                \
        }                                                                            \
    } while (false)

// =============================================================================
// LOGGING MACROS
// =============================================================================

#define bLog_App(...)    BLOG_THROTTLED(App,   qCInfo,  wsbridge::log_throttle::kApp,   __VA_ARGS__)
#define bLog_Host(...)   BLOG_THROTTLED(Host,  qCInfo,  wsbridge::log_throttle::kHost,  __VA_ARGS__)
#define bLog_Net(...)    BLOG_THROTTLED(Net,   qCInfo,  wsbridge::log_throttle::kNet,   __VA_ARGS__)
#define bLog_Debug(...)  BLOG_THROTTLED(Debug, qCDebug, wsbridge::log_throttle::kDebug, __VA_ARGS__)

// Override macros for specific throttle intervals (hot paths: per-message sends)
#define bLog_HostN(n, ...)  BLOG_THROTTLED(Host,  qCInfo,  n, __VA_ARGS__)
#define bLog_NetN(n, ...)   BLOG_THROTTLED(Net,   qCInfo,  n, __VA_ARGS__)
#define bLog_DebugN(n, ...) BLOG_THROTTLED(Debug, qCDebug, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define bLog_Warning(...)  qCWarning(logApp).noquote() << __VA_ARGS__
#define bLog_Error(...)    qCCritical(logApp).noquote() << __VA_ARGS__

// =============================================================================
// OUTPUT ROUTING
// =============================================================================
//   export WSBRIDGE_LOG_Net_INTERVAL=20    # Log every 20th network message
//   export QT_LOGGING_RULES="wsbridge.debug.debug=true"

namespace wsbridge::logging {

enum class Level { Debug, Info, Warning, Quiet };

struct Options {
    Level       level = Level::Info;
    std::string filePath;           // empty: no log file
    bool        toStderr = true;
};

// Installs the Qt message handler and category filter rules.
// Returns false (with error filled) when the log file cannot be opened;
// stderr logging stays active in that case.
bool install(const Options& options, std::string* error = nullptr);

// Flushes and closes the log file, restores the default handler.
void shutdown();

const char* toString(Level level);

}
