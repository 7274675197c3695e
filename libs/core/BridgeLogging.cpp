#include "BridgeLogging.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <QString>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string_view>

Q_LOGGING_CATEGORY(logApp, "wsbridge.app")
Q_LOGGING_CATEGORY(logHost, "wsbridge.host")
Q_LOGGING_CATEGORY(logNet, "wsbridge.net")
Q_LOGGING_CATEGORY(logDebug, "wsbridge.debug")

namespace wsbridge::logging {
namespace {

struct Sink {
    std::mutex   mutex;
    std::FILE*   file = nullptr;
    bool         toStderr = true;
};

Sink& sink() {
    static Sink s;
    return s;
}

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "?";
}

std::string_view baseName(const char* file) {
    if (!file) return "?";
    std::string_view f(file);
    const auto pos = f.find_last_of("/\\");
    return pos == std::string_view::npos ? f : f.substr(pos + 1);
}

void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto now = std::chrono::system_clock::now();
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    const std::string line = fmt::format("[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{}:{}] {}\n",
                                         std::chrono::floor<std::chrono::seconds>(now),
                                         us % 1000000,
                                         levelName(type),
                                         ctx.category ? ctx.category : "default",
                                         baseName(ctx.file), ctx.line,
                                         msg.toStdString());

    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.toStderr) {
        std::fputs(line.c_str(), stderr);
    }
    if (s.file) {
        std::fputs(line.c_str(), s.file);
        std::fflush(s.file);
    }
}

QString filterRules(Level level) {
    switch (level) {
        case Level::Debug:
            return QStringLiteral("wsbridge.*=true");
        case Level::Info:
            return QStringLiteral("wsbridge.*.debug=false");
        case Level::Warning:
            return QStringLiteral("wsbridge.*.debug=false\nwsbridge.*.info=false");
        case Level::Quiet:
            return QStringLiteral("*=false");
    }
    return {};
}

} // namespace

const char* toString(Level level) {
    switch (level) {
        case Level::Debug:   return "debug";
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Quiet:   return "quiet";
    }
    return "info";
}

bool install(const Options& options, std::string* error) {
    bool ok = true;
    {
        Sink& s = sink();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file) {
            std::fclose(s.file);
            s.file = nullptr;
        }
        s.toStderr = options.toStderr && options.level != Level::Quiet;
        if (!options.filePath.empty() && options.level != Level::Quiet) {
            s.file = std::fopen(options.filePath.c_str(), "a");
            if (!s.file) {
                ok = false;
                if (error) *error = fmt::format("cannot open log file '{}'", options.filePath);
            }
        }
    }

    QLoggingCategory::setFilterRules(filterRules(options.level));
    qInstallMessageHandler(messageHandler);
    return ok;
}

void shutdown() {
    qInstallMessageHandler(nullptr);
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) {
        std::fclose(s.file);
        s.file = nullptr;
    }
}

}
