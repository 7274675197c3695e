#include "BridgeConfig.hpp"
#include "StringUtils.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <cstdint>
#include <optional>

#ifndef WSBRIDGE_VERSION_STRING
#define WSBRIDGE_VERSION_STRING "0.0.0"
#endif

namespace {

std::optional<uint64_t> parseNumber(const QString& value) {
    return StringUtils::parseUnsigned<uint64_t>(value.trimmed().toStdString());
}

QString locateArgumentFile(const QString& path, const QString& program) {
    QFileInfo info(path);
    if (info.isAbsolute() || info.exists()) return path;
    const QString beside = QFileInfo(program).absoluteDir().filePath(path);
    return QFileInfo::exists(beside) ? beside : path;
}

} // namespace

bool expandArgumentFiles(const QStringList& args, QStringList& out, std::string* error) {
    out.clear();
    for (int i = 0; i < args.size(); ++i) {
        const QString& arg = args.at(i);
        if (i == 0 || !arg.startsWith('@') || arg.size() < 2) {
            out << arg;
            continue;
        }

        const QString path = locateArgumentFile(arg.mid(1), args.isEmpty() ? QString() : args.at(0));
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            if (error) *error = "cannot read arguments file '" + path.toStdString() + "': " + file.errorString().toStdString();
            return false;
        }
        QTextStream in(&file);
        while (!in.atEnd()) {
            const QString line = in.readLine().trimmed();
            if (line.isEmpty() || line.startsWith('#')) continue;
            out << line;
        }
    }
    return true;
}

ConfigParseResult parseBridgeConfig(const QStringList& rawArgs) {
    ConfigParseResult result;
    auto fail = [&result](std::string message) {
        result.action = ConfigParseResult::Action::Error;
        result.message = std::move(message);
        return result;
    };

    QStringList args;
    std::string fileError;
    if (!expandArgumentFiles(rawArgs, args, &fileError)) {
        return fail(fileError);
    }

    QCommandLineParser parser;
    parser.setApplicationDescription("Touch Portal WebSocket bridge: forwards \"Send Message\" actions to WebSocket destinations.");
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption debugOption("d", "Debug logging.");
    const QCommandLineOption warnOption("w", "Log warnings and errors only.");
    const QCommandLineOption quietOption("q", "Disable logging.");
    const QCommandLineOption fileOption("l", "Log file, 'none' disables.", "file", "none");
    const QCommandLineOption streamOption("s", "Log stream: 'stderr' or 'none'.", "stream", "stderr");
    const QCommandLineOption capacityOption("queue-capacity", "Pending messages kept per destination.", "n", "64");
    const QCommandLineOption baseOption("backoff-base-ms", "First reconnect delay.", "ms", "1000");
    const QCommandLineOption maxOption("backoff-max-ms", "Longest reconnect delay.", "ms", "60000");
    const QCommandLineOption jitterOption("backoff-jitter-ms", "Random delay added to each reconnect.", "ms", "250");
    const QCommandLineOption graceOption("shutdown-grace-ms", "Time allowed for closing connections on exit.", "ms", "2000");
    const QCommandLineOption aliasOption("alias", "Destination alias, repeatable.", "name=uri");

    parser.addOptions({debugOption, warnOption, quietOption, fileOption, streamOption,
                       capacityOption, baseOption, maxOption, jitterOption, graceOption, aliasOption});

    if (!parser.parse(args)) {
        return fail(parser.errorText().toStdString());
    }
    if (parser.isSet(helpOption)) {
        result.action = ConfigParseResult::Action::ShowHelp;
        result.message = parser.helpText().toStdString();
        return result;
    }
    if (parser.isSet(versionOption)) {
        result.action = ConfigParseResult::Action::ShowVersion;
        result.message = std::string("wsbridge ") + WSBRIDGE_VERSION_STRING;
        return result;
    }
    if (!parser.positionalArguments().isEmpty()) {
        return fail("unexpected argument '" + parser.positionalArguments().first().toStdString() + "'");
    }

    BridgeConfig& cfg = result.config;

    // -q beats -w beats -d
    using wsbridge::logging::Level;
    if (parser.isSet(quietOption))      cfg.logging.level = Level::Quiet;
    else if (parser.isSet(warnOption))  cfg.logging.level = Level::Warning;
    else if (parser.isSet(debugOption)) cfg.logging.level = Level::Debug;

    const QString file = parser.value(fileOption).trimmed();
    if (!file.isEmpty() && file.compare("none", Qt::CaseInsensitive) != 0) {
        cfg.logging.filePath = file.toStdString();
    }

    const QString stream = parser.value(streamOption).trimmed().toLower();
    if (stream == "stderr") {
        cfg.logging.toStderr = true;
    } else if (stream == "none") {
        cfg.logging.toStderr = false;
    } else if (stream == "stdout") {
        cfg.logging.toStderr = true;
        result.warnings.emplace_back("log stream 'stdout' is reserved for the host protocol, logging to stderr instead");
    } else {
        return fail("invalid log stream '" + stream.toStdString() + "' (expected stderr or none)");
    }

    auto number = [&parser](const QCommandLineOption& opt) { return parseNumber(parser.value(opt)); };

    const auto capacity = number(capacityOption);
    if (!capacity || *capacity == 0) {
        return fail("--queue-capacity must be a positive integer");
    }
    cfg.queueCapacity = static_cast<size_t>(*capacity);

    const auto base = number(baseOption);
    const auto cap = number(maxOption);
    const auto jitter = number(jitterOption);
    const auto grace = number(graceOption);
    if (!base || *base == 0) return fail("--backoff-base-ms must be a positive integer");
    if (!cap)                return fail("--backoff-max-ms must be a non-negative integer");
    if (*cap < *base)        return fail("--backoff-max-ms must not be smaller than --backoff-base-ms");
    if (!jitter)             return fail("--backoff-jitter-ms must be a non-negative integer");
    if (!grace)              return fail("--shutdown-grace-ms must be a non-negative integer");

    const auto limit = static_cast<uint64_t>(BackoffPolicy::kMaxDelay.count());
    const std::string limitText = " must not exceed " + std::to_string(limit) + " (24 hours)";
    if (*base > limit)   return fail("--backoff-base-ms" + limitText);
    if (*cap > limit)    return fail("--backoff-max-ms" + limitText);
    if (*jitter > limit) return fail("--backoff-jitter-ms" + limitText);
    if (*grace > limit)  return fail("--shutdown-grace-ms" + limitText);

    cfg.backoff.base = std::chrono::milliseconds(static_cast<int64_t>(*base));
    cfg.backoff.cap = std::chrono::milliseconds(static_cast<int64_t>(*cap));
    cfg.backoff.maxJitter = std::chrono::milliseconds(static_cast<int64_t>(*jitter));
    cfg.shutdownGrace = std::chrono::milliseconds(static_cast<int64_t>(*grace));

    for (const QString& alias : parser.values(aliasOption)) {
        std::vector<std::string> errors;
        auto parsed = TargetResolver::parseAliasList(alias.toStdString(), &errors);
        if (!errors.empty()) {
            return fail("--alias: " + errors.front());
        }
        for (auto& [name, uri] : parsed) {
            cfg.aliases[name] = std::move(uri);
        }
    }

    return result;
}
