#pragma once
/*
wsbridge — BridgeConfig
Role: Command-line configuration of the bridge process (logging, queue, backoff, shutdown, aliases).
Inputs/Outputs: Raw argv (with @argsfile expansion) -> ConfigParseResult.
Threading: Startup only.
*/
#include <QStringList>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "BridgeLogging.hpp"
#include "bridge/registry/TargetResolver.hpp"
#include "bridge/ws/BackoffPolicy.hpp"

struct BridgeConfig {
    wsbridge::logging::Options  logging;
    size_t                      queueCapacity = 64;
    BackoffConfig               backoff;
    std::chrono::milliseconds   shutdownGrace{2000};
    TargetResolver::AliasMap    aliases;
};

struct ConfigParseResult {
    enum class Action { Run, ShowHelp, ShowVersion, Error };

    Action                   action = Action::Run;
    BridgeConfig             config;
    std::string              message;   // error text, help text or version string
    std::vector<std::string> warnings;  // accepted but adjusted options
};

// Replaces every "@file" argument (after the program name) with the file's lines:
// one argument per line, trimmed, blank lines and '#' comments skipped. A relative
// path is looked up in the working directory, then next to the executable.
// Returns false with error filled when a file cannot be read.
bool expandArgumentFiles(const QStringList& args, QStringList& out, std::string* error = nullptr);

// args[0] is the program name
ConfigParseResult parseBridgeConfig(const QStringList& args);
