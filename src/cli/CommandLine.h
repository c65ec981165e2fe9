#pragma once

#include "pipeline/PreprocessConfig.h"
#include "utils/Logger.h"

#include <ostream>
#include <string>

namespace StemPrep {

struct CommandLineOptions {
    PreprocessConfig config;
    LogLevel logLevel = LogLevel::Info;
    std::string logFile;     // empty = console only
    std::string traceFile;   // empty = tracing disabled
    bool showHelp = false;
    bool showVersion = false;
};

// Parse argv into options. No arguments yields the defaults.
// Returns false and sets `error` on an unknown option or a bad value.
bool parseCommandLine(int argc, const char* const argv[], CommandLineOptions& options, std::string& error);

void printUsage(std::ostream& out, const char* programName);

std::string versionString();

} // namespace StemPrep
