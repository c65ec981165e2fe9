#include "audio/StemDecoder.h"
#include "cli/CommandLine.h"
#include "pipeline/DirectoryWalker.h"
#include "pipeline/TrackProcessor.h"
#include "tracing/Tracing.h"
#include "utils/Logger.h"

#include <exception>
#include <iostream>
#include <memory>

using namespace StemPrep;

int main(int argc, char* argv[]) {
    CommandLineOptions options;
    std::string error;
    if (!parseCommandLine(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    if (options.showHelp) {
        printUsage(std::cout, argv[0]);
        return 0;
    }
    if (options.showVersion) {
        std::cout << versionString() << "\n";
        return 0;
    }

    Logger& logger = Logger::getInstance();
    logger.setLevel(options.logLevel);
    if (!options.logFile.empty() && !logger.setLogFile(options.logFile)) {
        std::cerr << "Error: could not open log file " << options.logFile << "\n";
        return 1;
    }
    configureFfmpegLogging(options.logLevel == LogLevel::Debug);

    std::unique_ptr<tracing::ScopedTracing> tracer;
    if (!options.traceFile.empty()) {
        tracer = std::make_unique<tracing::ScopedTracing>(options.traceFile);
    }

    try {
        const PreprocessConfig& config = options.config;
        logInfo("Input: " + config.inputRoot.string() + ", output: " + config.outputRoot.string());
        logInfo("Sample rate: " + std::to_string(config.sampleRate) + " Hz, segment: " +
                std::to_string(config.segmentSeconds) + " s, hop: " + std::to_string(config.hopLength) +
                (config.maxDuration ? ", duration limit: " + std::to_string(*config.maxDuration) + " s" : ""));

        TrackProcessor processor(config);
        DirectoryWalker walker(config, processor);
        WalkSummary summary = walker.run();

        if (!summary.succeeded()) {
            for (const TrackFailure& failure : summary.failures) {
                logError(failure.trackPath.string() + ": " + failure.message);
            }
            return 2;
        }
    } catch (const std::exception& e) {
        logError(e.what());
        return 1;
    }

    return 0;
}
