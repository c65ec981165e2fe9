#include <catch2/catch_test_macros.hpp>
#include "cli/CommandLine.h"

#include <sstream>

using namespace StemPrep;

namespace {

bool parse(std::vector<const char*> args, CommandLineOptions& options, std::string& error) {
    args.insert(args.begin(), "stemprep");
    return parseCommandLine(static_cast<int>(args.size()), args.data(), options, error);
}

} // namespace

TEST_CASE("No arguments keeps the default layout", "[cli]") {
    CommandLineOptions options;
    std::string error;
    REQUIRE(parse({}, options, error));
    REQUIRE(error.empty());
    REQUIRE(options.config.inputRoot == std::filesystem::path("data") / "raw");
    REQUIRE(options.config.outputRoot == std::filesystem::path("data") / "processed");
    REQUIRE_FALSE(options.config.maxDuration.has_value());
    REQUIRE(options.logLevel == LogLevel::Info);
    REQUIRE(options.traceFile.empty());
}

TEST_CASE("Command line options populate the configuration", "[cli]") {
    CommandLineOptions options;
    std::string error;
    REQUIRE(parse({"-i", "in", "--output", "out", "-d", "30", "-l", "3",
                   "-r", "16000", "--hop-length", "256", "--continue-on-error",
                   "--log-file", "run.log", "--trace", "trace.log", "-v"},
                  options, error));

    REQUIRE(options.config.inputRoot == "in");
    REQUIRE(options.config.outputRoot == "out");
    REQUIRE(options.config.maxDuration.has_value());
    REQUIRE(*options.config.maxDuration == 30.0);
    REQUIRE(options.config.segmentSeconds == 3.0);
    REQUIRE(options.config.sampleRate == 16000);
    REQUIRE(options.config.hopLength == 256);
    REQUIRE(options.config.continueOnError);
    REQUIRE(options.logFile == "run.log");
    REQUIRE(options.traceFile == "trace.log");
    REQUIRE(options.logLevel == LogLevel::Debug);
}

TEST_CASE("Help, version and quiet flags", "[cli]") {
    CommandLineOptions options;
    std::string error;
    REQUIRE(parse({"--help", "--version", "-q"}, options, error));
    REQUIRE(options.showHelp);
    REQUIRE(options.showVersion);
    REQUIRE(options.logLevel == LogLevel::Warn);

    std::ostringstream usage;
    printUsage(usage, "stemprep");
    REQUIRE(usage.str().find("--duration") != std::string::npos);
    REQUIRE(usage.str().find(versionString()) != std::string::npos);
}

TEST_CASE("Invalid command lines are rejected", "[cli][error]") {
    CommandLineOptions options;
    std::string error;

    REQUIRE_FALSE(parse({"--bogus"}, options, error));
    REQUIRE(error.find("--bogus") != std::string::npos);

    REQUIRE_FALSE(parse({"-i"}, options, error));
    REQUIRE_FALSE(parse({"-d", "abc"}, options, error));
    REQUIRE_FALSE(parse({"-d", "-5"}, options, error));
    REQUIRE_FALSE(parse({"-l", "0"}, options, error));
    REQUIRE_FALSE(parse({"-r", "44.1"}, options, error));
    REQUIRE_FALSE(parse({"--hop-length", "0"}, options, error));
    REQUIRE_FALSE(error.empty());
}
