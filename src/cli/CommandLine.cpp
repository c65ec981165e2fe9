#include "CommandLine.h"

#include <cstring>
#include <exception>

namespace StemPrep {

namespace {

bool isOption(const char* arg, const char* shortName, const char* longName) {
    return (shortName && std::strcmp(arg, shortName) == 0) || std::strcmp(arg, longName) == 0;
}

bool parseDouble(const std::string& text, double& value) {
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string versionString() {
    return "StemPrep 1.0.0";
}

void printUsage(std::ostream& out, const char* programName) {
    out << "StemPrep - Multi-stem MFCC feature preprocessor\n";
    out << versionString() << "\n\n";
    out << "Usage:\n";
    out << "  " << programName << " [options]\n\n";
    out << "Walks the input tree, decodes every file into stems, splits each stem into\n";
    out << "fixed-length segments and writes one MFCC .npy file per segment into a\n";
    out << "mirrored output tree.\n\n";
    out << "Options:\n";
    out << "  -i, --input <dir>               Input root (default: data/raw)\n";
    out << "  -o, --output <dir>              Output root (default: data/processed)\n";
    out << "  -d, --duration <seconds>        Process only the first <seconds> of each stem\n";
    out << "  -l, --segment-length <seconds>  Segment length (default: 5)\n";
    out << "  -r, --sample-rate <hz>          Decode sample rate (default: 22050)\n";
    out << "      --hop-length <samples>      MFCC frame hop (default: 512)\n";
    out << "      --continue-on-error         Log failing tracks and continue\n";
    out << "  -v, --verbose                   Log every processed segment\n";
    out << "  -q, --quiet                     Only log warnings and errors\n";
    out << "      --log-file <path>           Also append log output to <path>\n";
    out << "      --trace <path>              Write timing spans to <path>\n";
    out << "      --version                   Show version\n";
    out << "  -h, --help                      Show this help message\n\n";
    out << "Examples:\n";
    out << "  " << programName << "\n";
    out << "  " << programName << " --duration 30\n";
    out << "  " << programName << " -i musdb/train -o features/train -l 3\n";
}

bool parseCommandLine(int argc, const char* const argv[], CommandLineOptions& options, std::string& error) {
    error.clear();

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool hasValue = (i + 1 < argc);

        if (isOption(arg, "-h", "--help")) {
            options.showHelp = true;
        } else if (isOption(arg, nullptr, "--version")) {
            options.showVersion = true;
        } else if (isOption(arg, "-v", "--verbose")) {
            options.logLevel = LogLevel::Debug;
        } else if (isOption(arg, "-q", "--quiet")) {
            options.logLevel = LogLevel::Warn;
        } else if (isOption(arg, nullptr, "--continue-on-error")) {
            options.config.continueOnError = true;
        } else if (isOption(arg, "-i", "--input") || isOption(arg, "-o", "--output") ||
                   isOption(arg, nullptr, "--log-file") || isOption(arg, nullptr, "--trace")) {
            if (!hasValue) {
                error = std::string(arg) + " requires a value";
                return false;
            }
            std::string value = argv[++i];
            if (value.empty()) {
                error = std::string(arg) + " requires a non-empty value";
                return false;
            }
            if (isOption(arg, "-i", "--input")) {
                options.config.inputRoot = value;
            } else if (isOption(arg, "-o", "--output")) {
                options.config.outputRoot = value;
            } else if (isOption(arg, nullptr, "--log-file")) {
                options.logFile = value;
            } else {
                options.traceFile = value;
            }
        } else if (isOption(arg, "-d", "--duration")) {
            double seconds = 0.0;
            if (!hasValue || !parseDouble(argv[i + 1], seconds) || seconds < 0.0) {
                error = "--duration requires a non-negative number of seconds";
                return false;
            }
            options.config.maxDuration = seconds;
            ++i;
        } else if (isOption(arg, "-l", "--segment-length")) {
            double seconds = 0.0;
            if (!hasValue || !parseDouble(argv[i + 1], seconds) || seconds <= 0.0) {
                error = "--segment-length requires a positive number of seconds";
                return false;
            }
            options.config.segmentSeconds = seconds;
            ++i;
        } else if (isOption(arg, "-r", "--sample-rate")) {
            int rate = 0;
            if (!hasValue || !parseInt(argv[i + 1], rate) || rate <= 0) {
                error = "--sample-rate requires a positive integer";
                return false;
            }
            options.config.sampleRate = rate;
            ++i;
        } else if (isOption(arg, nullptr, "--hop-length")) {
            int hop = 0;
            if (!hasValue || !parseInt(argv[i + 1], hop) || hop <= 0) {
                error = "--hop-length requires a positive integer";
                return false;
            }
            options.config.hopLength = hop;
            ++i;
        } else {
            error = std::string("Unknown option: ") + arg;
            return false;
        }
    }

    return true;
}

} // namespace StemPrep
