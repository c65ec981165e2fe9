#include "DirectoryWalker.h"
#include "tracing/Tracing.h"
#include "utils/Errors.h"
#include "utils/Logger.h"

#include <algorithm>
#include <exception>

namespace fs = std::filesystem;

namespace StemPrep {

DirectoryWalker::DirectoryWalker(const PreprocessConfig& config, TrackProcessor& processor)
    : m_config(config)
    , m_processor(processor)
{
    validateConfig(m_config);
}

std::vector<fs::path> DirectoryWalker::collectTracks() const {
    const fs::path& root = m_config.inputRoot;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw IOError("Input root is not a directory: " + root.string() +
                      (ec ? " (" + ec.message() + ")" : ""));
    }

    std::vector<fs::path> tracks;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            if (entry.is_regular_file()) {
                tracks.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError("Failed to scan " + root.string() + ": " + e.what());
    }

    // Filesystem order is unspecified; sort for reproducible runs
    std::sort(tracks.begin(), tracks.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return tracks;
}

fs::path DirectoryWalker::outputDirFor(const fs::path& trackPath) const {
    const fs::path parent = trackPath.parent_path().lexically_normal();
    const fs::path root = m_config.inputRoot.lexically_normal();

    fs::path relative = parent.lexically_relative(root);
    if (relative.empty() || relative == ".") {
        return m_config.outputRoot;
    }
    return m_config.outputRoot / relative;
}

WalkSummary DirectoryWalker::run(std::optional<double> maxDuration) {
    TRACE_SCOPE("walk " + m_config.inputRoot.string());

    if (!maxDuration) {
        maxDuration = m_config.maxDuration;
    }

    WalkSummary summary;
    const std::vector<fs::path> tracks = collectTracks();
    logInfo("Found " + std::to_string(tracks.size()) + " file(s) under " + m_config.inputRoot.string());

    for (const fs::path& track : tracks) {
        const fs::path outputDir = outputDirFor(track);
        logDebug("Track " + track.string() + " -> " + outputDir.string());

        if (!m_config.continueOnError) {
            TrackReport report = m_processor.process(track, outputDir, maxDuration);
            summary.tracksProcessed++;
            summary.filesWritten += report.writtenFiles.size();
            continue;
        }

        try {
            TrackReport report = m_processor.process(track, outputDir, maxDuration);
            summary.tracksProcessed++;
            summary.filesWritten += report.writtenFiles.size();
        } catch (const std::exception& e) {
            logError("Failed to process " + track.string() + ": " + e.what());
            summary.failures.push_back({track, e.what()});
        }
    }

    logInfo("Processed " + std::to_string(summary.tracksProcessed) + " track(s), wrote " +
            std::to_string(summary.filesWritten) + " feature file(s)" +
            (summary.failures.empty() ? "" : ", " + std::to_string(summary.failures.size()) + " failed"));
    return summary;
}

} // namespace StemPrep
