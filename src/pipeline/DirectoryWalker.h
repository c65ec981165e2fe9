#pragma once

#include "PreprocessConfig.h"
#include "TrackProcessor.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace StemPrep {

struct TrackFailure {
    std::filesystem::path trackPath;
    std::string message;
};

// Summary of one walk over the input tree
struct WalkSummary {
    size_t tracksProcessed = 0;
    size_t filesWritten = 0;
    std::vector<TrackFailure> failures;  // only populated with continueOnError

    bool succeeded() const { return failures.empty(); }
};

/**
 * @brief Mirrors an input tree of track files into an output tree of features
 *
 * Every regular file under the input root (no extension filter) is handed to
 * the TrackProcessor, sorted lexicographically by path, with output directory
 * outputRoot / <file's parent relative to inputRoot>. Tracks are processed
 * one at a time.
 */
class DirectoryWalker {
public:
    DirectoryWalker(const PreprocessConfig& config, TrackProcessor& processor);

    /**
     * @param maxDuration Per-stem duration limit; falls back to config.maxDuration when absent
     * @throws IOError if the input root is missing; otherwise whatever the
     *         processor throws, unless config.continueOnError is set
     */
    WalkSummary run(std::optional<double> maxDuration = std::nullopt);

    // Regular files under the input root, sorted by generic path string.
    std::vector<std::filesystem::path> collectTracks() const;

    // outputRoot / relative(parent(trackPath), inputRoot)
    std::filesystem::path outputDirFor(const std::filesystem::path& trackPath) const;

private:
    PreprocessConfig m_config;
    TrackProcessor& m_processor;
};

} // namespace StemPrep
