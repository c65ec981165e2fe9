#pragma once

#include "PreprocessConfig.h"
#include "audio/MfccExtractor.h"
#include "audio/StemDecoder.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace StemPrep {

// Decodes a container into stems at the requested rate. Must throw DecodeError on failure.
using StemDecodeFunction = std::function<DecodedTrack(const std::string& filePath, int targetSampleRate)>;

// Summary of one processed track
struct TrackReport {
    std::filesystem::path trackPath;
    std::vector<size_t> segmentsPerStem;            // index = stem index
    std::vector<std::filesystem::path> writtenFiles; // in (stem, segment) order

    size_t stemCount() const { return segmentsPerStem.size(); }
};

/**
 * @brief Turns one multi-stem track into per-segment MFCC files
 *
 * Decodes the track, splits every stem into fixed-length segments (the last
 * one truncated) and writes <output_dir>/<track filename>_stem<i>_segment<j>.npy
 * for each. Fails fast: the first error abandons the track and propagates,
 * leaving files already written in place.
 */
class TrackProcessor {
public:
    // Uses the FFmpeg stem decoder
    explicit TrackProcessor(const PreprocessConfig& config);
    TrackProcessor(const PreprocessConfig& config, StemDecodeFunction decoder);

    /**
     * @param trackPath   Source container
     * @param outputDir   Created (with parents) if missing
     * @param maxDuration Seconds of each stem to process; nullopt processes the full stem
     * @throws DecodeError, IOError
     */
    TrackReport process(const std::filesystem::path& trackPath,
                        const std::filesystem::path& outputDir,
                        std::optional<double> maxDuration = std::nullopt);

    const PreprocessConfig& getConfig() const { return m_config; }

    // "<track filename>_stem<i>_segment<j>.npy"
    static std::string featureFileName(const std::filesystem::path& trackPath, size_t stemIndex, size_t segmentIndex);

private:
    PreprocessConfig m_config;
    StemDecodeFunction m_decoder;
    MfccExtractor m_extractor;
};

} // namespace StemPrep
