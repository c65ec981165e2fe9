#pragma once

#include <filesystem>
#include <optional>

namespace StemPrep {

// Settings for a preprocessing run. Defaults reproduce the fixed layout
// data/raw -> data/processed, 22050 Hz, 5 s segments, hop 512, full stems.
struct PreprocessConfig {
    std::filesystem::path inputRoot = std::filesystem::path("data") / "raw";
    std::filesystem::path outputRoot = std::filesystem::path("data") / "processed";
    int sampleRate = 22050;              // decode target rate (Hz)
    double segmentSeconds = 5.0;         // segment window
    int hopLength = 512;                 // MFCC frame hop (samples)
    std::optional<double> maxDuration;   // seconds of each stem to process; none = full stem
    bool continueOnError = false;        // log and skip failing tracks instead of aborting
};

// Throws std::invalid_argument describing the first invalid field.
void validateConfig(const PreprocessConfig& config);

} // namespace StemPrep
