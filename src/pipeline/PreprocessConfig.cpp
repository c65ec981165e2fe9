#include "PreprocessConfig.h"
#include "Segmenter.h"

#include <cmath>
#include <stdexcept>

namespace StemPrep {

void validateConfig(const PreprocessConfig& config) {
    if (config.inputRoot.empty()) {
        throw std::invalid_argument("Input root must not be empty");
    }
    if (config.outputRoot.empty()) {
        throw std::invalid_argument("Output root must not be empty");
    }
    if (config.sampleRate <= 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }
    if (!(config.segmentSeconds > 0.0) || !std::isfinite(config.segmentSeconds)) {
        throw std::invalid_argument("Segment length must be a positive number of seconds");
    }
    if (config.hopLength <= 0) {
        throw std::invalid_argument("Hop length must be positive");
    }
    if (config.maxDuration && (!std::isfinite(*config.maxDuration) || *config.maxDuration < 0.0)) {
        throw std::invalid_argument("Duration limit must be a non-negative number of seconds");
    }

    // Rejects windows that round to zero samples
    segmentSampleCount(config.segmentSeconds, config.sampleRate);
}

} // namespace StemPrep
