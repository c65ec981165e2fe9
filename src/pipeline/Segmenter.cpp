#include "Segmenter.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace StemPrep {

size_t segmentSampleCount(double segmentSeconds, int sampleRate) {
    if (!(segmentSeconds > 0.0) || sampleRate <= 0) {
        throw std::invalid_argument("Segment length and sample rate must be positive");
    }
    const double exact = segmentSeconds * sampleRate;
    if (!std::isfinite(exact) || exact >= static_cast<double>(std::numeric_limits<long long>::max())) {
        throw std::invalid_argument("Segment length of " + std::to_string(segmentSeconds) +
                                    "s is too long to count in samples at " + std::to_string(sampleRate) + " Hz");
    }
    long long samples = std::llround(exact);
    if (samples <= 0) {
        throw std::invalid_argument("Segment length of " + std::to_string(segmentSeconds) +
                                    "s is shorter than one sample at " + std::to_string(sampleRate) + " Hz");
    }
    return static_cast<size_t>(samples);
}

size_t effectiveLength(size_t stemLength, std::optional<double> maxDurationSeconds, int sampleRate) {
    if (!maxDurationSeconds) {
        return stemLength;
    }
    if (*maxDurationSeconds < 0.0 || std::isnan(*maxDurationSeconds)) {
        throw std::invalid_argument("Duration limit must not be negative");
    }
    if (sampleRate <= 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }

    double limit = std::round(*maxDurationSeconds * sampleRate);
    if (limit >= static_cast<double>(stemLength)) {
        return stemLength;
    }
    return static_cast<size_t>(limit);
}

size_t segmentCount(size_t length, size_t segmentSamples) {
    if (segmentSamples == 0) {
        throw std::invalid_argument("Segment sample count must be positive");
    }
    return length / segmentSamples + (length % segmentSamples != 0 ? 1 : 0);
}

std::vector<SegmentRange> computeSegments(size_t length, size_t segmentSamples) {
    std::vector<SegmentRange> segments;
    const size_t count = segmentCount(length, segmentSamples);
    segments.reserve(count);

    for (size_t j = 0; j < count; ++j) {
        size_t begin = j * segmentSamples;
        size_t end = std::min(begin + segmentSamples, length);
        segments.push_back({j, begin, end});
    }
    return segments;
}

} // namespace StemPrep
