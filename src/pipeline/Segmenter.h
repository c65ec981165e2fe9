#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace StemPrep {

// Half-open sample range [begin, end) of one segment within a stem.
struct SegmentRange {
    size_t index;
    size_t begin;
    size_t end;

    size_t length() const { return end - begin; }
};

// Number of samples in one segment window.
// Throws std::invalid_argument if the window rounds to zero samples.
size_t segmentSampleCount(double segmentSeconds, int sampleRate);

// Number of samples of a stem that are processed: the full stem, or the first
// round(maxDurationSeconds * sampleRate) samples when a duration limit is given.
// Throws std::invalid_argument for a negative limit.
size_t effectiveLength(size_t stemLength, std::optional<double> maxDurationSeconds, int sampleRate);

// ceil(length / segmentSamples)
size_t segmentCount(size_t length, size_t segmentSamples);

// Split [0, length) into consecutive windows of segmentSamples.
// The last window is truncated to length, never padded or dropped.
std::vector<SegmentRange> computeSegments(size_t length, size_t segmentSamples);

} // namespace StemPrep
