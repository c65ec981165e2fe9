#pragma once

#include <string>
#include <vector>

namespace StemPrep {

// All audio streams of one container, decoded to mono float at a common rate.
struct DecodedTrack {
    std::vector<std::vector<float>> stems;  // one waveform per audio stream, in stream order
    int sampleRate = 0;

    size_t stemCount() const { return stems.size(); }
};

/**
 * @brief Decode every audio stream of a (multi-stem) container using FFmpeg
 *
 * Each audio stream becomes one stem, in container stream order; for a
 * Native Instruments .stem.mp4 that is mixture, drums, bass, other, vocals.
 * Streams are resampled to targetSampleRate and their channels averaged to mono.
 *
 * @param filePath Path to the container (MP4 stems, WAV, FLAC, ...)
 * @param targetSampleRate Output sample rate in Hz
 * @return Decoded stems and the sample rate they are at
 * @throws DecodeError if the file cannot be opened, has no audio stream or fails to decode
 */
DecodedTrack decodeStems(const std::string& filePath, int targetSampleRate);

// Restrict FFmpeg's own console output to errors (or everything when verbose).
void configureFfmpegLogging(bool verbose);

} // namespace StemPrep
