#pragma once

#include "FeatureMatrix.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace StemPrep {

// Configuration for MFCC extraction. Defaults reproduce librosa.feature.mfcc:
// periodic Hann window, centered zero-padded frames, power spectrogram,
// Slaney mel filterbank (area normalized), dB scaling with an 80 dB floor,
// orthonormal DCT-II.
struct MfccConfig {
    int nMfcc = 20;
    int nFft = 2048;
    int hopLength = 512;
    int nMels = 128;
    float fMin = 0.0f;
    float fMax = 0.0f;    // <= 0 means sampleRate / 2
    bool center = true;   // pad nFft/2 zeros on both sides
    float topDb = 80.0f;  // <= 0 disables the dynamic range floor
};

// Computes a cepstral feature matrix (nMfcc x frames) from mono float samples
// using a KissFFT real transform.
class MfccExtractor {
public:
    MfccExtractor();
    explicit MfccExtractor(const MfccConfig& config);
    ~MfccExtractor();

    // Non-copyable (owns FFT state)
    MfccExtractor(const MfccExtractor&) = delete;
    MfccExtractor& operator=(const MfccExtractor&) = delete;

    // Movable; a moved-from extractor throws std::logic_error from compute()
    MfccExtractor(MfccExtractor&& other) noexcept;
    MfccExtractor& operator=(MfccExtractor&& other) noexcept;

    // Throws std::invalid_argument for empty input, a non-positive sample rate,
    // or (with center disabled) input shorter than nFft.
    FeatureMatrix compute(const float* samples, size_t count, int sampleRate);
    FeatureMatrix compute(const std::vector<float>& samples, int sampleRate);

    // Frames produced for an input of sampleCount samples.
    size_t frameCount(size_t sampleCount) const;

    const MfccConfig& getConfig() const { return m_config; }

    // Mel filterbank (nMels x (nFft/2 + 1), row-major) used for the given rate.
    const std::vector<float>& melFilterbank(int sampleRate);

private:
    MfccConfig m_config;

    // Internal FFT state
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    // Periodic Hann window of length nFft
    std::vector<float> m_windowCoeffs;

    // Orthonormal DCT-II basis (nMfcc x nMels)
    std::vector<float> m_dctBasis;

    void validateConfig() const;
    void requireState() const;
    void initWindow();
    void initDct();
};

} // namespace StemPrep
