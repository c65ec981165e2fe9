#include "MfccExtractor.h"
#include "kiss_fftr.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace StemPrep {

namespace {

const double PI = 3.14159265358979323846;

// Slaney mel scale: linear below 1 kHz, logarithmic above.
constexpr double kMelFSp = 200.0 / 3.0;
constexpr double kMinLogHz = 1000.0;
constexpr double kMinLogMel = kMinLogHz / kMelFSp;

double melLogStep() {
    return std::log(6.4) / 27.0;
}

double hzToMel(double hz) {
    if (hz >= kMinLogHz) {
        return kMinLogMel + std::log(hz / kMinLogHz) / melLogStep();
    }
    return hz / kMelFSp;
}

double melToHz(double mel) {
    if (mel >= kMinLogMel) {
        return kMinLogHz * std::exp(melLogStep() * (mel - kMinLogMel));
    }
    return kMelFSp * mel;
}

// Triangular filters between adjacent mel points, each scaled by
// 2 / (upper edge - lower edge) so that every filter has unit area.
std::vector<float> buildSlaneyFilterbank(int nMels, int nFft, int sampleRate, double fMin, double fMax) {
    const size_t numBins = static_cast<size_t>(nFft / 2 + 1);
    std::vector<float> filters(static_cast<size_t>(nMels) * numBins, 0.0f);

    std::vector<double> fftFreqs(numBins);
    for (size_t k = 0; k < numBins; ++k) {
        fftFreqs[k] = static_cast<double>(k) * sampleRate / nFft;
    }

    const double melMin = hzToMel(fMin);
    const double melMax = hzToMel(fMax);
    std::vector<double> melF(static_cast<size_t>(nMels) + 2);
    for (size_t i = 0; i < melF.size(); ++i) {
        double mel = melMin + (melMax - melMin) * static_cast<double>(i) / static_cast<double>(nMels + 1);
        melF[i] = melToHz(mel);
    }

    for (int m = 0; m < nMels; ++m) {
        const double lowerEdge = melF[m];
        const double center = melF[m + 1];
        const double upperEdge = melF[m + 2];
        const double lowerWidth = center - lowerEdge;
        const double upperWidth = upperEdge - center;
        const double enorm = 2.0 / (upperEdge - lowerEdge);

        for (size_t k = 0; k < numBins; ++k) {
            double lower = (fftFreqs[k] - lowerEdge) / lowerWidth;
            double upper = (upperEdge - fftFreqs[k]) / upperWidth;
            double weight = std::max(0.0, std::min(lower, upper));
            filters[static_cast<size_t>(m) * numBins + k] = static_cast<float>(weight * enorm);
        }
    }
    return filters;
}

} // namespace

// Internal implementation holding FFT plan and buffers
struct MfccExtractor::Impl {
    kiss_fftr_cfg fftCfg = nullptr;
    std::vector<float> frame;
    std::vector<kiss_fft_cpx> spectrum;
    std::vector<float> power;

    // Filterbank cached for the last sample rate seen
    int filterSampleRate = 0;
    std::vector<float> melFilters;

    ~Impl() {
        if (fftCfg) {
            kiss_fftr_free(fftCfg);
        }
    }
};

MfccExtractor::MfccExtractor()
    : MfccExtractor(MfccConfig{})
{
}

MfccExtractor::MfccExtractor(const MfccConfig& config)
    : m_config(config)
    , m_impl(std::make_unique<Impl>())
{
    validateConfig();
    initWindow();
    initDct();

    m_impl->fftCfg = kiss_fftr_alloc(m_config.nFft, 0, nullptr, nullptr);
    if (!m_impl->fftCfg) {
        throw std::runtime_error("Failed to allocate kissfft configuration");
    }
    m_impl->frame.resize(m_config.nFft);
    m_impl->spectrum.resize(m_config.nFft / 2 + 1);
    m_impl->power.resize(m_config.nFft / 2 + 1);
}

MfccExtractor::~MfccExtractor() = default;

MfccExtractor::MfccExtractor(MfccExtractor&& other) noexcept
    : m_config(other.m_config)
    , m_impl(std::move(other.m_impl))
    , m_windowCoeffs(std::move(other.m_windowCoeffs))
    , m_dctBasis(std::move(other.m_dctBasis))
{
}

MfccExtractor& MfccExtractor::operator=(MfccExtractor&& other) noexcept {
    if (this != &other) {
        m_config = other.m_config;
        m_impl = std::move(other.m_impl);
        m_windowCoeffs = std::move(other.m_windowCoeffs);
        m_dctBasis = std::move(other.m_dctBasis);
    }
    return *this;
}

void MfccExtractor::validateConfig() const {
    if (m_config.nFft <= 0 || m_config.nFft % 2 != 0) {
        throw std::invalid_argument("nFft must be a positive even number");
    }
    if (m_config.hopLength <= 0) {
        throw std::invalid_argument("hopLength must be positive");
    }
    if (m_config.nMels <= 0 || m_config.nMfcc <= 0) {
        throw std::invalid_argument("nMels and nMfcc must be positive");
    }
    if (m_config.nMfcc > m_config.nMels) {
        throw std::invalid_argument("nMfcc (" + std::to_string(m_config.nMfcc) +
                                    ") cannot exceed nMels (" + std::to_string(m_config.nMels) + ")");
    }
    if (m_config.fMin < 0.0f) {
        throw std::invalid_argument("fMin must not be negative");
    }
}

void MfccExtractor::requireState() const {
    if (!m_impl) {
        throw std::logic_error("MfccExtractor used after being moved from");
    }
}

void MfccExtractor::initWindow() {
    // Periodic Hann (DFT-even), as used for spectral analysis
    const int N = m_config.nFft;
    m_windowCoeffs.resize(N);
    for (int i = 0; i < N; ++i) {
        m_windowCoeffs[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * PI * i / N));
    }
}

void MfccExtractor::initDct() {
    const int N = m_config.nMels;
    m_dctBasis.resize(static_cast<size_t>(m_config.nMfcc) * N);
    for (int k = 0; k < m_config.nMfcc; ++k) {
        double norm = (k == 0) ? std::sqrt(1.0 / N) : std::sqrt(2.0 / N);
        for (int n = 0; n < N; ++n) {
            m_dctBasis[static_cast<size_t>(k) * N + n] =
                static_cast<float>(norm * std::cos(PI * k * (2.0 * n + 1.0) / (2.0 * N)));
        }
    }
}

const std::vector<float>& MfccExtractor::melFilterbank(int sampleRate) {
    requireState();
    if (sampleRate <= 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }
    if (m_impl->filterSampleRate != sampleRate) {
        const double nyquist = sampleRate / 2.0;
        const double fMax = (m_config.fMax <= 0.0f) ? nyquist : static_cast<double>(m_config.fMax);
        m_impl->melFilters = buildSlaneyFilterbank(m_config.nMels, m_config.nFft, sampleRate,
                                                   m_config.fMin, fMax);
        m_impl->filterSampleRate = sampleRate;
    }
    return m_impl->melFilters;
}

size_t MfccExtractor::frameCount(size_t sampleCount) const {
    const size_t hop = static_cast<size_t>(m_config.hopLength);
    if (m_config.center) {
        return 1 + sampleCount / hop;
    }
    const size_t nFft = static_cast<size_t>(m_config.nFft);
    if (sampleCount < nFft) {
        return 0;
    }
    return 1 + (sampleCount - nFft) / hop;
}

FeatureMatrix MfccExtractor::compute(const std::vector<float>& samples, int sampleRate) {
    return compute(samples.data(), samples.size(), sampleRate);
}

FeatureMatrix MfccExtractor::compute(const float* samples, size_t count, int sampleRate) {
    requireState();
    if (!samples || count == 0) {
        throw std::invalid_argument("Cannot compute MFCC of an empty signal");
    }
    if (sampleRate <= 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }

    const size_t nFft = static_cast<size_t>(m_config.nFft);
    const size_t hop = static_cast<size_t>(m_config.hopLength);
    const size_t numBins = nFft / 2 + 1;
    const size_t nMels = static_cast<size_t>(m_config.nMels);
    const size_t nMfcc = static_cast<size_t>(m_config.nMfcc);

    if (!m_config.center && count < nFft) {
        throw std::invalid_argument("Signal of " + std::to_string(count) +
                                    " samples is shorter than nFft=" + std::to_string(nFft));
    }

    // Zero-pad nFft/2 on each side so frame t is centered on sample t * hop
    std::vector<float> padded;
    const float* signal = samples;
    size_t signalLength = count;
    if (m_config.center) {
        const size_t pad = nFft / 2;
        padded.assign(count + 2 * pad, 0.0f);
        std::copy(samples, samples + count, padded.begin() + pad);
        signal = padded.data();
        signalLength = padded.size();
    }

    const size_t frames = 1 + (signalLength - nFft) / hop;
    const std::vector<float>& filters = melFilterbank(sampleRate);

    // Mel power in dB, laid out mel-major (nMels x frames)
    std::vector<double> melDb(nMels * frames, 0.0);
    double maxDb = -std::numeric_limits<double>::infinity();
    const double amin = 1e-10;

    for (size_t t = 0; t < frames; ++t) {
        const float* frameStart = signal + t * hop;
        for (size_t i = 0; i < nFft; ++i) {
            m_impl->frame[i] = frameStart[i] * m_windowCoeffs[i];
        }

        kiss_fftr(m_impl->fftCfg, m_impl->frame.data(), m_impl->spectrum.data());

        for (size_t k = 0; k < numBins; ++k) {
            float re = m_impl->spectrum[k].r;
            float im = m_impl->spectrum[k].i;
            m_impl->power[k] = re * re + im * im;
        }

        for (size_t m = 0; m < nMels; ++m) {
            const float* filter = filters.data() + m * numBins;
            double sum = 0.0;
            for (size_t k = 0; k < numBins; ++k) {
                sum += static_cast<double>(filter[k]) * m_impl->power[k];
            }
            double db = 10.0 * std::log10(std::max(amin, sum));
            melDb[m * frames + t] = db;
            maxDb = std::max(maxDb, db);
        }
    }

    if (m_config.topDb > 0.0f) {
        const double floorDb = maxDb - m_config.topDb;
        for (double& v : melDb) {
            v = std::max(v, floorDb);
        }
    }

    FeatureMatrix mfcc(nMfcc, frames);
    for (size_t k = 0; k < nMfcc; ++k) {
        const float* basis = m_dctBasis.data() + k * nMels;
        for (size_t t = 0; t < frames; ++t) {
            double sum = 0.0;
            for (size_t m = 0; m < nMels; ++m) {
                sum += basis[m] * melDb[m * frames + t];
            }
            mfcc.at(k, t) = static_cast<float>(sum);
        }
    }

    return mfcc;
}

} // namespace StemPrep
