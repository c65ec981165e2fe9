#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace StemPrep {
namespace testing {

// Unique scratch directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        auto now_ns = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 (prefix + "_" + std::to_string(now_ns) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec); // best-effort cleanup
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

// Generate sine wave at given frequency
inline std::vector<float> makeSine(float freq, int sampleRate, size_t N, float amplitude = 0.5f) {
    std::vector<float> out(N);
    const double TWOPI = 2.0 * 3.14159265358979323846;
    for (size_t i = 0; i < N; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(TWOPI * freq * (static_cast<double>(i) / sampleRate)));
    }
    return out;
}

inline void touchFile(const std::filesystem::path& path, const std::string& contents = "") {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::vector<char> readBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// 16-bit PCM WAV with interleaved channels (frames = samples.size() / channels)
inline void writePcm16Wav(const std::filesystem::path& path, const std::vector<float>& interleaved,
                          int sampleRate, uint16_t channels) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return;
    }

    auto put16 = [&out](uint16_t v) {
        const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>(v >> 8)};
        out.write(b, 2);
    };
    auto put32 = [&out](uint32_t v) {
        const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                           static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
        out.write(b, 4);
    };

    const uint16_t bitsPerSample = 16;
    const uint32_t dataSize = static_cast<uint32_t>(interleaved.size() * sizeof(int16_t));

    out.write("RIFF", 4);
    put32(36 + dataSize);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put32(16);
    put16(1); // PCM
    put16(channels);
    put32(static_cast<uint32_t>(sampleRate));
    put32(static_cast<uint32_t>(sampleRate) * channels * (bitsPerSample / 8));
    put16(static_cast<uint16_t>(channels * (bitsPerSample / 8)));
    put16(bitsPerSample);
    out.write("data", 4);
    put32(dataSize);

    for (float sample : interleaved) {
        const float clamped = std::max(-1.0f, std::min(1.0f, sample));
        const int16_t pcm = static_cast<int16_t>(std::lrint(clamped * 32767.0f));
        put16(static_cast<uint16_t>(pcm));
    }
}

} // namespace testing
} // namespace StemPrep
