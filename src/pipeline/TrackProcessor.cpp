#include "TrackProcessor.h"
#include "Segmenter.h"
#include "io/NpyIO.h"
#include "tracing/Tracing.h"
#include "utils/Errors.h"
#include "utils/Logger.h"

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace StemPrep {

namespace {

MfccConfig mfccConfigFor(const PreprocessConfig& config) {
    MfccConfig mfcc;
    mfcc.hopLength = config.hopLength;
    return mfcc;
}

} // namespace

TrackProcessor::TrackProcessor(const PreprocessConfig& config)
    : TrackProcessor(config, decodeStems)
{
}

TrackProcessor::TrackProcessor(const PreprocessConfig& config, StemDecodeFunction decoder)
    : m_config(config)
    , m_decoder(std::move(decoder))
    , m_extractor(mfccConfigFor(config))
{
    validateConfig(m_config);
    if (!m_decoder) {
        throw std::invalid_argument("TrackProcessor requires a stem decoder");
    }
}

std::string TrackProcessor::featureFileName(const fs::path& trackPath, size_t stemIndex, size_t segmentIndex) {
    return trackPath.filename().string() + "_stem" + std::to_string(stemIndex) +
           "_segment" + std::to_string(segmentIndex) + ".npy";
}

TrackReport TrackProcessor::process(const fs::path& trackPath,
                                    const fs::path& outputDir,
                                    std::optional<double> maxDuration) {
    TRACE_SCOPE("track " + trackPath.string());

    TrackReport report;
    report.trackPath = trackPath;

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        throw IOError("Could not create output directory " + outputDir.string() + ": " + ec.message());
    }

    DecodedTrack decoded;
    {
        TRACE_SCOPE("decode");
        decoded = m_decoder(trackPath.string(), m_config.sampleRate);
    }
    if (decoded.sampleRate <= 0) {
        throw DecodeError("Decoder reported an invalid sample rate for " + trackPath.string());
    }

    const int sampleRate = decoded.sampleRate;
    const size_t segmentSamples = segmentSampleCount(m_config.segmentSeconds, sampleRate);

    for (size_t i = 0; i < decoded.stems.size(); ++i) {
        TRACE_SCOPE("stem " + std::to_string(i));
        const std::vector<float>& stem = decoded.stems[i];
        logInfo("STEM " + std::to_string(i) + ": " + trackPath.string());

        const size_t length = effectiveLength(stem.size(), maxDuration, sampleRate);
        const std::vector<SegmentRange> segments = computeSegments(length, segmentSamples);
        logInfo("\tNumber of segments: " + std::to_string(segments.size()));

        for (const SegmentRange& segment : segments) {
            logDebug("\tProcessing feature: " + trackPath.string() + " segment " + std::to_string(segment.index));

            FeatureMatrix mfcc = m_extractor.compute(stem.data() + segment.begin, segment.length(), sampleRate);
            fs::path featureFile = outputDir / featureFileName(trackPath, i, segment.index);
            writeNpy(featureFile, mfcc);
            report.writtenFiles.push_back(featureFile);

            logDebug("\tProcessed feature: " + featureFile.string());
        }
        report.segmentsPerStem.push_back(segments.size());
    }

    return report;
}

} // namespace StemPrep
