#include "StemDecoder.h"
#include "utils/Errors.h"
#include "utils/Logger.h"

#include <memory>
#include <string>

// FFmpeg includes
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

namespace StemPrep {

namespace {

struct FormatContextDeleter {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const { swr_free(&ctx); }
};
struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;

std::string ffmpegError(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

// Decoder + resampler for one audio stream of the container.
struct StreamDecoder {
    int streamIndex = -1;
    CodecContextPtr codecCtx;
    SwrContextPtr swrCtx;
    int channels = 0;
    std::vector<float> buffer;  // interleaved resampler output, reused
    std::vector<float> samples; // mono output
};

// Average interleaved channels of `frames` resampled frames into the stem.
void appendMono(StreamDecoder& dec, int frames) {
    const int ch = dec.channels;
    for (int i = 0; i < frames; ++i) {
        const float* frame = dec.buffer.data() + static_cast<size_t>(i) * ch;
        float sum = 0.0f;
        for (int c = 0; c < ch; ++c) {
            sum += frame[c];
        }
        dec.samples.push_back(sum / static_cast<float>(ch));
    }
}

void resampleFrame(StreamDecoder& dec, const AVFrame* frame, const std::string& filePath) {
    const int inSamples = frame ? frame->nb_samples : 0;
    int outCapacity = swr_get_out_samples(dec.swrCtx.get(), inSamples);
    if (outCapacity < 0) {
        throw DecodeError("Resampler failure in " + filePath + ": " + ffmpegError(outCapacity));
    }
    if (outCapacity == 0) {
        return;
    }

    dec.buffer.resize(static_cast<size_t>(outCapacity) * dec.channels);
    uint8_t* outData = reinterpret_cast<uint8_t*>(dec.buffer.data());
    const uint8_t** inData = frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr;

    int converted = swr_convert(dec.swrCtx.get(), &outData, outCapacity, inData, inSamples);
    if (converted < 0) {
        throw DecodeError("Resampling failed in " + filePath + ": " + ffmpegError(converted));
    }
    appendMono(dec, converted);
}

void receiveFrames(StreamDecoder& dec, AVFrame* frame, const std::string& filePath) {
    while (true) {
        int ret = avcodec_receive_frame(dec.codecCtx.get(), frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return;
        }
        if (ret < 0) {
            throw DecodeError("Error decoding audio stream " + std::to_string(dec.streamIndex) +
                              " of " + filePath + ": " + ffmpegError(ret));
        }
        resampleFrame(dec, frame, filePath);
        av_frame_unref(frame);
    }
}

StreamDecoder openStream(AVFormatContext* formatCtx, int streamIndex, int targetSampleRate,
                         const std::string& filePath) {
    StreamDecoder dec;
    dec.streamIndex = streamIndex;

    AVCodecParameters* codecParams = formatCtx->streams[streamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(codecParams->codec_id);
    if (!codec) {
        throw DecodeError("No decoder for audio stream " + std::to_string(streamIndex) + " of " + filePath);
    }

    dec.codecCtx.reset(avcodec_alloc_context3(codec));
    if (!dec.codecCtx) {
        throw DecodeError("Could not allocate codec context for " + filePath);
    }

    int ret = avcodec_parameters_to_context(dec.codecCtx.get(), codecParams);
    if (ret < 0) {
        throw DecodeError("Could not copy codec parameters for " + filePath + ": " + ffmpegError(ret));
    }

    ret = avcodec_open2(dec.codecCtx.get(), codec, nullptr);
    if (ret < 0) {
        throw DecodeError("Could not open codec for " + filePath + ": " + ffmpegError(ret));
    }

    if (dec.codecCtx->sample_rate <= 0) {
        throw DecodeError("Audio stream " + std::to_string(streamIndex) + " of " + filePath +
                          " has no sample rate");
    }

    dec.channels = dec.codecCtx->ch_layout.nb_channels > 0 ? dec.codecCtx->ch_layout.nb_channels : 2;

    // Keep the stream's channel count; channels are averaged after resampling
    AVChannelLayout inLayout = {};
    AVChannelLayout outLayout = {};
    if (dec.codecCtx->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC && dec.codecCtx->ch_layout.nb_channels > 0) {
        ret = av_channel_layout_copy(&inLayout, &dec.codecCtx->ch_layout);
        if (ret < 0) {
            throw DecodeError("Could not read channel layout of " + filePath + ": " + ffmpegError(ret));
        }
    } else {
        av_channel_layout_default(&inLayout, dec.channels);
    }
    av_channel_layout_default(&outLayout, dec.channels);

    SwrContext* swr = swr_alloc();
    if (!swr) {
        av_channel_layout_uninit(&inLayout);
        av_channel_layout_uninit(&outLayout);
        throw DecodeError("Could not allocate resampler for " + filePath);
    }
    dec.swrCtx.reset(swr);

    av_opt_set_chlayout(swr, "in_chlayout", &inLayout, 0);
    av_opt_set_int(swr, "in_sample_rate", dec.codecCtx->sample_rate, 0);
    av_opt_set_sample_fmt(swr, "in_sample_fmt", dec.codecCtx->sample_fmt, 0);

    av_opt_set_chlayout(swr, "out_chlayout", &outLayout, 0);
    av_opt_set_int(swr, "out_sample_rate", targetSampleRate, 0);
    av_opt_set_sample_fmt(swr, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);

    av_channel_layout_uninit(&inLayout);
    av_channel_layout_uninit(&outLayout);

    ret = swr_init(swr);
    if (ret < 0) {
        throw DecodeError("Could not initialize resampler for " + filePath + ": " + ffmpegError(ret));
    }

    // Reserve capacity to avoid reallocations
    AVStream* stream = formatCtx->streams[streamIndex];
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        double seconds = stream->duration * av_q2d(stream->time_base);
        if (seconds > 0.0) {
            dec.samples.reserve(static_cast<size_t>(seconds * targetSampleRate) + 1);
        }
    }

    return dec;
}

} // namespace

void configureFfmpegLogging(bool verbose) {
    av_log_set_level(verbose ? AV_LOG_INFO : AV_LOG_ERROR);
}

DecodedTrack decodeStems(const std::string& filePath, int targetSampleRate) {
    if (targetSampleRate <= 0) {
        throw DecodeError("Invalid target sample rate " + std::to_string(targetSampleRate) + " for " + filePath);
    }

    AVFormatContext* rawFormatCtx = nullptr;
    int ret = avformat_open_input(&rawFormatCtx, filePath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw DecodeError("Could not open " + filePath + ": " + ffmpegError(ret));
    }
    FormatContextPtr formatCtx(rawFormatCtx);

    ret = avformat_find_stream_info(formatCtx.get(), nullptr);
    if (ret < 0) {
        throw DecodeError("Could not find stream information in " + filePath + ": " + ffmpegError(ret));
    }

    // Every audio stream is a stem, in container order
    std::vector<StreamDecoder> decoders;
    std::vector<int> decoderForStream(formatCtx->nb_streams, -1);
    for (unsigned int i = 0; i < formatCtx->nb_streams; i++) {
        if (formatCtx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
            decoderForStream[i] = static_cast<int>(decoders.size());
            decoders.push_back(openStream(formatCtx.get(), static_cast<int>(i), targetSampleRate, filePath));
        } else {
            formatCtx->streams[i]->discard = AVDISCARD_ALL;
        }
    }

    if (decoders.empty()) {
        throw DecodeError("No audio streams found in " + filePath);
    }

    PacketPtr packet(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!packet || !frame) {
        throw DecodeError("Could not allocate packet/frame for " + filePath);
    }

    while (true) {
        ret = av_read_frame(formatCtx.get(), packet.get());
        if (ret == AVERROR_EOF) {
            break;
        }
        if (ret < 0) {
            throw DecodeError("Error reading " + filePath + ": " + ffmpegError(ret));
        }

        const int decoderIndex = (packet->stream_index >= 0 &&
                                  static_cast<size_t>(packet->stream_index) < decoderForStream.size())
                                     ? decoderForStream[packet->stream_index]
                                     : -1;
        if (decoderIndex >= 0) {
            StreamDecoder& dec = decoders[decoderIndex];
            ret = avcodec_send_packet(dec.codecCtx.get(), packet.get());
            if (ret == AVERROR(EAGAIN)) {
                // Decoder output is full; drain it and resubmit
                receiveFrames(dec, frame.get(), filePath);
                ret = avcodec_send_packet(dec.codecCtx.get(), packet.get());
            }
            if (ret == AVERROR_INVALIDDATA) {
                logWarn("Skipping corrupt packet in stream " + std::to_string(dec.streamIndex) + " of " + filePath);
            } else if (ret < 0) {
                av_packet_unref(packet.get());
                throw DecodeError("Error submitting packet from " + filePath + ": " + ffmpegError(ret));
            } else {
                receiveFrames(dec, frame.get(), filePath);
            }
        }
        av_packet_unref(packet.get());
    }

    DecodedTrack result;
    result.sampleRate = targetSampleRate;
    result.stems.reserve(decoders.size());

    for (StreamDecoder& dec : decoders) {
        // Flush decoder
        ret = avcodec_send_packet(dec.codecCtx.get(), nullptr);
        if (ret < 0 && ret != AVERROR_EOF) {
            throw DecodeError("Error flushing decoder for " + filePath + ": " + ffmpegError(ret));
        }
        receiveFrames(dec, frame.get(), filePath);

        // Drain samples buffered inside the resampler
        while (swr_get_out_samples(dec.swrCtx.get(), 0) > 0) {
            const size_t before = dec.samples.size();
            resampleFrame(dec, nullptr, filePath);
            if (dec.samples.size() == before) {
                break;
            }
        }

        result.stems.push_back(std::move(dec.samples));
    }

    return result;
}

} // namespace StemPrep
