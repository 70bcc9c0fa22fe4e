#include "audio_io.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mem.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

namespace owah {

namespace {

constexpr int kIoBufferSize = 4096;

std::string avError(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

void initFFmpegOnce() {
    static std::once_flag once;
    std::call_once(once, [] { av_log_set_level(AV_LOG_ERROR); });
}

// The file is handed to FFmpeg as a plain byte stream; FFmpeg never opens the
// path itself, it only sees the name as a probing hint.
struct FileSource {
    std::ifstream stream;
    int64_t size = 0;
};

int readPacket(void* opaque, uint8_t* buf, int buf_size) {
    auto* src = static_cast<FileSource*>(opaque);
    src->stream.read(reinterpret_cast<char*>(buf), buf_size);
    std::streamsize n = src->stream.gcount();
    if (n <= 0) return src->stream.bad() ? AVERROR(EIO) : AVERROR_EOF;
    return (int)n;
}

int64_t seekPacket(void* opaque, int64_t offset, int whence) {
    auto* src = static_cast<FileSource*>(opaque);
    whence &= ~AVSEEK_FORCE;
    if (whence == AVSEEK_SIZE) return src->size;

    std::ios_base::seekdir dir;
    switch (whence) {
        case SEEK_SET: dir = std::ios::beg; break;
        case SEEK_CUR: dir = std::ios::cur; break;
        case SEEK_END: dir = std::ios::end; break;
        default: return AVERROR(EINVAL);
    }
    src->stream.clear();
    src->stream.seekg(offset, dir);
    if (!src->stream) return AVERROR(EIO);
    return (int64_t)src->stream.tellg();
}

struct IoContextDeleter {
    void operator()(AVIOContext* ctx) const {
        av_freep(&ctx->buffer);
        avio_context_free(&ctx);
    }
};
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

class BiteDecoder {
public:
    BiteDecoder(const std::string& path, const DecodeOptions& options)
        : path(path), options(options) {}

    ~BiteDecoder() { av_channel_layout_uninit(&out_layout); }

    Status open();
    Status decode(int duration_ms, ClipPtr& out);

private:
    Status receiveFrames();
    Status ensureResampler(const AVFrame* frame);
    Status appendFrame(const AVFrame* frame);
    Status flushResampler();
    void appendConverted(int frames);
    bool full() const { return frames_decoded >= target_frames; }

    std::string path;
    DecodeOptions options;

    // Declaration order matters: the format context must close before the
    // I/O context and the file it reads from go away.
    FileSource source;
    std::unique_ptr<AVIOContext, IoContextDeleter> io;
    std::unique_ptr<AVFormatContext, FormatContextDeleter> format;
    std::unique_ptr<AVCodecContext, CodecContextDeleter> codec;
    std::unique_ptr<SwrContext, SwrContextDeleter> swr;

    int stream_index = -1;
    int sample_rate = 0;
    int source_channels = 0;
    int out_channels = 0;
    AVChannelLayout out_layout = {};

    // Input format the resampler was configured for.
    int swr_format = -1;
    int swr_rate = 0;
    int swr_channels = 0;

    int64_t target_frames = 0;
    int64_t frames_decoded = 0;
    std::vector<float> samples;
    std::vector<float> scratch;
};

Status BiteDecoder::open() {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return Status::Error(ErrorCode::OpenError, "failed to open selected file: " + path + " is a directory");
    }
    source.stream.open(path, std::ios::binary | std::ios::ate);
    if (!source.stream) {
        return Status::Error(ErrorCode::OpenError, "failed to open selected file: " + path);
    }
    source.size = (int64_t)source.stream.tellg();
    source.stream.seekg(0, std::ios::beg);

    auto* io_buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!io_buffer) {
        return Status::Error(ErrorCode::DecodeError, "out of memory allocating I/O buffer");
    }
    AVIOContext* raw_io = avio_alloc_context(io_buffer, kIoBufferSize, 0, &source,
                                             readPacket, nullptr, seekPacket);
    if (!raw_io) {
        av_free(io_buffer);
        return Status::Error(ErrorCode::DecodeError, "out of memory allocating I/O context");
    }
    io.reset(raw_io);

    const AVInputFormat* input_format = nullptr;
    int err = av_probe_input_buffer(io.get(), &input_format, path.c_str(), nullptr, 0, 0);
    if (err < 0 || !input_format) {
        return Status::Error(ErrorCode::ProbeError, "unrecognized media format: " + avError(err));
    }

    AVFormatContext* raw_format = avformat_alloc_context();
    if (!raw_format) {
        return Status::Error(ErrorCode::DecodeError, "out of memory allocating format context");
    }
    raw_format->pb = io.get();
    raw_format->flags |= AVFMT_FLAG_CUSTOM_IO;
    // On failure avformat_open_input frees raw_format itself.
    err = avformat_open_input(&raw_format, path.c_str(), input_format, nullptr);
    if (err < 0) {
        return Status::Error(ErrorCode::ProbeError, "failed to open container: " + avError(err));
    }
    format.reset(raw_format);

    err = avformat_find_stream_info(format.get(), nullptr);
    if (err < 0) {
        return Status::Error(ErrorCode::ProbeError, "failed to read stream info: " + avError(err));
    }

    stream_index = av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_index < 0) {
        return Status::Error(ErrorCode::ProbeError, "no playable audio track found");
    }
    const AVCodecParameters* par = format->streams[stream_index]->codecpar;

    if (par->sample_rate <= 0) {
        return Status::Error(ErrorCode::MissingFormatInfo, "audio file missing sample rate");
    }
    if (par->ch_layout.nb_channels <= 0) {
        return Status::Error(ErrorCode::MissingFormatInfo, "audio file missing channel information");
    }
    sample_rate = par->sample_rate;
    source_channels = par->ch_layout.nb_channels;
    out_channels = options.channel_mode == ChannelMode::Mono ? 1 : source_channels;
    av_channel_layout_default(&out_layout, source_channels);

    const AVCodec* decoder = avcodec_find_decoder(par->codec_id);
    if (!decoder) {
        return Status::Error(ErrorCode::ProbeError,
                             std::string("no decoder for codec ") + avcodec_get_name(par->codec_id));
    }
    codec.reset(avcodec_alloc_context3(decoder));
    if (!codec) {
        return Status::Error(ErrorCode::DecodeError, "out of memory allocating codec context");
    }
    err = avcodec_parameters_to_context(codec.get(), par);
    if (err < 0) {
        return Status::Error(ErrorCode::DecodeError, "invalid codec parameters: " + avError(err));
    }
    err = avcodec_open2(codec.get(), decoder, nullptr);
    if (err < 0) {
        return Status::Error(ErrorCode::DecodeError, "failed to open decoder: " + avError(err));
    }
    return Status::Ok();
}

Status BiteDecoder::decode(int duration_ms, ClipPtr& out) {
    target_frames = targetFrames(sample_rate, duration_ms);
    samples.reserve((size_t)std::max<int64_t>(target_frames, 0) * out_channels);

    std::unique_ptr<AVPacket, PacketDeleter> packet(av_packet_alloc());
    if (!packet) {
        return Status::Error(ErrorCode::DecodeError, "out of memory allocating packet");
    }

    bool end_of_stream = false;
    while (!full() && !end_of_stream) {
        AVPacket* to_send = nullptr;
        int err = av_read_frame(format.get(), packet.get());
        if (err == AVERROR_EOF) {
            // A null packet flushes codecs with delay so they hand over their last frames.
            end_of_stream = true;
        } else if (err < 0) {
            return Status::Error(ErrorCode::DecodeError, "failed to read packet: " + avError(err));
        } else if (packet->stream_index != stream_index) {
            av_packet_unref(packet.get());
            continue;
        } else {
            to_send = packet.get();
        }

        err = avcodec_send_packet(codec.get(), to_send);
        if (err == AVERROR(EAGAIN)) {
            // Output queue is full; drain it and hand the same packet over again.
            Status status = receiveFrames();
            if (!status.ok()) return status;
            if (!full()) err = avcodec_send_packet(codec.get(), to_send);
        }
        if (to_send) av_packet_unref(to_send);

        if (err == AVERROR_INVALIDDATA) continue; // corrupt packet, skip it
        if (err < 0 && err != AVERROR(EAGAIN) && err != AVERROR_EOF) {
            return Status::Error(ErrorCode::DecodeError, "failed to decode packet: " + avError(err));
        }

        Status status = receiveFrames();
        if (!status.ok()) return status;
    }

    Status status = flushResampler();
    if (!status.ok()) return status;

    if (frames_decoded == 0) {
        return Status::Error(ErrorCode::EmptyDecodeResult, "failed to decode audio samples from selected file");
    }

    fitToFrames(samples, target_frames, out_channels);

    auto clip = std::make_shared<SampleClip>();
    clip->sample_rate = sample_rate;
    clip->num_channels = out_channels;
    clip->samples = std::move(samples);
    clip->path = path;
    out = std::move(clip);
    return Status::Ok();
}

Status BiteDecoder::receiveFrames() {
    std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
    if (!frame) {
        return Status::Error(ErrorCode::DecodeError, "out of memory allocating frame");
    }
    while (!full()) {
        int err = avcodec_receive_frame(codec.get(), frame.get());
        if (err == AVERROR(EAGAIN) || err == AVERROR_EOF) break;
        if (err == AVERROR_INVALIDDATA) break;
        if (err < 0) {
            return Status::Error(ErrorCode::DecodeError, "failed to decode frame: " + avError(err));
        }
        Status status = appendFrame(frame.get());
        av_frame_unref(frame.get());
        if (!status.ok()) return status;
    }
    return Status::Ok();
}

Status BiteDecoder::ensureResampler(const AVFrame* frame) {
    int channels = frame->ch_layout.nb_channels;
    if (swr && swr_format == frame->format && swr_rate == frame->sample_rate && swr_channels == channels) {
        return Status::Ok();
    }
    Status status = flushResampler();
    if (!status.ok()) return status;

    AVChannelLayout in_layout = {};
    if (channels > 0 && frame->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_copy(&in_layout, &frame->ch_layout);
    } else {
        av_channel_layout_default(&in_layout, channels > 0 ? channels : source_channels);
    }
    int in_rate = frame->sample_rate > 0 ? frame->sample_rate : sample_rate;

    // Everything is converted to interleaved float at the stream's rate and
    // channel count, so the clip matches the metadata it was sized from.
    SwrContext* raw = nullptr;
    int err = swr_alloc_set_opts2(&raw, &out_layout, AV_SAMPLE_FMT_FLT, sample_rate,
                                  &in_layout, (AVSampleFormat)frame->format, in_rate, 0, nullptr);
    av_channel_layout_uninit(&in_layout);
    if (err >= 0) err = swr_init(raw);
    if (err < 0) {
        swr_free(&raw);
        return Status::Error(ErrorCode::DecodeError, "failed to set up sample conversion: " + avError(err));
    }
    swr.reset(raw);
    swr_format = frame->format;
    swr_rate = frame->sample_rate;
    swr_channels = channels;
    return Status::Ok();
}

Status BiteDecoder::appendFrame(const AVFrame* frame) {
    Status status = ensureResampler(frame);
    if (!status.ok()) return status;

    int max_out = swr_get_out_samples(swr.get(), frame->nb_samples);
    if (max_out <= 0) return Status::Ok();
    scratch.resize((size_t)max_out * source_channels);

    uint8_t* dst[1] = {reinterpret_cast<uint8_t*>(scratch.data())};
    int got = swr_convert(swr.get(), dst, max_out,
                          const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
    if (got < 0) {
        return Status::Error(ErrorCode::DecodeError, "sample conversion failed: " + avError(got));
    }

    appendConverted(got);
    return Status::Ok();
}

// swresample holds back a few frames for its filter; drain them so the tail of
// the stream is not lost when the input changes or ends.
Status BiteDecoder::flushResampler() {
    while (swr && !full()) {
        int max_out = swr_get_out_samples(swr.get(), 0);
        if (max_out <= 0) break;
        scratch.resize((size_t)max_out * source_channels);

        uint8_t* dst[1] = {reinterpret_cast<uint8_t*>(scratch.data())};
        int got = swr_convert(swr.get(), dst, max_out, nullptr, 0);
        if (got < 0) {
            return Status::Error(ErrorCode::DecodeError, "sample conversion flush failed: " + avError(got));
        }
        if (got == 0) break;
        appendConverted(got);
    }
    return Status::Ok();
}

// Moves the first `frames` converted frames from scratch into the clip,
// downmixing when mono output was requested.
void BiteDecoder::appendConverted(int frames) {
    int64_t take = std::min<int64_t>(frames, target_frames - frames_decoded);
    if (out_channels == source_channels) {
        samples.insert(samples.end(), scratch.begin(), scratch.begin() + take * source_channels);
    } else {
        for (int64_t f = 0; f < take; ++f) {
            float sum = 0.0f;
            for (int c = 0; c < source_channels; ++c) {
                sum += scratch[f * source_channels + c];
            }
            samples.push_back(sum / source_channels);
        }
    }
    frames_decoded += take;
}

} // namespace

Status decodeBite(const std::string& path, int duration_ms,
                  const DecodeOptions& options, ClipPtr& out) {
    initFFmpegOnce();

    BiteDecoder decoder(path, options);
    Status status = decoder.open();
    if (status.ok()) status = decoder.decode(duration_ms, out);

    if (status.ok()) {
        std::cerr << "Decoded bite: " << path << " (" << out->sample_rate << " Hz, "
                  << out->num_channels << " ch, " << out->frames() << " frames)" << std::endl;
    } else {
        std::cerr << "Decode failed [" << errorCodeName(status.code) << "]: "
                  << status.message << std::endl;
    }
    return status;
}

} // namespace owah
