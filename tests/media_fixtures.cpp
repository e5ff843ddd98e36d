#include "media_fixtures.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
}

namespace vid2mp3 {
namespace testing_support {

namespace {

constexpr int kSampleRate = 44100;
constexpr int kFrameRate = 25;
constexpr int kVideoSize = 64;
constexpr double kPi = 3.14159265358979323846;

void check(int ret, const std::string& what) {
    if (ret < 0) {
        char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(ret, buf, sizeof(buf));
        throw std::runtime_error(what + ": " + buf);
    }
}

struct OutputDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&ctx->pb);
        }
        avformat_free_context(ctx);
    }
};

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};

struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};

using OutputPtr = std::unique_ptr<AVFormatContext, OutputDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

struct Track {
    CodecContextPtr ctx;
    AVStream* stream = nullptr;
};

void add_stream(AVFormatContext* oc, Track& track, const AVCodec* codec) {
    if (oc->oformat->flags & AVFMT_GLOBALHEADER) {
        track.ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    check(avcodec_open2(track.ctx.get(), codec, nullptr),
          std::string("Cannot open ") + codec->name + " encoder");

    track.stream = avformat_new_stream(oc, nullptr);
    if (!track.stream) throw std::runtime_error("Cannot create fixture stream");
    check(avcodec_parameters_from_context(track.stream->codecpar, track.ctx.get()),
          "Cannot copy encoder parameters");
    track.stream->time_base = track.ctx->time_base;
}

Track add_audio(AVFormatContext* oc) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!codec) throw std::runtime_error("AAC encoder not available");

    Track track;
    track.ctx.reset(avcodec_alloc_context3(codec));
    if (!track.ctx) throw std::runtime_error("Out of memory allocating AAC encoder");
    track.ctx->sample_fmt = AV_SAMPLE_FMT_FLTP;
    track.ctx->sample_rate = kSampleRate;
    av_channel_layout_default(&track.ctx->ch_layout, 1);
    track.ctx->bit_rate = 64000;
    track.ctx->time_base = AVRational{1, kSampleRate};

    add_stream(oc, track, codec);
    return track;
}

Track add_video(AVFormatContext* oc) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    if (!codec) throw std::runtime_error("MPEG-4 encoder not available");

    Track track;
    track.ctx.reset(avcodec_alloc_context3(codec));
    if (!track.ctx) throw std::runtime_error("Out of memory allocating MPEG-4 encoder");
    track.ctx->width = kVideoSize;
    track.ctx->height = kVideoSize;
    track.ctx->pix_fmt = AV_PIX_FMT_YUV420P;
    track.ctx->time_base = AVRational{1, kFrameRate};
    track.ctx->framerate = AVRational{kFrameRate, 1};
    track.ctx->gop_size = 12;
    track.ctx->bit_rate = 100000;

    add_stream(oc, track, codec);
    return track;
}

void encode(AVFormatContext* oc, Track& track, const AVFrame* frame) {
    check(avcodec_send_frame(track.ctx.get(), frame), "Cannot encode fixture frame");

    PacketPtr pkt(av_packet_alloc());
    if (!pkt) throw std::runtime_error("Out of memory allocating packet");
    while (true) {
        int ret = avcodec_receive_packet(track.ctx.get(), pkt.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return;
        check(ret, "Cannot encode fixture frame");

        av_packet_rescale_ts(pkt.get(), track.ctx->time_base, track.stream->time_base);
        pkt->stream_index = track.stream->index;
        check(av_interleaved_write_frame(oc, pkt.get()), "Cannot write fixture packet");
    }
}

void write_tone(AVFormatContext* oc, Track& track, double seconds) {
    const int frame_size = track.ctx->frame_size > 0 ? track.ctx->frame_size : 1024;
    const int64_t total = std::max<int64_t>(frame_size, std::llround(seconds * kSampleRate));
    const double step = 2.0 * kPi * 440.0 / kSampleRate;

    for (int64_t pts = 0; pts < total; pts += frame_size) {
        FramePtr frame(av_frame_alloc());
        if (!frame) throw std::runtime_error("Out of memory allocating frame");
        frame->format = track.ctx->sample_fmt;
        frame->sample_rate = kSampleRate;
        frame->nb_samples = frame_size;
        check(av_channel_layout_copy(&frame->ch_layout, &track.ctx->ch_layout),
              "Cannot copy channel layout");
        check(av_frame_get_buffer(frame.get(), 0), "Cannot allocate audio frame");

        auto* samples = reinterpret_cast<float*>(frame->data[0]);
        for (int i = 0; i < frame_size; ++i) {
            samples[i] = 0.25f * static_cast<float>(std::sin(step * static_cast<double>(pts + i)));
        }
        frame->pts = pts;
        encode(oc, track, frame.get());
    }
    encode(oc, track, nullptr);
}

void write_frames(AVFormatContext* oc, Track& track, double seconds) {
    const int count = std::max(1, static_cast<int>(seconds * kFrameRate));

    for (int n = 0; n < count; ++n) {
        FramePtr frame(av_frame_alloc());
        if (!frame) throw std::runtime_error("Out of memory allocating frame");
        frame->format = track.ctx->pix_fmt;
        frame->width = kVideoSize;
        frame->height = kVideoSize;
        check(av_frame_get_buffer(frame.get(), 0), "Cannot allocate video frame");

        for (int y = 0; y < kVideoSize; ++y) {
            for (int x = 0; x < kVideoSize; ++x) {
                frame->data[0][y * frame->linesize[0] + x] = static_cast<uint8_t>(x + y + n * 3);
            }
        }
        for (int y = 0; y < kVideoSize / 2; ++y) {
            for (int x = 0; x < kVideoSize / 2; ++x) {
                frame->data[1][y * frame->linesize[1] + x] = 128;
                frame->data[2][y * frame->linesize[2] + x] = 128;
            }
        }
        frame->pts = n;
        encode(oc, track, frame.get());
    }
    encode(oc, track, nullptr);
}

} // namespace

bool mp3_encoder_available() {
    return avcodec_find_encoder(AV_CODEC_ID_MP3) != nullptr;
}

void write_media_fixture(const std::string& path, const FixtureOptions& options) {
    AVFormatContext* raw = nullptr;
    check(avformat_alloc_output_context2(&raw, nullptr, options.container.c_str(), path.c_str()),
          "Cannot create " + options.container + " container");
    OutputPtr oc(raw);

    Track audio;
    Track video;
    if (options.audio) audio = add_audio(oc.get());
    if (options.video) video = add_video(oc.get());

    if (!(oc->oformat->flags & AVFMT_NOFILE)) {
        check(avio_open(&oc->pb, path.c_str(), AVIO_FLAG_WRITE), "Cannot open " + path);
    }
    check(avformat_write_header(oc.get(), nullptr), "Cannot write fixture header");

    if (options.audio && options.audio_packets) write_tone(oc.get(), audio, options.seconds);
    if (options.video) write_frames(oc.get(), video, options.seconds);

    check(av_write_trailer(oc.get()), "Cannot finalize " + path);
}

} // namespace testing_support
} // namespace vid2mp3
