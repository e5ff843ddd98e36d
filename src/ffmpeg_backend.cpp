#include "ffmpeg_backend.hpp"
#include "errors.hpp"
#include "platform.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace fs = std::filesystem;

namespace vid2mp3 {

namespace {

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

void check(int ret, const std::string& what) {
    if (ret < 0) {
        throw MediaError(what + ": " + av_error_string(ret));
    }
}

struct InputFormatDeleter {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};

struct OutputFormatDeleter {
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

struct SwrDeleter {
    void operator()(SwrContext* swr) const { swr_free(&swr); }
};

struct FifoDeleter {
    void operator()(AVAudioFifo* fifo) const { av_audio_fifo_free(fifo); }
};

using InputFormatPtr = std::unique_ptr<AVFormatContext, InputFormatDeleter>;
using OutputFormatPtr = std::unique_ptr<AVFormatContext, OutputFormatDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using SwrPtr = std::unique_ptr<SwrContext, SwrDeleter>;
using FifoPtr = std::unique_ptr<AVAudioFifo, FifoDeleter>;

FramePtr alloc_frame() {
    FramePtr frame(av_frame_alloc());
    if (!frame) throw MediaError("Out of memory allocating frame");
    return frame;
}

PacketPtr alloc_packet() {
    PacketPtr pkt(av_packet_alloc());
    if (!pkt) throw MediaError("Out of memory allocating packet");
    return pkt;
}

// First sample format the encoder accepts; s16p preferred when offered
AVSampleFormat pick_sample_format(const AVCodec* codec) {
    const AVSampleFormat* formats = nullptr;
    int count = 0;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(61, 13, 100)
    const void* configs = nullptr;
    if (avcodec_get_supported_config(nullptr, codec, AV_CODEC_CONFIG_SAMPLE_FORMAT, 0,
                                     &configs, &count) >= 0) {
        formats = static_cast<const AVSampleFormat*>(configs);
    }
#else
    formats = codec->sample_fmts;
    if (formats) {
        while (formats[count] != AV_SAMPLE_FMT_NONE) ++count;
    }
#endif
    if (!formats || count == 0) return AV_SAMPLE_FMT_S16P;

    for (int i = 0; i < count; ++i) {
        if (formats[i] == AV_SAMPLE_FMT_S16P) return AV_SAMPLE_FMT_S16P;
    }
    return formats[0];
}

// Removes a half-written output file. Only armed once the file has been
// opened for writing, so an earlier failure leaves an existing file alone.
class PartialFileGuard {
public:
    explicit PartialFileGuard(fs::path path) : path_(std::move(path)) {}
    ~PartialFileGuard() {
        if (armed_ && !committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    void arm() { armed_ = true; }
    void commit() { committed_ = true; }

private:
    fs::path path_;
    bool armed_ = false;
    bool committed_ = false;
};

/// Decodes one audio stream of an opened input and encodes it to MP3.
class Mp3Writer {
public:
    Mp3Writer(AVFormatContext* input, int stream_index,
              const std::string& output_path, const EncoderSettings& settings);

    // Arms guard as soon as output_path has been opened (and truncated)
    void run(PartialFileGuard& guard);

private:
    void openDecoder();
    void openEncoder();
    void openOutput();
    void initResampler(const AVFrame* frame);
    void decode(const AVPacket* pkt);
    void queueSamples(const AVFrame* frame);
    void drainFifo(bool final);
    void encode(const AVFrame* frame);

    AVFormatContext* input_;
    int stream_index_;
    std::string output_path_;
    EncoderSettings settings_;

    CodecContextPtr dec_;
    CodecContextPtr enc_;
    OutputFormatPtr out_;
    AVStream* out_stream_ = nullptr;
    SwrPtr swr_;
    FifoPtr fifo_;
    FramePtr frame_;
    PacketPtr enc_pkt_;
    int64_t next_pts_ = 0;
};

Mp3Writer::Mp3Writer(AVFormatContext* input, int stream_index,
                     const std::string& output_path, const EncoderSettings& settings)
    : input_(input), stream_index_(stream_index),
      output_path_(output_path), settings_(settings),
      frame_(alloc_frame()), enc_pkt_(alloc_packet()) {}

void Mp3Writer::openDecoder() {
    const AVStream* stream = input_->streams[stream_index_];
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        throw MediaError(std::string("No decoder for audio codec ") +
                         avcodec_get_name(stream->codecpar->codec_id));
    }

    dec_.reset(avcodec_alloc_context3(decoder));
    if (!dec_) throw MediaError("Out of memory allocating decoder");

    check(avcodec_parameters_to_context(dec_.get(), stream->codecpar),
          "Cannot copy decoder parameters");
    dec_->pkt_timebase = stream->time_base;
    check(avcodec_open2(dec_.get(), decoder, nullptr), "Cannot open audio decoder");
}

void Mp3Writer::openEncoder() {
    const AVCodec* encoder = avcodec_find_encoder(AV_CODEC_ID_MP3);
    if (!encoder) {
        throw MediaError("MP3 encoder not available in this FFmpeg build");
    }

    enc_.reset(avcodec_alloc_context3(encoder));
    if (!enc_) throw MediaError("Out of memory allocating encoder");

    int channels = dec_->ch_layout.nb_channels > 0
        ? std::min(dec_->ch_layout.nb_channels, settings_.max_channels)
        : settings_.max_channels;
    channels = std::max(channels, 1);

    av_channel_layout_default(&enc_->ch_layout, channels);
    enc_->sample_rate = settings_.sample_rate;
    enc_->sample_fmt = pick_sample_format(encoder);
    enc_->bit_rate = static_cast<int64_t>(settings_.bitrate_kbps) * 1000;
    enc_->time_base = AVRational{1, settings_.sample_rate};

    if (out_->oformat->flags & AVFMT_GLOBALHEADER) {
        enc_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    check(avcodec_open2(enc_.get(), encoder, nullptr), "Cannot open MP3 encoder");

    out_stream_ = avformat_new_stream(out_.get(), nullptr);
    if (!out_stream_) throw MediaError("Cannot create output stream");
    check(avcodec_parameters_from_context(out_stream_->codecpar, enc_.get()),
          "Cannot copy encoder parameters");
    out_stream_->time_base = enc_->time_base;

    fifo_.reset(av_audio_fifo_alloc(enc_->sample_fmt, channels, 1));
    if (!fifo_) throw MediaError("Out of memory allocating audio FIFO");
}

void Mp3Writer::openOutput() {
    const std::string url = platform::utf8_path(output_path_);

    AVFormatContext* raw = nullptr;
    check(avformat_alloc_output_context2(&raw, nullptr, "mp3", url.c_str()),
          "Cannot create MP3 container");
    out_.reset(raw);
}

void Mp3Writer::initResampler(const AVFrame* frame) {
    AVChannelLayout in_layout;
    if (frame->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&in_layout, frame->ch_layout.nb_channels);
    } else {
        check(av_channel_layout_copy(&in_layout, &frame->ch_layout),
              "Cannot copy channel layout");
    }

    SwrContext* raw = nullptr;
    int ret = swr_alloc_set_opts2(&raw,
                                  &enc_->ch_layout, enc_->sample_fmt, enc_->sample_rate,
                                  &in_layout, static_cast<AVSampleFormat>(frame->format),
                                  frame->sample_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&in_layout);
    swr_.reset(raw);
    check(ret, "Cannot configure resampler");
    check(swr_init(swr_.get()), "Cannot initialize resampler");
}

void Mp3Writer::run(PartialFileGuard& guard) {
    openDecoder();
    openOutput();
    openEncoder();

    const std::string url = platform::utf8_path(output_path_);
    check(avio_open(&out_->pb, url.c_str(), AVIO_FLAG_WRITE),
          "Cannot open " + output_path_ + " for writing");
    guard.arm();
    check(avformat_write_header(out_.get(), nullptr), "Cannot write MP3 header");

    PacketPtr pkt = alloc_packet();
    int ret = 0;
    while ((ret = av_read_frame(input_, pkt.get())) >= 0) {
        if (pkt->stream_index == stream_index_) {
            decode(pkt.get());
        }
        av_packet_unref(pkt.get());
    }
    if (ret != AVERROR_EOF) {
        check(ret, "Error reading input");
    }

    // Flush decoder, resampler, FIFO and encoder in that order
    decode(nullptr);
    queueSamples(nullptr);
    drainFifo(true);
    encode(nullptr);

    if (next_pts_ == 0) {
        throw MediaError("Audio track decoded to no samples");
    }

    check(av_write_trailer(out_.get()), "Cannot finalize " + output_path_);
    check(avio_closep(&out_->pb), "Cannot close " + output_path_);
}

void Mp3Writer::decode(const AVPacket* pkt) {
    int ret = avcodec_send_packet(dec_.get(), pkt);
    if (ret == AVERROR_INVALIDDATA) {
        return;  // damaged packet, the rest of the stream is still usable
    }
    if (ret < 0 && ret != AVERROR_EOF) {
        check(ret, "Error decoding audio");
    }

    while (true) {
        ret = avcodec_receive_frame(dec_.get(), frame_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return;
        check(ret, "Error decoding audio");

        queueSamples(frame_.get());
        av_frame_unref(frame_.get());
        drainFifo(false);
    }
}

void Mp3Writer::queueSamples(const AVFrame* frame) {
    if (!swr_) {
        if (!frame) return;  // stream produced no audio at all
        initResampler(frame);
    }

    const int in_samples = frame ? frame->nb_samples : 0;
    const int out_capacity = swr_get_out_samples(swr_.get(), in_samples);
    if (out_capacity <= 0) return;

    FramePtr converted = alloc_frame();
    converted->format = enc_->sample_fmt;
    converted->sample_rate = enc_->sample_rate;
    converted->nb_samples = out_capacity;
    check(av_channel_layout_copy(&converted->ch_layout, &enc_->ch_layout),
          "Cannot copy channel layout");
    check(av_frame_get_buffer(converted.get(), 0), "Cannot allocate sample buffer");

    const uint8_t** in_data = frame
        ? const_cast<const uint8_t**>(frame->extended_data)
        : nullptr;
    const int got = swr_convert(swr_.get(), converted->data, out_capacity, in_data, in_samples);
    check(got, "Error resampling audio");
    if (got == 0) return;

    if (av_audio_fifo_write(fifo_.get(), reinterpret_cast<void**>(converted->data), got) < got) {
        throw MediaError("Cannot queue resampled audio");
    }
}

void Mp3Writer::drainFifo(bool final) {
    const int frame_size = enc_->frame_size > 0 ? enc_->frame_size : 1152;
    const bool small_last_frame =
        (enc_->codec->capabilities &
         (AV_CODEC_CAP_SMALL_LAST_FRAME | AV_CODEC_CAP_VARIABLE_FRAME_SIZE)) != 0;

    while (av_audio_fifo_size(fifo_.get()) >= frame_size ||
           (final && av_audio_fifo_size(fifo_.get()) > 0)) {
        const int available = std::min(av_audio_fifo_size(fifo_.get()), frame_size);
        const bool pad = available < frame_size && !small_last_frame;

        FramePtr out = alloc_frame();
        out->format = enc_->sample_fmt;
        out->sample_rate = enc_->sample_rate;
        out->nb_samples = pad ? frame_size : available;
        check(av_channel_layout_copy(&out->ch_layout, &enc_->ch_layout),
              "Cannot copy channel layout");
        check(av_frame_get_buffer(out.get(), 0), "Cannot allocate sample buffer");

        if (av_audio_fifo_read(fifo_.get(), reinterpret_cast<void**>(out->data), available) < available) {
            throw MediaError("Cannot read queued audio");
        }
        if (pad) {
            av_samples_set_silence(out->data, available, frame_size - available,
                                   enc_->ch_layout.nb_channels, enc_->sample_fmt);
        }

        out->pts = next_pts_;
        next_pts_ += out->nb_samples;
        encode(out.get());
    }
}

void Mp3Writer::encode(const AVFrame* frame) {
    check(avcodec_send_frame(enc_.get(), frame), "Error encoding MP3");

    while (true) {
        int ret = avcodec_receive_packet(enc_.get(), enc_pkt_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return;
        check(ret, "Error encoding MP3");

        enc_pkt_->stream_index = out_stream_->index;
        av_packet_rescale_ts(enc_pkt_.get(), enc_->time_base, out_stream_->time_base);
        check(av_interleaved_write_frame(out_.get(), enc_pkt_.get()),
              "Error writing " + output_path_);
    }
}

class FfmpegAudioTrack : public AudioTrack {
public:
    FfmpegAudioTrack(AVFormatContext* input, int stream_index)
        : input_(input), stream_index_(stream_index) {}

    std::string describe() const override {
        const AVCodecParameters* par = input_->streams[stream_index_]->codecpar;
        return std::string(avcodec_get_name(par->codec_id)) + ", " +
               std::to_string(par->sample_rate) + " Hz, " +
               std::to_string(par->ch_layout.nb_channels) + " ch (stream #" +
               std::to_string(stream_index_) + ")";
    }

    void write(const std::string& output_path, const EncoderSettings& settings) override {
        PartialFileGuard guard(output_path);
        {
            Mp3Writer writer(input_, stream_index_, output_path, settings);
            writer.run(guard);
        }
        guard.commit();
    }

private:
    AVFormatContext* input_;
    int stream_index_;
};

class FfmpegMediaHandle : public MediaHandle {
public:
    explicit FfmpegMediaHandle(const std::string& path) : path_(path) {
        const std::string url = platform::utf8_path(path);

        AVFormatContext* raw = nullptr;
        check(avformat_open_input(&raw, url.c_str(), nullptr, nullptr),
              "Cannot open " + path);
        fmt_.reset(raw);
        check(avformat_find_stream_info(fmt_.get(), nullptr),
              "Cannot read stream info of " + path);
    }

    ~FfmpegMediaHandle() override { close(); }

    std::unique_ptr<AudioTrack> audioTrack() override {
        if (!fmt_) throw MediaError("Media handle already closed: " + path_);

        int index = av_find_best_stream(fmt_.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (index < 0) {
            return nullptr;
        }
        return std::make_unique<FfmpegAudioTrack>(fmt_.get(), index);
    }

    void close() noexcept override { fmt_.reset(); }

private:
    std::string path_;
    InputFormatPtr fmt_;
};

} // namespace

FfmpegBackend::FfmpegBackend() {
    static std::once_flag log_level_once;
    std::call_once(log_level_once, [] { av_log_set_level(AV_LOG_ERROR); });
}

std::unique_ptr<MediaHandle> FfmpegBackend::load(const std::string& path) {
    return std::make_unique<FfmpegMediaHandle>(path);
}

} // namespace vid2mp3
