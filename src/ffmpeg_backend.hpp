#ifndef VID2MP3_FFMPEG_BACKEND_HPP
#define VID2MP3_FFMPEG_BACKEND_HPP

#include "media_backend.hpp"
#include <memory>
#include <string>

namespace vid2mp3 {

/// MediaBackend on top of FFmpeg: libavformat demuxes the input, the best
/// audio stream is decoded, resampled with libswresample and encoded with
/// FFmpeg's MP3 encoder (libmp3lame) into an .mp3 container.
class FfmpegBackend : public MediaBackend {
public:
    FfmpegBackend();

    std::unique_ptr<MediaHandle> load(const std::string& path) override;
};

} // namespace vid2mp3

#endif // VID2MP3_FFMPEG_BACKEND_HPP
