#ifndef VID2MP3_MEDIA_BACKEND_HPP
#define VID2MP3_MEDIA_BACKEND_HPP

#include "types.hpp"
#include <memory>
#include <string>

namespace vid2mp3 {

/// Audio stream inside an opened media file.
/// Borrows from the MediaHandle that produced it and must not outlive it.
class AudioTrack {
public:
    virtual ~AudioTrack() = default;

    /// One-line description for the log, e.g. "aac, 48000 Hz, 2 ch"
    virtual std::string describe() const = 0;

    /// Decode the whole track and write it as an audio-only file.
    /// An existing file at output_path is overwritten.
    /// Throws MediaError on failure.
    virtual void write(const std::string& output_path, const EncoderSettings& settings) = 0;
};

/// An opened media file. close() releases every resource held for it and
/// is safe to call more than once; the destructor closes as well.
class MediaHandle {
public:
    virtual ~MediaHandle() = default;

    /// Best audio stream of the file, or nullptr when it has none
    virtual std::unique_ptr<AudioTrack> audioTrack() = 0;

    virtual void close() noexcept = 0;
};

/// Factory for MediaHandles. Throws MediaError when a file cannot be opened.
class MediaBackend {
public:
    virtual ~MediaBackend() = default;

    virtual std::unique_ptr<MediaHandle> load(const std::string& path) = 0;
};

} // namespace vid2mp3

#endif // VID2MP3_MEDIA_BACKEND_HPP
