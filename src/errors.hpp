#ifndef VID2MP3_ERRORS_HPP
#define VID2MP3_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vid2mp3 {

enum class ErrorKind {
    InvalidDirectory,
    EmptyInputList,
    NoOutputDirectory,
    JobRunning,
    UnrecoverableJob
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDirectory:  return "InvalidDirectory";
        case ErrorKind::EmptyInputList:    return "EmptyInputList";
        case ErrorKind::NoOutputDirectory: return "NoOutputDirectory";
        case ErrorKind::JobRunning:        return "JobRunning";
        case ErrorKind::UnrecoverableJob:  return "UnrecoverableJob";
    }
    return "Unknown";
}

/// Batch-level failure: a violated precondition before start, or an
/// error that aborts the remaining files of a running batch.
class BatchError : public std::runtime_error {
public:
    BatchError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Failure reported by the media backend for a single file
/// (open, decode, encode or write).
class MediaError : public std::runtime_error {
public:
    explicit MediaError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace vid2mp3

#endif // VID2MP3_ERRORS_HPP
