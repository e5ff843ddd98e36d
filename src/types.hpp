#ifndef VID2MP3_TYPES_HPP
#define VID2MP3_TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <functional>
#include <utility>

namespace vid2mp3 {

// Output encoder parameters handed to the media backend
struct EncoderSettings {
    int sample_rate = 44100;
    int bitrate_kbps = 128;
    int max_channels = 2;        // mono sources stay mono
};

struct ConvertConfig {
    std::string output_dir;
    std::string input_extension = ".mp4";   // matched case-insensitively
    EncoderSettings encoder;
};

// Fixed for the lifetime of one batch
struct ConversionJob {
    std::vector<std::string> input_files;
    std::string output_dir;
    EncoderSettings encoder;

    std::size_t size() const { return input_files.size(); }
};

struct ProgressEvent {
    std::size_t completed = 0;
    std::size_t total = 0;
    std::string current_file;    // file name only, no directory
};

enum class FileStatus { Succeeded, Failed, Skipped };

struct FileResult {
    FileStatus status = FileStatus::Failed;
    std::size_t index = 0;       // position within the job
    std::string input_path;
    std::string output_path;     // set when Succeeded
    std::string reason;          // set when Failed or Skipped

    static FileResult succeeded(std::size_t index, std::string input, std::string output) {
        return {FileStatus::Succeeded, index, std::move(input), std::move(output), {}};
    }
    static FileResult failed(std::size_t index, std::string input, std::string why) {
        return {FileStatus::Failed, index, std::move(input), {}, std::move(why)};
    }
    static FileResult skipped(std::size_t index, std::string input, std::string why) {
        return {FileStatus::Skipped, index, std::move(input), {}, std::move(why)};
    }
};

enum class JobOutcome { Completed, Cancelled, Failed };

struct JobFinished {
    JobOutcome outcome = JobOutcome::Completed;
    std::string message;         // error text when Failed
};

struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;

    void add(const FileResult& result) {
        switch (result.status) {
            case FileStatus::Succeeded: ++succeeded; break;
            case FileStatus::Failed:    ++failed; break;
            case FileStatus::Skipped:   ++skipped; break;
        }
    }

    std::size_t processed() const { return succeeded + failed + skipped; }
};

inline const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Succeeded: return "succeeded";
        case FileStatus::Failed:    return "failed";
        case FileStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

inline const char* to_string(JobOutcome outcome) {
    switch (outcome) {
        case JobOutcome::Completed: return "completed";
        case JobOutcome::Cancelled: return "cancelled";
        case JobOutcome::Failed:    return "failed";
    }
    return "unknown";
}

// Integer percentage of completed/total, 0 for an empty job
inline int percent_of(std::size_t completed, std::size_t total) {
    if (total == 0) return 0;
    if (completed >= total) return 100;
    return static_cast<int>(completed * 100 / total);
}

// Callbacks for front-end integration
using ProgressCallback = std::function<void(const ProgressEvent& event)>;
using ResultCallback = std::function<void(const FileResult& result)>;
using FinishedCallback = std::function<void(const JobFinished& finished)>;
using LogCallback = std::function<void(const std::string& message)>;

} // namespace vid2mp3

#endif // VID2MP3_TYPES_HPP
