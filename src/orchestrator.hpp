#ifndef VID2MP3_ORCHESTRATOR_HPP
#define VID2MP3_ORCHESTRATOR_HPP

#include "types.hpp"
#include "cancellation.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vid2mp3 {

struct AddFilesReport {
    std::vector<std::string> added;
    std::vector<std::string> duplicates;
    std::vector<std::pair<std::string, std::string>> rejected;  // path, reason
};

// Hands a validated job to a background worker. Called on the foreground
// thread; must not block until the job ends.
using JobLauncher = std::function<void(const ConversionJob& job, CancellationFlag cancel)>;

/// Foreground half of a batch. Owns the queued files and the output
/// directory, validates them, starts jobs through the launcher and turns
/// the worker's events into progress, log lines and a final summary.
/// Not thread-safe: every call, including the on* handlers, must come
/// from the same (foreground) thread.
class Orchestrator {
public:
    explicit Orchestrator(JobLauncher launcher);

    void setLogCallback(LogCallback cb);
    void setInputExtension(const std::string& extension);
    void setEncoderSettings(const EncoderSettings& settings);

    AddFilesReport addFiles(const std::vector<std::string>& paths);
    void clearFiles();

    // Throws BatchError(InvalidDirectory) and keeps the previous directory
    void setOutputDirectory(const std::string& path);

    // Throws BatchError: EmptyInputList, NoOutputDirectory,
    // InvalidDirectory or JobRunning. No worker is launched on failure.
    void startBatch();

    // Returns false when there is no running job or cancel was already requested
    bool cancel();

    void onProgress(const ProgressEvent& event);
    void onFileResult(const FileResult& result);
    void onJobFinished(const JobFinished& finished);

    const std::vector<std::string>& files() const { return files_; }
    const std::string& outputDirectory() const { return output_dir_; }
    const std::string& inputExtension() const { return input_extension_; }
    const EncoderSettings& encoderSettings() const { return encoder_; }

    bool isRunning() const { return run_.has_value(); }
    bool canStart() const { return !isRunning() && !files_.empty() && !output_dir_.empty(); }
    bool canCancel() const { return isRunning() && !run_->cancel_requested; }

    int progressPercent() const { return progress_percent_; }

    // Counts of the running batch, or of the last finished one
    const BatchSummary& summary() const;
    const std::optional<JobFinished>& lastOutcome() const { return last_outcome_; }

private:
    // Fresh for every batch, dropped when it finishes
    struct RunState {
        ConversionJob job;
        CancellationFlag cancel;
        BatchSummary summary;
        bool in_file = false;          // between a file's two progress events
        bool cancel_requested = false;
    };

    void requireIdle() const;
    void log(const std::string& msg);

    JobLauncher launcher_;
    LogCallback log_cb_;
    std::string input_extension_ = ".mp4";
    EncoderSettings encoder_;

    std::vector<std::string> files_;
    std::set<std::string> file_keys_;
    std::string output_dir_;

    std::optional<RunState> run_;
    int progress_percent_ = 0;
    BatchSummary last_summary_;
    std::optional<JobFinished> last_outcome_;
};

// "2 succeeded, 1 failed, 0 skipped (3 of 3 files)"
std::string format_summary(const BatchSummary& summary);

// One status-log line per worker event
std::string format_result(const FileResult& result);

} // namespace vid2mp3

#endif // VID2MP3_ORCHESTRATOR_HPP
