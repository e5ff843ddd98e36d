#ifndef VID2MP3_BATCH_CONVERTER_HPP
#define VID2MP3_BATCH_CONVERTER_HPP

#include "types.hpp"
#include "cancellation.hpp"
#include "media_backend.hpp"
#include <string>

namespace vid2mp3 {

enum class WorkerState { Idle, Running, Completed, Cancelled, Failed };

/// Background half of a batch: converts the job's files one at a time and
/// reports through callbacks. For file i the callbacks fire in the order
/// progress(i-1), result, progress(i); nothing for file i+1 is reported
/// before that. Per-file errors become Failed/Skipped results; only an
/// unusable output directory ends the batch early with JobOutcome::Failed.
class BatchConverter {
public:
    BatchConverter(ConversionJob job, MediaBackend& backend, CancellationFlag cancel);

    void setProgressCallback(ProgressCallback cb);
    void setResultCallback(ResultCallback cb);
    void setFinishedCallback(FinishedCallback cb);
    void setLogCallback(LogCallback cb);

    // Runs the whole batch on the calling thread. May be called once.
    JobFinished run();

    WorkerState state() const { return state_; }
    const ConversionJob& job() const { return job_; }

private:
    FileResult convertFile(std::size_t index, const std::string& input_path);
    void checkOutputDir() const;
    void reportProgress(std::size_t completed, const std::string& file_name);
    void reportResult(const FileResult& result);
    JobFinished finish(JobOutcome outcome, const std::string& message = std::string());
    void log(const std::string& msg);

    ConversionJob job_;
    MediaBackend& backend_;
    CancellationFlag cancel_;
    WorkerState state_ = WorkerState::Idle;

    ProgressCallback progress_cb_;
    ResultCallback result_cb_;
    FinishedCallback finished_cb_;
    LogCallback log_cb_;
};

} // namespace vid2mp3

#endif // VID2MP3_BATCH_CONVERTER_HPP
