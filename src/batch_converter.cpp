#include "batch_converter.hpp"
#include "errors.hpp"
#include "path_resolution.hpp"

#include <iostream>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace vid2mp3 {

BatchConverter::BatchConverter(ConversionJob job, MediaBackend& backend, CancellationFlag cancel)
    : job_(std::move(job)), backend_(backend), cancel_(std::move(cancel)) {}

void BatchConverter::setProgressCallback(ProgressCallback cb) {
    progress_cb_ = std::move(cb);
}

void BatchConverter::setResultCallback(ResultCallback cb) {
    result_cb_ = std::move(cb);
}

void BatchConverter::setFinishedCallback(FinishedCallback cb) {
    finished_cb_ = std::move(cb);
}

void BatchConverter::setLogCallback(LogCallback cb) {
    log_cb_ = std::move(cb);
}

void BatchConverter::reportProgress(std::size_t completed, const std::string& file_name) {
    if (progress_cb_) {
        progress_cb_(ProgressEvent{completed, job_.size(), file_name});
    }
}

void BatchConverter::reportResult(const FileResult& result) {
    if (result_cb_) {
        result_cb_(result);
    }
}

void BatchConverter::log(const std::string& msg) {
    if (log_cb_) {
        log_cb_(msg);
    } else {
        std::cout << msg << "\n";
    }
}

JobFinished BatchConverter::finish(JobOutcome outcome, const std::string& message) {
    switch (outcome) {
        case JobOutcome::Completed: state_ = WorkerState::Completed; break;
        case JobOutcome::Cancelled: state_ = WorkerState::Cancelled; break;
        case JobOutcome::Failed:    state_ = WorkerState::Failed; break;
    }

    JobFinished finished{outcome, message};
    if (finished_cb_) {
        finished_cb_(finished);
    }
    return finished;
}

void BatchConverter::checkOutputDir() const {
    auto dir = resolve_output_dir(job_.output_dir);
    if (!dir.has_value()) {
        throw BatchError(ErrorKind::UnrecoverableJob,
                         "Output directory is no longer usable: " + dir.error());
    }
}

JobFinished BatchConverter::run() {
    if (state_ != WorkerState::Idle) {
        throw std::logic_error("BatchConverter::run() called on a used worker");
    }
    state_ = WorkerState::Running;

    const std::size_t total = job_.size();

    try {
        for (std::size_t i = 0; i < total; ++i) {
            const std::string& input_path = job_.input_files[i];
            const std::string file_name = fs::path(input_path).filename().string();

            if (cancel_.requested()) {
                log("Cancellation requested, " + std::to_string(total - i) +
                    " file(s) not converted");
                return finish(JobOutcome::Cancelled);
            }

            checkOutputDir();

            reportProgress(i, file_name);
            reportResult(convertFile(i, input_path));
            reportProgress(i + 1, file_name);
        }
    } catch (const BatchError& e) {
        return finish(JobOutcome::Failed, e.what());
    }

    return finish(JobOutcome::Completed);
}

FileResult BatchConverter::convertFile(std::size_t index, const std::string& input_path) {
    // The file was checked when queued; it may have gone away since
    auto input = resolve_input_file(input_path);
    if (!input.has_value()) {
        return FileResult::skipped(index, input_path, input.error());
    }

    const std::string output_path = resolve_output_path(input_path, job_.output_dir);

    std::unique_ptr<MediaHandle> media;
    FileResult result;
    try {
        media = backend_.load(input_path);

        std::unique_ptr<AudioTrack> audio = media->audioTrack();
        if (!audio) {
            result = FileResult::failed(index, input_path, "no audio track");
        } else {
            log("  " + fs::path(input_path).filename().string() + ": " + audio->describe());
            audio->write(output_path, job_.encoder);
            result = FileResult::succeeded(index, input_path, output_path);
        }
    } catch (const std::exception& e) {
        result = FileResult::failed(index, input_path, e.what());
    }

    if (media) {
        media->close();
    }
    return result;
}

} // namespace vid2mp3
