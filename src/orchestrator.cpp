#include "orchestrator.hpp"
#include "errors.hpp"
#include "path_resolution.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace vid2mp3 {

std::string format_summary(const BatchSummary& summary) {
    return std::to_string(summary.succeeded) + " succeeded, " +
           std::to_string(summary.failed) + " failed, " +
           std::to_string(summary.skipped) + " skipped (" +
           std::to_string(summary.processed()) + " of " +
           std::to_string(summary.total) + " files)";
}

std::string format_result(const FileResult& result) {
    const std::string name = fs::path(result.input_path).filename().string();
    switch (result.status) {
        case FileStatus::Succeeded:
            return "Completed: " + name + " -> " + result.output_path;
        case FileStatus::Failed:
            return "Failed: " + name + " - " + result.reason;
        case FileStatus::Skipped:
            return "Skipped: " + name + " - " + result.reason;
    }
    return name;
}

Orchestrator::Orchestrator(JobLauncher launcher)
    : launcher_(std::move(launcher)) {
    if (!launcher_) {
        throw std::invalid_argument("Orchestrator requires a job launcher");
    }
}

void Orchestrator::setLogCallback(LogCallback cb) {
    log_cb_ = std::move(cb);
}

void Orchestrator::setInputExtension(const std::string& extension) {
    requireIdle();
    if (extension.empty() || extension[0] == '.') {
        input_extension_ = extension;
    } else {
        input_extension_ = "." + extension;
    }
}

void Orchestrator::setEncoderSettings(const EncoderSettings& settings) {
    requireIdle();
    encoder_ = settings;
}

void Orchestrator::log(const std::string& msg) {
    if (log_cb_) {
        log_cb_(msg);
    } else {
        std::cout << msg << "\n";
    }
}

void Orchestrator::requireIdle() const {
    if (run_) {
        throw BatchError(ErrorKind::JobRunning, "A conversion is already running");
    }
}

const BatchSummary& Orchestrator::summary() const {
    return run_ ? run_->summary : last_summary_;
}

AddFilesReport Orchestrator::addFiles(const std::vector<std::string>& paths) {
    requireIdle();

    AddFilesReport report;
    for (const auto& path : paths) {
        if (!has_extension(path, input_extension_)) {
            std::string reason = "not a " + input_extension_ + " file";
            log("Rejected: " + path + " (" + reason + ")");
            report.rejected.emplace_back(path, reason);
            continue;
        }

        auto checked = resolve_input_file(path);
        if (!checked.has_value()) {
            log("Rejected: " + checked.error());
            report.rejected.emplace_back(path, checked.error());
            continue;
        }

        if (!file_keys_.insert(checked->path).second) {
            report.duplicates.push_back(path);
            continue;
        }

        files_.push_back(checked->path);
        report.added.push_back(checked->path);
    }

    log("Added " + std::to_string(report.added.size()) + " file(s). Total: " +
        std::to_string(files_.size()));
    return report;
}

void Orchestrator::clearFiles() {
    requireIdle();
    files_.clear();
    file_keys_.clear();
    log("File list cleared.");
}

void Orchestrator::setOutputDirectory(const std::string& path) {
    requireIdle();

    auto dir = resolve_output_dir(path);
    if (!dir.has_value()) {
        throw BatchError(ErrorKind::InvalidDirectory, dir.error());
    }

    output_dir_ = dir->path;
    log("Output directory set to: " + output_dir_);
}

void Orchestrator::startBatch() {
    requireIdle();

    if (files_.empty()) {
        throw BatchError(ErrorKind::EmptyInputList, "Please select files to convert.");
    }
    if (output_dir_.empty()) {
        throw BatchError(ErrorKind::NoOutputDirectory, "Please select an output directory.");
    }

    // The directory may have been removed or locked since it was chosen
    auto dir = resolve_output_dir(output_dir_);
    if (!dir.has_value()) {
        throw BatchError(ErrorKind::InvalidDirectory, dir.error());
    }

    RunState run;
    run.job.input_files = files_;
    run.job.output_dir = output_dir_;
    run.job.encoder = encoder_;
    run.summary.total = files_.size();

    run_ = std::move(run);
    progress_percent_ = 0;
    last_outcome_.reset();

    log("Starting conversion of " + std::to_string(files_.size()) + " file(s)...");

    try {
        launcher_(run_->job, run_->cancel);
    } catch (const std::exception& e) {
        run_.reset();
        log(std::string("Could not start conversion: ") + e.what());
        throw;
    }
}

bool Orchestrator::cancel() {
    if (!run_ || run_->cancel_requested) {
        return false;
    }
    run_->cancel.request();
    run_->cancel_requested = true;
    log("Cancelling conversion...");
    return true;
}

void Orchestrator::onProgress(const ProgressEvent& event) {
    if (!run_) return;

    progress_percent_ = percent_of(event.completed, event.total);

    if (!run_->in_file) {
        log("Converting: " + event.current_file + " (" + std::to_string(event.completed + 1) +
            "/" + std::to_string(event.total) + ")");
    } else {
        log("Progress: " + std::to_string(progress_percent_) + "% (" +
            std::to_string(event.completed) + "/" + std::to_string(event.total) + ")");
    }
    run_->in_file = !run_->in_file;
}

void Orchestrator::onFileResult(const FileResult& result) {
    if (!run_) return;

    run_->summary.add(result);
    log(format_result(result));
}

void Orchestrator::onJobFinished(const JobFinished& finished) {
    if (!run_) return;

    last_summary_ = run_->summary;
    last_outcome_ = finished;
    run_.reset();

    switch (finished.outcome) {
        case JobOutcome::Completed:
            log("Conversion process completed: " + format_summary(last_summary_));
            break;
        case JobOutcome::Cancelled:
            log("Conversion cancelled by user: " + format_summary(last_summary_));
            break;
        case JobOutcome::Failed:
            log("Conversion aborted: " + finished.message + " - " + format_summary(last_summary_));
            break;
    }
}

} // namespace vid2mp3
