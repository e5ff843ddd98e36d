#include "convertworker.hpp"
#include "batch_converter.hpp"
#include "ffmpeg_backend.hpp"

#include <exception>
#include <utility>

ConvertWorker::ConvertWorker(const vid2mp3::ConversionJob& job,
                             vid2mp3::CancellationFlag cancel,
                             QObject* parent)
    : QThread(parent), job_(job), cancel_(std::move(cancel)) {}

void ConvertWorker::run() {
    try {
        vid2mp3::FfmpegBackend backend;
        vid2mp3::BatchConverter converter(job_, backend, cancel_);

        converter.setProgressCallback([this](const vid2mp3::ProgressEvent& event) {
            emit progressChanged(event);
        });
        converter.setResultCallback([this](const vid2mp3::FileResult& result) {
            emit fileFinished(result);
        });
        converter.setFinishedCallback([this](const vid2mp3::JobFinished& finished) {
            emit jobFinished(finished);
        });

        // Route backend diagnostics to GUI log
        converter.setLogCallback([this](const std::string& msg) {
            emit logMessage(QString::fromStdString(msg));
        });

        converter.run();
    } catch (const std::exception& e) {
        emit jobFinished(vid2mp3::JobFinished{vid2mp3::JobOutcome::Failed, e.what()});
    }
}
