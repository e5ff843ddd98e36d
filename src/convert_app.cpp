#include "convert_app.hpp"
#include "batch_converter.hpp"
#include "errors.hpp"
#include "ffmpeg_backend.hpp"
#include "orchestrator.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace vid2mp3 {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

int parse_int(const std::string& value, const std::string& option) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
}

} // namespace

ConvertApp::ConvertApp(int argc, char** argv)
    : argc_(argc), argv_(argv),
      owned_backend_(std::make_unique<FfmpegBackend>()),
      backend_(owned_backend_.get()) {}

ConvertApp::ConvertApp(int argc, char** argv, MediaBackend& backend)
    : argc_(argc), argv_(argv), backend_(&backend) {}

ConvertApp::~ConvertApp() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ConvertApp::printUsage() const {
    const char* prog = argc_ > 0 ? argv_[0] : "vid2mp3";
    std::cerr << "Usage: " << prog << " -o <output_dir> [options] <file>...\n"
              << "\n"
              << "Extracts the audio track of each video file into <output_dir>/<name>.mp3.\n"
              << "Existing files with the same name are overwritten.\n"
              << "\n"
              << "Options:\n"
              << "  -o <dir>             Output directory (must exist and be writable)\n"
              << "  --ext <.ext>         Input file extension (default: .mp4)\n"
              << "  --bitrate <kbps>     MP3 bitrate, 8-320 (default: 128)\n"
              << "  --sample-rate <hz>   Output sample rate, 8000-48000 (default: 44100)\n"
              << "  -h, --help           Show this help\n";
}

void ConvertApp::parseArgs() {
    for (int i = 1; i < argc_; ++i) {
        std::string arg = argv_[i];
        if (arg == "-o" && i + 1 < argc_) {
            config_.output_dir = argv_[++i];
        } else if (arg == "--ext" && i + 1 < argc_) {
            std::string ext = argv_[++i];
            config_.input_extension = (ext.empty() || ext[0] == '.') ? ext : "." + ext;
        } else if (arg == "--bitrate" && i + 1 < argc_) {
            config_.encoder.bitrate_kbps = parse_int(argv_[++i], arg);
            if (config_.encoder.bitrate_kbps < 8 || config_.encoder.bitrate_kbps > 320) {
                throw std::invalid_argument("Bitrate must be between 8 and 320 kbps");
            }
        } else if (arg == "--sample-rate" && i + 1 < argc_) {
            config_.encoder.sample_rate = parse_int(argv_[++i], arg);
            if (config_.encoder.sample_rate < 8000 || config_.encoder.sample_rate > 48000) {
                throw std::invalid_argument("Sample rate must be between 8000 and 48000 Hz");
            }
        } else if (arg == "-h" || arg == "--help") {
            help_requested_ = true;
            return;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown or incomplete option: " + arg);
        } else {
            input_files_.push_back(arg);
        }
    }

    if (config_.output_dir.empty()) {
        throw std::invalid_argument("Missing required argument: -o <output_dir>");
    }
}

void ConvertApp::launch(const ConversionJob& job, CancellationFlag cancel) {
    worker_ = std::thread([this, job, cancel]() {
        BatchConverter converter(job, *backend_, cancel);
        converter.setProgressCallback([this](const ProgressEvent& e) { events_.push(e); });
        converter.setResultCallback([this](const FileResult& r) { events_.push(r); });
        converter.setFinishedCallback([this](const JobFinished& f) { events_.push(f); });
        converter.setLogCallback([this](const std::string& msg) { events_.push(LogLine{msg}); });

        try {
            converter.run();
        } catch (const std::exception& e) {
            // The consumer waits for a terminal event, so always deliver one
            events_.push(JobFinished{JobOutcome::Failed, e.what()});
        }
    });
}

int ConvertApp::consumeEvents(Orchestrator& orchestrator) {
    using namespace std::chrono_literals;

    bool finished = false;
    while (!finished) {
        if (g_interrupted) {
            g_interrupted = 0;
            orchestrator.cancel();
        }

        auto event = events_.pop(100ms);
        if (!event) continue;

        if (auto* progress = std::get_if<ProgressEvent>(&*event)) {
            orchestrator.onProgress(*progress);
        } else if (auto* result = std::get_if<FileResult>(&*event)) {
            orchestrator.onFileResult(*result);
        } else if (auto* line = std::get_if<LogLine>(&*event)) {
            std::cout << line->text << "\n";
        } else if (auto* done = std::get_if<JobFinished>(&*event)) {
            orchestrator.onJobFinished(*done);
            finished = true;
        }
    }

    worker_.join();

    // Inputs rejected by addFiles never reach the summary but still count as not converted
    const BatchSummary& summary = orchestrator.summary();
    const bool all_ok = rejected_inputs_ == 0 &&
                        orchestrator.lastOutcome() &&
                        orchestrator.lastOutcome()->outcome == JobOutcome::Completed &&
                        summary.succeeded == summary.total;
    return all_ok ? EXIT_OK : EXIT_FILES_FAILED;
}

int ConvertApp::run() {
    try {
        parseArgs();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage();
        return EXIT_USAGE;
    }

    if (help_requested_) {
        printUsage();
        return EXIT_OK;
    }

    Orchestrator orchestrator([this](const ConversionJob& job, CancellationFlag cancel) {
        launch(job, std::move(cancel));
    });
    orchestrator.setInputExtension(config_.input_extension);
    orchestrator.setEncoderSettings(config_.encoder);

    // Ctrl-C cancels from here on, including while the worker is being started
    g_interrupted = 0;
    auto previous = std::signal(SIGINT, on_interrupt);
    auto restore = [previous]() {
        std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);
    };

    try {
        orchestrator.setOutputDirectory(config_.output_dir);
        AddFilesReport report = orchestrator.addFiles(input_files_);
        rejected_inputs_ = report.rejected.size();
        orchestrator.startBatch();
    } catch (const BatchError& e) {
        restore();
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    int code = consumeEvents(orchestrator);
    restore();

    return code;
}

} // namespace vid2mp3
