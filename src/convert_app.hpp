#ifndef VID2MP3_CONVERT_APP_HPP
#define VID2MP3_CONVERT_APP_HPP

#include "types.hpp"
#include "cancellation.hpp"
#include "event_queue.hpp"
#include "media_backend.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace vid2mp3 {

class Orchestrator;

/// Command-line front end. Parses arguments, runs one batch on a
/// background thread and prints the worker's events as they arrive.
class ConvertApp {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FILES_FAILED = 1;
    static constexpr int EXIT_USAGE = 2;

    ConvertApp(int argc, char** argv);
    ConvertApp(int argc, char** argv, MediaBackend& backend);  // Constructor for tests
    ~ConvertApp();

    int run();

    const ConvertConfig& config() const { return config_; }
    const std::vector<std::string>& inputFiles() const { return input_files_; }

private:
    void parseArgs();
    void printUsage() const;
    void launch(const ConversionJob& job, CancellationFlag cancel);
    int consumeEvents(Orchestrator& orchestrator);

    int argc_;
    char** argv_;
    std::unique_ptr<MediaBackend> owned_backend_;
    MediaBackend* backend_;

    ConvertConfig config_;
    std::vector<std::string> input_files_;
    bool help_requested_ = false;
    std::size_t rejected_inputs_ = 0;

    EventQueue events_;
    std::thread worker_;
};

} // namespace vid2mp3

#endif // VID2MP3_CONVERT_APP_HPP
