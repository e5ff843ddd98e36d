#ifndef VID2MP3_EVENT_QUEUE_HPP
#define VID2MP3_EVENT_QUEUE_HPP

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace vid2mp3 {

struct LogLine {
    std::string text;
};

using BatchEvent = std::variant<ProgressEvent, FileResult, JobFinished, LogLine>;

/// FIFO from the worker thread to the foreground. Any number of
/// producers may push; one consumer pops.
class EventQueue {
public:
    void push(BatchEvent event);

    // Waits up to timeout for an event; empty optional on timeout
    std::optional<BatchEvent> pop(std::chrono::milliseconds timeout);

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<BatchEvent> events_;
};

} // namespace vid2mp3

#endif // VID2MP3_EVENT_QUEUE_HPP
