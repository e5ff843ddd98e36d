#include "event_queue.hpp"
#include <utility>

namespace vid2mp3 {

void EventQueue::push(BatchEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    ready_.notify_one();
}

std::optional<BatchEvent> EventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!ready_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    BatchEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace vid2mp3
