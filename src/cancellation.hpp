#ifndef VID2MP3_CANCELLATION_HPP
#define VID2MP3_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace vid2mp3 {

/// Shared cancel request between the foreground and one batch worker.
/// Copies refer to the same flag. Written by the foreground only, read
/// by the worker only, so a single atomic is enough.
class CancellationFlag {
public:
    CancellationFlag() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request() { flag_->store(true, std::memory_order_release); }
    bool requested() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace vid2mp3

#endif // VID2MP3_CANCELLATION_HPP
