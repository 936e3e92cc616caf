#pragma once
#include <atomic>
#include <memory>

namespace multichat {

// Cooperative cancellation flag shared between the party that requests a
// stop and the task that polls for it. Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    // Returns true only for the call that actually flipped the flag.
    bool cancel() { return !flag_->exchange(true); }

    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

    // For transports that poll a raw flag (see http_set_abort_flag).
    const std::atomic<bool>* raw() const { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace multichat
