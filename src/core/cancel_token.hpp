#pragma once

#include <atomic>
#include <memory>

// Shared cancellation flag. Copies observe the same flag, so one token can be
// handed to every remote call of a discovery run.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

    // Raw flag for signal handlers (must not touch the shared_ptr itself).
    std::atomic<bool>* raw_flag() const { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
