#pragma once
#include <atomic>
#include <memory>

namespace qwstream {

// Shared cancel flag. Copies refer to the same flag, so a token handed to
// another thread can stop a session that is blocked in a transport read.
// Moving copies the handle too: a moved-from token still refers to the flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken(const CancellationToken&) = default;
    CancellationToken& operator=(const CancellationToken&) = default;
    CancellationToken(CancellationToken&& other) noexcept : flag_(other.flag_) {}
    CancellationToken& operator=(CancellationToken&& other) noexcept {
        flag_ = other.flag_;
        return *this;
    }

    void cancel() const { flag_->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace qwstream
