#include <novelforge/core/cancellation.hpp>

#include <chrono>

namespace novelforge {

CancellationToken::CancellationToken() : cancelled_(false) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(int64_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms <= 0) {
        return cancelled_.load();
    }
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [this] { return cancelled_.load(); });
}

} // namespace novelforge
