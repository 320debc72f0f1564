/*
 * NovelForge C++ - Cancellation
 *
 * Cooperative cancellation shared between a caller and the code doing the
 * work. Providers poll is_cancelled() or sleep through wait_for() so that a
 * cancel() wakes them immediately.
 */
#ifndef novelforge_CORE_CANCELLATION_HPP
#define novelforge_CORE_CANCELLATION_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace novelforge {

class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Sleep up to timeout_ms. Returns true if the token was cancelled.
    bool wait_for(int64_t timeout_ms) const;

private:
    CancellationToken(const CancellationToken&);
    CancellationToken& operator=(const CancellationToken&);

    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace novelforge

#endif // novelforge_CORE_CANCELLATION_HPP
