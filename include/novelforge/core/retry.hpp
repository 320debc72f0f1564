/*
 * NovelForge C++ - Retry & Deadlines
 *
 * Guards for calls that leave the process (providers) or may hit a busy
 * database:
 *   retry_transient()    - bounded exponential backoff, only for transient
 *                          failures
 *   call_with_timeout()  - runs a call on its own thread, enforcing a deadline
 *                          and the caller's cancellation token
 */
#ifndef novelforge_CORE_RETRY_HPP
#define novelforge_CORE_RETRY_HPP

#include <novelforge/core/status.hpp>
#include <novelforge/core/cancellation.hpp>
#include <functional>
#include <cstdint>

namespace novelforge {

struct RetryPolicy {
    int max_attempts;            // Total attempts including the first (default: 3)
    int64_t initial_backoff_ms;  // Delay before the second attempt
    double multiplier;           // Backoff growth factor
    int64_t max_backoff_ms;      // Upper bound for a single delay

    RetryPolicy()
        : max_attempts(3)
        , initial_backoff_ms(100)
        , multiplier(2.0)
        , max_backoff_ms(2000) {}

    // Delay after the given failed attempt (1-based)
    int64_t backoff_for(int attempt) const;
};

typedef std::function<Status()> RetryableCall;
typedef std::function<Status(const CancellationToken&)> CancellableCall;

// Run op until it succeeds, fails permanently, attempts run out or the
// token is cancelled. `what` names the operation in log lines.
Status retry_transient(const RetryPolicy& policy,
                       const CancellationToken* token,
                       const char* what,
                       const RetryableCall& op);

// Run call on a helper thread. When timeout_ms (> 0) elapses or the caller
// token is cancelled, the call's own token is cancelled and we wait for it
// to return; the result is then a timeout_code / CANCELLED failure no matter
// what the call produced.
Status call_with_timeout(const CancellableCall& call,
                         int64_t timeout_ms,
                         const CancellationToken* caller,
                         const char* what,
                         ErrorCode timeout_code = ErrorCode::GENERATION_TIMEOUT);

} // namespace novelforge

#endif // novelforge_CORE_RETRY_HPP
