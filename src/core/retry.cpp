#include <novelforge/core/retry.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

#include <chrono>
#include <future>

namespace novelforge {

int64_t RetryPolicy::backoff_for(int attempt) const {
    double delay = static_cast<double>(initial_backoff_ms);
    for (int i = 1; i < attempt; ++i) {
        delay *= multiplier;
        if (delay >= static_cast<double>(max_backoff_ms)) break;
    }
    int64_t ms = static_cast<int64_t>(delay);
    return ms > max_backoff_ms ? max_backoff_ms : ms;
}

Status retry_transient(const RetryPolicy& policy,
                       const CancellationToken* token,
                       const char* what,
                       const RetryableCall& op)
{
    int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    Status status;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (token && token->is_cancelled()) {
            return Status::fail(ErrorCode::CANCELLED, std::string(what) + " cancelled");
        }

        status = op();
        if (status.ok() || !status.transient) {
            return status;
        }

        if (attempt == attempts) break;

        int64_t delay = policy.backoff_for(attempt);
        LOG_WARN("[Retry] %s failed (attempt %d/%d): %s; retrying in %lld ms",
                 what, attempt, attempts, status.to_string().c_str(),
                 static_cast<long long>(delay));

        if (token) {
            if (token->wait_for(delay)) {
                return Status::fail(ErrorCode::CANCELLED, std::string(what) + " cancelled");
            }
        } else {
            sleep_ms(delay);
        }
    }

    LOG_ERROR("[Retry] %s gave up after %d attempts: %s",
              what, attempts, status.to_string().c_str());
    return status;
}

Status call_with_timeout(const CancellableCall& call,
                         int64_t timeout_ms,
                         const CancellationToken* caller,
                         const char* what,
                         ErrorCode timeout_code)
{
    CancellationToken call_token;
    std::future<Status> pending = std::async(std::launch::async,
        [&call, &call_token]() { return call(call_token); });

    int64_t deadline = timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0;

    while (pending.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
        if (caller && caller->is_cancelled()) {
            call_token.cancel();
            pending.wait();
            LOG_INFO("[Call] %s cancelled by caller", what);
            return Status::fail(ErrorCode::CANCELLED, std::string(what) + " cancelled");
        }
        if (deadline > 0 && monotonic_ms() >= deadline) {
            call_token.cancel();
            pending.wait();
            LOG_WARN("[Call] %s timed out after %lld ms", what, static_cast<long long>(timeout_ms));
            return Status::fail(timeout_code, std::string(what) + " timed out after " +
                                std::to_string(timeout_ms) + " ms");
        }
    }

    return pending.get();
}

} // namespace novelforge
