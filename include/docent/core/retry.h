#pragma once

#include <docent/core/types.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stop_token>
#include <string_view>
#include <thread>

namespace docent {

/**
 * Bounded exponential backoff for calls to external providers.
 * Only transient error codes are retried.
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{2000};
};

/**
 * Invoke `func` until it succeeds, returns a non-transient error, or the attempt budget is
 * spent. `func` must return a Result<T>. A stop request ends the loop with OperationCancelled.
 */
template <typename Func>
auto retryWithBackoff(const RetryPolicy& policy, std::string_view what, Func&& func,
                      std::stop_token stop = {}) -> decltype(func()) {
    const int attempts = std::max(1, policy.max_attempts);
    auto backoff = policy.initial_backoff;

    for (int attempt = 1;; ++attempt) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, std::string(what) + ": cancelled"};
        }

        auto result = func();
        if (result) {
            return result;
        }

        const auto& err = result.error();
        if (!isTransient(err.code) || attempt >= attempts) {
            if (isTransient(err.code)) {
                spdlog::warn("[Retry] {} failed after {} attempt(s): {}", what, attempt,
                             err.message);
            }
            return result;
        }

        spdlog::warn("[Retry] {} attempt {}/{} failed ({}), retrying in {}ms", what, attempt,
                     attempts, err.message, backoff.count());
        std::this_thread::sleep_for(backoff);
        backoff = std::min(policy.max_backoff,
                           std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
                               static_cast<double>(backoff.count()) * policy.multiplier)));
    }
}

} // namespace docent
