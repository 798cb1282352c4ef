#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "errors.h"
#include "log.h"

namespace parkcore {

struct RetryPolicy {
    unsigned maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{20};
    unsigned multiplier = 2;
};

// Runs fn, re-running it after a TransientError with exponential backoff.
// The last TransientError is rethrown once attempts are spent.
template <typename Fn>
auto withRetry(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    auto backoff = policy.initialBackoff;
    for (unsigned attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransientError& e) {
            if (attempt >= policy.maxAttempts) {
                log::error(what + " failed after " + std::to_string(attempt) +
                           " attempt(s): " + e.what());
                throw;
            }
            log::warn(what + " attempt " + std::to_string(attempt) + " hit " + e.what() +
                      "; retrying in " + std::to_string(backoff.count()) + "ms");
            std::this_thread::sleep_for(backoff);
            backoff *= policy.multiplier;
        }
    }
}

} // namespace parkcore
