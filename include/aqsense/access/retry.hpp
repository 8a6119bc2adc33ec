// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <concepts>
#include <thread>

#include "../core/error.hpp"

namespace aqsense {

/// Bounded retry settings for transport operations
struct RetryPolicy {
    unsigned attempts = 3;                     ///< Total tries, including the first
    std::chrono::milliseconds backoff{100};    ///< Pause between tries
};

/// Anything holding a value cache that can be dropped
template <typename T>
concept Invalidatable = requires(T& cache) {
    { cache.invalidate() };
};

/**
 * Run `fn`, retrying on transport failure
 *
 * Only TransportError is retried. Every other error propagates at once.
 * When the last attempt fails, `cache` is invalidated so stale values are
 * never reported as fresh, and the last TransportError is rethrown.
 *
 * @param cache Register accessor (or driver) whose cache `fn` refreshes
 * @param policy Attempt count and backoff
 * @param fn Operation to run, typically a read() on `cache`
 * @return Whatever `fn` returns
 * @throws ValidationError if the policy allows no attempts
 */
template <Invalidatable Cache, std::invocable Fn>
decltype(auto) with_retries(Cache& cache, const RetryPolicy& policy, Fn&& fn) {
    if (policy.attempts == 0) {
        throw ValidationError("retry policy allows no attempts");
    }
    for (unsigned attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransportError&) {
            if (attempt >= policy.attempts) {
                cache.invalidate();
                throw;
            }
        }
        std::this_thread::sleep_for(policy.backoff);
    }
}

} // namespace aqsense
