#pragma once

#include "data_types.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <random>
#include <string>
#include <utility>

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Delay before the next attempt: the fixed interval plus uniform jitter, never negative
inline std::chrono::milliseconds retry_delay(const RetryPolicy& policy, std::mt19937& rng) {
    if (policy.jitter.count() <= 0) {
        return policy.interval;
    }
    std::uniform_int_distribution<long long> dist(-policy.jitter.count(), policy.jitter.count());
    return std::chrono::milliseconds(std::max<long long>(0, policy.interval.count() + dist(rng)));
}

/*
 * Keep calling attempt() until it yields a usable resource.
 *
 * A failed attempt either throws (anything derived from std::exception) or returns
 * an empty resource (null pointer). Between attempts the caller's sleeper is invoked
 * with the policy delay. keep_going is checked before every attempt and every sleep;
 * once it returns false the loop throws AcquisitionCancelled. With max_attempts == 0
 * this never gives up.
 */
template <typename Attempt>
auto acquire_with_retry(const std::string& what,
                        const RetryPolicy& policy,
                        Attempt&& attempt,
                        const Sleeper& sleep,
                        const std::function<bool()>& keep_going = {}) -> decltype(attempt()) {
    std::mt19937 rng;
    if (policy.jitter.count() > 0) {
        rng.seed(std::random_device{}());
    }

    for (uint32_t n = 1;; ++n) {
        if (keep_going && !keep_going()) {
            throw AcquisitionCancelled(what);
        }

        try {
            auto resource = attempt();
            if (resource) {
                if (n > 1) {
                    spdlog::info("{} acquired after {} attempts", what, n);
                }
                return resource;
            }
            spdlog::warn("Failed to acquire {} (attempt {})", what, n);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to acquire {} (attempt {}): {}", what, n, e.what());
        }

        if (policy.max_attempts != 0 && n >= policy.max_attempts) {
            throw AcquisitionError(what, n);
        }
        if (keep_going && !keep_going()) {
            throw AcquisitionCancelled(what);
        }

        const auto delay = retry_delay(policy, rng);
        spdlog::debug("Retrying {} in {} ms", what, delay.count());
        sleep(delay);
    }
}
