// Copyright (c) 2026 changcheng967. All rights reserved.

#include <webfile/core/retry.hpp>
#include <algorithm>
#include <cmath>
#include <thread>

namespace webfile::core {

RetryPolicy::RetryPolicy(std::uint32_t max_attempts,
                         std::chrono::milliseconds base_delay,
                         double multiplier,
                         std::chrono::milliseconds jitter_min,
                         std::chrono::milliseconds jitter_max)
    : max_attempts_(max_attempts == 0 ? 1 : max_attempts)
    , base_delay_(base_delay)
    , multiplier_(multiplier < 1.0 ? 1.0 : multiplier)
    , jitter_min_(std::min(jitter_min, jitter_max))
    , jitter_max_(std::max(jitter_min, jitter_max)) {}

RetryPolicy RetryPolicy::once() noexcept {
    RetryPolicy policy;
    policy.max_attempts_ = 1;
    policy.base_delay_ = std::chrono::milliseconds{0};
    policy.jitter_min_ = std::chrono::milliseconds{0};
    policy.jitter_max_ = std::chrono::milliseconds{0};
    return policy;
}

RetryPolicy RetryPolicy::with_predicate(Predicate predicate) const {
    RetryPolicy copy = *this;
    copy.predicate_ = std::move(predicate);
    return copy;
}

std::chrono::milliseconds RetryPolicy::delay(std::uint32_t failed_attempts) const {
    const std::uint32_t exponent = failed_attempts > 0 ? failed_attempts - 1 : 0;
    const double scaled = static_cast<double>(base_delay_.count())
                        * std::pow(multiplier_, static_cast<double>(exponent));

    std::int64_t jitter = 0;
    if (jitter_max_ > jitter_min_) {
        std::uniform_int_distribution<std::int64_t> dist(jitter_min_.count(), jitter_max_.count());
        jitter = dist(rng_);
    } else {
        jitter = jitter_min_.count();
    }

    const double capped = std::min(scaled, static_cast<double>(max_delay_.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped) + jitter};
}

void RetryPolicy::sleep(std::chrono::milliseconds wait) const {
    if (sleeper_) {
        sleeper_(wait);
        return;
    }
    if (wait.count() > 0) {
        std::this_thread::sleep_for(wait);
    }
}

} // namespace webfile::core
