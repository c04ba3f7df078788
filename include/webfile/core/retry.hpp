// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <webfile/core/config.hpp>
#include <webfile/core/error.hpp>
#include <webfile/core/log.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <random>
#include <string_view>
#include <system_error>

namespace webfile::core {

namespace detail {

inline std::error_code error_of(const std::error_code& ec) noexcept { return ec; }

template<typename T>
std::error_code error_of(const std::expected<T, std::error_code>& result) noexcept {
    return result ? std::error_code{} : result.error();
}

} // namespace detail

// Bounded retry with exponential backoff and random jitter, wrapped around
// a single network call site
class RetryPolicy {
public:
    using Predicate = std::function<bool(const std::error_code&)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy() = default;
    RetryPolicy(std::uint32_t max_attempts,
                std::chrono::milliseconds base_delay,
                double multiplier = RETRY_MULTIPLIER,
                std::chrono::milliseconds jitter_min = RETRY_JITTER_MIN,
                std::chrono::milliseconds jitter_max = RETRY_JITTER_MAX);

    // One attempt, no waiting
    [[nodiscard]] static RetryPolicy once() noexcept;

    [[nodiscard]] std::uint32_t max_attempts() const noexcept { return max_attempts_; }
    void max_attempts(std::uint32_t n) noexcept { max_attempts_ = n == 0 ? 1 : n; }

    // Replace the retryable-error predicate (default: is_retryable)
    [[nodiscard]] RetryPolicy with_predicate(Predicate predicate) const;

    // Replace the sleep function, tests pass a recorder
    void sleeper(Sleeper s) { sleeper_ = std::move(s); }

    [[nodiscard]] bool retryable(const std::error_code& ec) const {
        return predicate_ ? predicate_(ec) : is_retryable(ec);
    }

    // Wait before the next attempt after `failed_attempts` failures
    [[nodiscard]] std::chrono::milliseconds delay(std::uint32_t failed_attempts) const;

    // Runs `op` until it succeeds, fails with a non-retryable error, or the
    // attempts run out. `op` returns std::error_code or std::expected<T, std::error_code>.
    template<typename F>
    auto run(F&& op, std::string_view what = {}) const {
        for (std::uint32_t attempt = 1;; ++attempt) {
            auto result = op();
            const std::error_code ec = detail::error_of(result);
            if (!ec || attempt >= max_attempts_ || !retryable(ec)) {
                return result;
            }
            const auto wait = delay(attempt);
            logger("webfile.retry")->warn("{} failed ({}), attempt {}/{}, retrying in {} ms",
                                          what.empty() ? std::string_view{"request"} : what,
                                          ec.message(), attempt, max_attempts_, wait.count());
            sleep(wait);
        }
    }

private:
    void sleep(std::chrono::milliseconds wait) const;

    std::uint32_t max_attempts_{RETRY_COUNT};
    std::chrono::milliseconds base_delay_{RETRY_BASE_DELAY};
    double multiplier_{RETRY_MULTIPLIER};
    std::chrono::milliseconds jitter_min_{RETRY_JITTER_MIN};
    std::chrono::milliseconds jitter_max_{RETRY_JITTER_MAX};
    std::chrono::milliseconds max_delay_{RETRY_MAX_DELAY};
    Predicate predicate_;
    Sleeper sleeper_;
    mutable std::mt19937_64 rng_{std::random_device{}()};
};

} // namespace webfile::core
