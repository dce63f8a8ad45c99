#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <random>

#include "client_config.hpp"

namespace rfaccess {
namespace redfish {

// Cancellation flag shared between a caller and a running request.
// Waits performed through wait_for() wake up immediately on cancel().
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel();
    bool is_cancelled() const;

    // Returns false if cancelled before the delay elapsed
    bool wait_for(std::chrono::milliseconds delay) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

// Exponential backoff: initial * factor^n, capped at max_delay.
// The sequence of returned delays never decreases.
class BackoffSchedule {
public:
    // random_fraction returns a value in [0, 1); only used when jitter is enabled
    explicit BackoffSchedule(const RetryConfig &config, std::function<double()> random_fraction = nullptr);

    // Delay to wait before the next retry; advances the schedule
    std::chrono::milliseconds next_delay();

    int retries_scheduled() const { return retries_; }

private:
    RetryConfig config_;
    std::function<double()> random_fraction_;
    std::mt19937 rng_;
    int retries_ = 0;
    long long last_delay_ms_ = 0;
};

// Sleeps for the delay; returns false when the wait was interrupted
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

}  // namespace redfish
}  // namespace rfaccess
