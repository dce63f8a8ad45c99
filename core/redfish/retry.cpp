#include "retry.hpp"

#include <algorithm>
#include <cmath>

namespace rfaccess {
namespace redfish {

namespace {
constexpr double kMaxJitterFraction = 0.1;
}  // namespace

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds delay) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

BackoffSchedule::BackoffSchedule(const RetryConfig &config, std::function<double()> random_fraction)
    : config_(config), random_fraction_(std::move(random_fraction)), rng_(std::random_device{}()) {}

std::chrono::milliseconds BackoffSchedule::next_delay() {
    const double max_ms = static_cast<double>(std::max(config_.max_delay_ms, 0));
    double delay_ms = static_cast<double>(std::max(config_.initial_delay_ms, 0)) *
                      std::pow(std::max(config_.backoff_factor, 1.0), static_cast<double>(retries_));
    delay_ms = std::min(delay_ms, max_ms);

    if (config_.jitter && delay_ms > 0.0) {
        double fraction = 0.0;
        if (random_fraction_) {
            fraction = random_fraction_();
        } else {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            fraction = dist(rng_);
        }
        fraction = std::clamp(fraction, 0.0, 1.0);
        delay_ms = std::min(delay_ms + delay_ms * kMaxJitterFraction * fraction, max_ms);
    }

    // Jitter on a capped delay could otherwise dip below the previous one
    long long result = std::max(static_cast<long long>(delay_ms), last_delay_ms_);
    result = std::min(result, static_cast<long long>(max_ms));

    last_delay_ms_ = result;
    ++retries_;
    return std::chrono::milliseconds(result);
}

}  // namespace redfish
}  // namespace rfaccess
