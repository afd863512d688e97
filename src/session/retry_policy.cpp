/*
 * PeerLink - reconnection backoff and per-peer circuit breaker implementation
 */

#include "retry_policy.hpp"

#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

namespace peerlink {

namespace {
double uniform_random() {
    auto bytes = random_bytes(sizeof(uint32_t));
    uint32_t value = 0;
    std::memcpy(&value, bytes.data(), sizeof(value));
    return static_cast<double>(value) / 4294967296.0;
}
} // namespace

ExponentialBackoff::ExponentialBackoff(BackoffConfig config, std::function<double()> random)
    : config_(config), random_(std::move(random)) {
    if (!random_) {
        random_ = uniform_random;
    }
}

std::chrono::milliseconds ExponentialBackoff::delay_for(uint32_t attempt) const {
    const double max_ms = static_cast<double>(config_.max_delay.count());
    if (attempt >= config_.max_attempts) {
        return config_.max_delay;
    }
    double base = static_cast<double>(config_.initial_delay.count()) *
                  std::pow(config_.multiplier, static_cast<double>(attempt));
    base = std::min(base, max_ms);
    double factor = 1.0 + config_.jitter * (2.0 * random_() - 1.0);
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(base * factor)));
}

RetryController::RetryController(ExponentialBackoff policy) : policy_(std::move(policy)) {}

std::optional<std::chrono::milliseconds> RetryController::next_delay() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!policy_.can_retry(attempt_)) {
        return std::nullopt;
    }
    auto delay = policy_.delay_for(attempt_);
    ++attempt_;
    return delay;
}

void RetryController::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    attempt_ = 0;
}

uint32_t RetryController::current_attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

CircuitBreaker::CircuitBreaker(uint32_t threshold) : threshold_(threshold) {}

bool CircuitBreaker::should_attempt(const std::string& peer_id) const {
    return failures(peer_id) < threshold_;
}

void CircuitBreaker::record_failure(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = ++failures_[peer_id];
    if (count == threshold_) {
        log_warn("Circuit breaker open for peer " + short_id(peer_id) + " after " +
                 std::to_string(count) + " failed attempts");
    }
}

void CircuitBreaker::record_success(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(peer_id);
}

uint32_t CircuitBreaker::failures(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(peer_id);
    return it == failures_.end() ? 0 : it->second;
}

} // namespace peerlink
