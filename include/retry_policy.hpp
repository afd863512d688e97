/*
 * PeerLink - reconnection backoff and per-peer circuit breaker
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace peerlink {

struct BackoffConfig {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier = 2.0;
    uint32_t max_attempts = 5;
    // Fraction of the delay added or removed at random.
    double jitter = 0.1;
};

class ExponentialBackoff {
public:
    // random returns a value in [0, 1). Defaults to the OpenSSL generator.
    explicit ExponentialBackoff(BackoffConfig config = BackoffConfig(),
                                std::function<double()> random = nullptr);

    // Attempts past the limit get the plain maximum, without jitter.
    std::chrono::milliseconds delay_for(uint32_t attempt) const;

    bool can_retry(uint32_t attempt) const { return attempt < config_.max_attempts; }

    const BackoffConfig& config() const { return config_; }

private:
    BackoffConfig config_;
    std::function<double()> random_;
};

class RetryController {
public:
    explicit RetryController(ExponentialBackoff policy = ExponentialBackoff());

    // nullopt once the attempts are used up.
    std::optional<std::chrono::milliseconds> next_delay();

    void reset();

    uint32_t current_attempt() const;

private:
    ExponentialBackoff policy_;
    mutable std::mutex mutex_;
    uint32_t attempt_ = 0;
};

constexpr uint32_t kCircuitBreakerThreshold = 3;

// Counts consecutive failed connection attempts per peer.
class CircuitBreaker {
public:
    explicit CircuitBreaker(uint32_t threshold = kCircuitBreakerThreshold);

    bool should_attempt(const std::string& peer_id) const;

    void record_failure(const std::string& peer_id);

    void record_success(const std::string& peer_id);

    uint32_t failures(const std::string& peer_id) const;

private:
    uint32_t threshold_;
    mutable std::mutex mutex_;
    std::map<std::string, uint32_t> failures_;
};

} // namespace peerlink
