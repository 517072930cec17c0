#pragma once
#include <chrono>
#include <cstdint>
#include <random>

namespace pbrelay {

struct BackoffPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds max{60000};
    double jitter = 0.25; // clamped to [0, 1]
};

// Capped exponential backoff with multiplicative jitter.
// delay(n) = min(max, min(max, base * 2^n) * f), f uniform in [1, 1 + jitter).
// With jitter <= 1 consecutive delays never decrease until reset().
class Backoff {
public:
    explicit Backoff(BackoffPolicy policy, uint64_t seed = std::random_device{}());

    // Delay before the next attempt; advances the attempt counter.
    std::chrono::milliseconds next_delay();

    void reset() { attempts_ = 0; }
    uint32_t attempts() const { return attempts_; }
    const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
    uint32_t attempts_ = 0;
    std::mt19937_64 rng_;
};

} // namespace pbrelay
