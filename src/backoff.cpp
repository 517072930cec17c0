#include "backoff.hpp"
#include <algorithm>
#include <cmath>

namespace pbrelay {

Backoff::Backoff(BackoffPolicy policy, uint64_t seed)
    : policy_(policy), rng_(seed) {
    policy_.jitter = std::min(1.0, std::max(0.0, policy_.jitter));
    if (policy_.base.count() < 1) policy_.base = std::chrono::milliseconds(1);
    if (policy_.max < policy_.base) policy_.max = policy_.base;
}

std::chrono::milliseconds Backoff::next_delay() {
    double max_ms = static_cast<double>(policy_.max.count());
    double exp = std::ldexp(static_cast<double>(policy_.base.count()),
                            static_cast<int>(std::min<uint32_t>(attempts_, 62)));
    double capped = std::min(max_ms, exp);

    double factor = 1.0;
    if (policy_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0, 1.0 + policy_.jitter);
        factor = dist(rng_);
    }

    if (attempts_ < UINT32_MAX) ++attempts_;
    double delay = std::min(max_ms, capped * factor);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace pbrelay
