#include "moiplink/controller/Backoff.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace moiplink::controller {

Backoff::Backoff(BackoffPolicy policy, std::uint32_t seed) : policy_(policy), rng_(seed) {
    if (policy_.initial.count() <= 0 || policy_.max < policy_.initial) {
        throw std::invalid_argument("Backoff requires 0 < initial <= max");
    }
    if (policy_.multiplier < 1.0) {
        throw std::invalid_argument("Backoff multiplier must be at least 1");
    }
    policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
}

std::chrono::milliseconds Backoff::next() {
    const double base = static_cast<double>(policy_.initial.count()) * std::pow(policy_.multiplier, attempts_);
    const double capped = std::min(base, static_cast<double>(policy_.max.count()));
    ++attempts_;

    double delay = capped;
    if (policy_.jitter > 0.0) {
        std::uniform_real_distribution<double> spread(-policy_.jitter, policy_.jitter);
        delay = capped * (1.0 + spread(rng_));
    }
    delay = std::clamp(delay, 1.0, static_cast<double>(policy_.max.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

}  // namespace moiplink::controller
