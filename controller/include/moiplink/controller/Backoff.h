#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace moiplink::controller {

struct BackoffPolicy {
    std::chrono::milliseconds initial{500};
    std::chrono::milliseconds max{30000};
    double multiplier{2.0};
    // Fraction of the delay added or removed at random, 0..1.
    double jitter{0.2};
};

// Capped exponential delay with symmetric jitter. Not thread-safe.
class Backoff {
public:
    explicit Backoff(BackoffPolicy policy = {}, std::uint32_t seed = std::random_device{}());

    std::chrono::milliseconds next();
    void reset() noexcept { attempts_ = 0; }
    int attempts() const noexcept { return attempts_; }
    const BackoffPolicy& policy() const noexcept { return policy_; }

private:
    BackoffPolicy policy_;
    std::mt19937 rng_;
    int attempts_{0};
};

}  // namespace moiplink::controller
