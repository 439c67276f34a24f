#pragma once

#include <cstdint>
#include <random>

#include "backstop/types.h"
#include "common/retry/retry_policy.h"

namespace backstop {

/**
 * Source of uniformly distributed doubles in [0, 1) used for jitter.
 * Implementations are not required to be thread safe.
 */
class RandomSource {
 public:
    virtual ~RandomSource() = default;

    virtual double NextUnit() = 0;
};

class MersenneRandomSource : public RandomSource {
 public:
    explicit MersenneRandomSource(uint64_t seed);

    double NextUnit() override;

 private:
    std::mt19937_64 gen_;
    std::uniform_real_distribution<double> dis_;
};

/**
 * @return a per-thread source seeded from std::random_device
 */
RandomSource& ThreadLocalRandomSource();

// Upper bound of the jitter factor, so a jittered delay never exceeds
// max_delay * MAX_JITTER_FACTOR.
constexpr double MAX_JITTER_FACTOR = 1.25;

/**
 * Delay to wait after failed attempt `attempt` (1-based):
 * min(initial_delay * exponential_base^(attempt-1), max_delay), scaled by a
 * factor in [1.0, 1.25] when the policy has jitter. Non-positive delays in the
 * policy come back unchanged.
 *
 * @throws ValidationError if attempt < 1
 */
Seconds ComputeBackoff(int attempt, const RetryPolicy& policy, RandomSource& random);

Seconds ComputeBackoff(int attempt, const RetryPolicy& policy);

} // namespace backstop
