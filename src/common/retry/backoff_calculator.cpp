#include "common/retry/backoff_calculator.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "backstop/errors.h"

namespace backstop {

MersenneRandomSource::MersenneRandomSource(uint64_t seed)
    : gen_(seed),
      dis_(0.0, 1.0) {}

double MersenneRandomSource::NextUnit() {
    return dis_(gen_);
}

RandomSource& ThreadLocalRandomSource() {
    // one engine per thread, seeded independently
    static thread_local std::random_device random_device;
    static thread_local MersenneRandomSource source(
        (static_cast<uint64_t>(random_device()) << 32U) | static_cast<uint64_t>(random_device()));
    return source;
}

Seconds ComputeBackoff(int attempt, const RetryPolicy& policy, RandomSource& random) {
    if (attempt < 1) {
        throw ValidationError("Backoff attempt must be >= 1, got " + std::to_string(attempt));
    }

    double growth = std::pow(policy.ExponentialBase(), attempt - 1);
    double delay = policy.InitialDelay().count() * growth;
    if (std::isnan(delay)) {
        // 0 * inf once growth overflows
        delay = 0.0;
    }
    delay = std::min(delay, policy.MaxDelay().count());

    if (policy.Jitter()) {
        delay *= 1.0 + random.NextUnit() * (MAX_JITTER_FACTOR - 1.0);
    }
    return Seconds(delay);
}

Seconds ComputeBackoff(int attempt, const RetryPolicy& policy) {
    return ComputeBackoff(attempt, policy, ThreadLocalRandomSource());
}

} // namespace backstop
