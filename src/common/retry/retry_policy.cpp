#include "common/retry/retry_policy.h"

#include <cmath>
#include <sstream>
#include <utility>

#include "backstop/errors.h"

namespace backstop {

namespace {

constexpr int DEFAULT_MAX_ATTEMPTS = 3;
constexpr double DEFAULT_INITIAL_DELAY_SEC = 1.0;
constexpr double DEFAULT_MAX_DELAY_SEC = 60.0;
constexpr double DEFAULT_EXPONENTIAL_BASE = 2.0;

} // namespace

RetryPolicy::Builder::Builder()
    : max_attempts_(DEFAULT_MAX_ATTEMPTS),
      initial_delay_(DEFAULT_INITIAL_DELAY_SEC),
      max_delay_(DEFAULT_MAX_DELAY_SEC),
      exponential_base_(DEFAULT_EXPONENTIAL_BASE),
      jitter_(true),
      retryable_kinds_(DefaultRetryableKinds()) {}

RetryPolicy::Builder& RetryPolicy::Builder::WithMaxAttempts(int max_attempts) {
    max_attempts_ = max_attempts;
    return *this;
}

RetryPolicy::Builder& RetryPolicy::Builder::WithInitialDelay(Seconds initial_delay) {
    initial_delay_ = initial_delay;
    return *this;
}

RetryPolicy::Builder& RetryPolicy::Builder::WithMaxDelay(Seconds max_delay) {
    max_delay_ = max_delay;
    return *this;
}

RetryPolicy::Builder& RetryPolicy::Builder::WithExponentialBase(double exponential_base) {
    exponential_base_ = exponential_base;
    return *this;
}

RetryPolicy::Builder& RetryPolicy::Builder::WithJitter(bool jitter) {
    jitter_ = jitter;
    return *this;
}

RetryPolicy::Builder& RetryPolicy::Builder::WithRetryableKinds(ErrorKindSet retryable_kinds) {
    retryable_kinds_ = std::move(retryable_kinds);
    return *this;
}

RetryPolicy RetryPolicy::Builder::Build() const {
    // Zero attempts is representable; executing such a policy is what fails.
    if (max_attempts_ < 0) {
        throw ValidationError("Max attempts must be a non-negative number, got " + std::to_string(max_attempts_));
    }
    if (!(exponential_base_ > 0.0) || std::isinf(exponential_base_)) {
        throw ValidationError("Exponential base must be a positive finite number");
    }
    if (std::isnan(initial_delay_.count()) || std::isnan(max_delay_.count())) {
        throw ValidationError("Delays must be numbers");
    }
    return RetryPolicy(max_attempts_, initial_delay_, max_delay_, exponential_base_, jitter_, retryable_kinds_);
}

RetryPolicy::RetryPolicy()
    : RetryPolicy(
          DEFAULT_MAX_ATTEMPTS,
          Seconds(DEFAULT_INITIAL_DELAY_SEC),
          Seconds(DEFAULT_MAX_DELAY_SEC),
          DEFAULT_EXPONENTIAL_BASE,
          true,
          DefaultRetryableKinds()) {}

RetryPolicy::RetryPolicy(
    int max_attempts,
    Seconds initial_delay,
    Seconds max_delay,
    double exponential_base,
    bool jitter,
    ErrorKindSet retryable_kinds)
    : max_attempts_(max_attempts),
      initial_delay_(initial_delay),
      max_delay_(max_delay),
      exponential_base_(exponential_base),
      jitter_(jitter),
      retryable_kinds_(std::move(retryable_kinds)) {}

RetryPolicy::Builder RetryPolicy::CreateBuilder() {
    return Builder();
}

RetryPolicy RetryPolicy::ProtocolCall() {
    return CreateBuilder()
        .WithMaxAttempts(5)
        .WithInitialDelay(Seconds(2.0))
        .WithMaxDelay(Seconds(30.0))
        .WithExponentialBase(1.5)
        .WithJitter(true)
        .Build();
}

RetryPolicy RetryPolicy::Download() {
    return CreateBuilder()
        .WithMaxAttempts(3)
        .WithInitialDelay(Seconds(5.0))
        .WithMaxDelay(Seconds(60.0))
        .WithExponentialBase(2.0)
        .WithJitter(true)
        .WithRetryableKinds({ErrorKind::TIMEOUT, ErrorKind::CONNECTION_FAILURE, ErrorKind::SERVER_ERROR})
        .Build();
}

const ErrorKindSet& RetryPolicy::DefaultRetryableKinds() {
    static const ErrorKindSet kinds
        = {ErrorKind::SERVER_ERROR, ErrorKind::RATE_LIMITED, ErrorKind::TIMEOUT, ErrorKind::CONNECTION_FAILURE};
    return kinds;
}

std::string RetryPolicy::ToString() const {
    std::ostringstream oss;
    oss << "RetryPolicy{max_attempts=" << max_attempts_ << ", initial_delay=" << initial_delay_.count()
        << "s, max_delay=" << max_delay_.count() << "s, exponential_base=" << exponential_base_
        << ", jitter=" << (jitter_ ? "true" : "false") << ", retryable_kinds=" << backstop::ToString(retryable_kinds_)
        << "}";
    return oss.str();
}

} // namespace backstop
