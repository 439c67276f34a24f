#include "common/retry/retry_utils.h"

#include <thread>

#include <spdlog/spdlog.h>

namespace backstop {

namespace {

void SleepFor(Seconds delay) {
    // non-positive delays from a degenerate policy mean "retry immediately"
    if (delay > Seconds(0)) {
        std::this_thread::sleep_for(delay);
    }
}

} // namespace

RetryState::RetryState(const RetryPolicy& policy, const std::string& context, const RetryHooks& hooks)
    : policy_(policy),
      context_(context.empty() ? "operation" : context),
      hooks_(hooks),
      attempt_(0) {
    if (policy_.MaxAttempts() <= 0) {
        SPDLOG_ERROR("Refusing to execute {} with {}", context_, policy_.ToString());
        throw ValidationError(
            "Retry policy for " + context_ + " allows no attempts (max_attempts="
            + std::to_string(policy_.MaxAttempts()) + ")");
    }
}

void RetryState::BeginAttempt() {
    attempt_++;
    pending_ = AttemptOutcome{};
    pending_.attempt = attempt_;
    SPDLOG_DEBUG("Attempting {}: attempt={}, max_attempts={}", context_, attempt_, policy_.MaxAttempts());
}

void RetryState::RecordSuccess() {
    if (attempt_ > 1) {
        SPDLOG_INFO("Successfully completed {} after retry: attempts={}", context_, attempt_);
    }
    pending_.succeeded = true;
    Notify(pending_);
}

bool RetryState::RecordFailure(const std::exception_ptr& error) {
    pending_.error = error;
    pending_.kind = ClassifyException(error);

    if (!IsRetryable(pending_.kind, policy_)) {
        SPDLOG_ERROR(
            "Non-retryable error encountered in {}: kind={}, error={}",
            context_,
            ToString(pending_.kind),
            DescribeException(error));
        Notify(pending_);
        return false;
    }

    if (attempt_ >= policy_.MaxAttempts()) {
        SPDLOG_ERROR(
            "Max retry attempts exceeded for {}: attempts={}, kind={}, error={}",
            context_,
            attempt_,
            ToString(pending_.kind),
            DescribeException(error));
        Notify(pending_);
        return false;
    }

    RandomSource& random = hooks_.random != nullptr ? *hooks_.random : ThreadLocalRandomSource();
    pending_.delay = ComputeBackoff(attempt_, policy_, random);
    SPDLOG_WARN(
        "Retrying {} after error: attempt={}/{}, delay_seconds={:.2f}, kind={}, error={}",
        context_,
        attempt_,
        policy_.MaxAttempts(),
        pending_.delay.count(),
        ToString(pending_.kind),
        DescribeException(error));
    return true;
}

void RetryState::Backoff() {
    if (hooks_.sleeper) {
        hooks_.sleeper(pending_.delay);
    } else {
        SleepFor(pending_.delay);
    }
    Notify(pending_);
}

void RetryState::Notify(const AttemptOutcome& outcome) const {
    if (hooks_.observer) {
        hooks_.observer(outcome);
    }
}

void RetryUtils::ExecuteWithRetry(
    const RunnableThrowsException& func,
    const RetryPolicy& policy,
    const std::string& context,
    const RetryHooks& hooks) {
    RetryState state(policy, context, hooks);
    while (true) {
        state.BeginAttempt();
        try {
            func();
            state.RecordSuccess();
            return;
        } catch (...) {
            if (!state.RecordFailure(std::current_exception())) {
                throw;
            }
        }
        state.Backoff();
    }
}

void RetryUtils::ExecuteWithCircuitBreaker(
    const RunnableThrowsException& func, CircuitBreaker& breaker, const std::string& context) {
    AcquireOrThrow(breaker, context);
    try {
        func();
    } catch (...) {
        breaker.RecordFailure();
        throw;
    }
    breaker.RecordSuccess();
}

void RetryUtils::AcquireOrThrow(CircuitBreaker& breaker, const std::string& context) {
    if (!breaker.AllowRequest()) {
        SPDLOG_WARN(
            "CircuitBreaker[{}] rejected {}: circuit is open",
            breaker.Name(),
            context.empty() ? "operation" : context);
        throw CircuitOpenError(breaker.Name(), context);
    }
}

} // namespace backstop
