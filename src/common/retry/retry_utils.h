#pragma once

#include <exception>
#include <functional>
#include <string>

#include "backstop/errors.h"
#include "backstop/types.h"
#include "common/retry/backoff_calculator.h"
#include "common/retry/circuit_breaker.h"
#include "common/retry/error_classifier.h"
#include "common/retry/retry_policy.h"

namespace backstop {

/**
 * Interface for functions which return nothing and may throw exceptions.
 */
using RunnableThrowsException = std::function<void()>;

/**
 * Interface for functions which return a value and may throw exceptions.
 */
template <typename T>
using CallableThrowsException = std::function<T()>;

/**
 * What happened in one attempt of a retried execution. Only handed to an
 * AttemptObserver, never stored.
 */
struct AttemptOutcome {
    int attempt{0};
    bool succeeded{false};
    std::exception_ptr error;
    ErrorKind kind{ErrorKind::UNKNOWN};
    // Backoff slept after this attempt, zero when no retry followed.
    Seconds delay{0};
};

using Sleeper = std::function<void(Seconds)>;

using AttemptObserver = std::function<void(const AttemptOutcome&)>;

/**
 * Seams of the retry loop. Empty members fall back to the real thing: the
 * thread sleeps and jitter comes from ThreadLocalRandomSource().
 */
struct RetryHooks {
    Sleeper sleeper;
    RandomSource* random{nullptr};
    AttemptObserver observer;
};

/**
 * Book-keeping of a single ExecuteWithRetry call. Lives on the caller's stack
 * and is never shared.
 */
class RetryState {
 public:
    /**
     * @throws ValidationError if the policy allows no attempt at all
     */
    RetryState(const RetryPolicy& policy, const std::string& context, const RetryHooks& hooks);

    void BeginAttempt();

    void RecordSuccess();

    /**
     * Classifies the error and decides whether another attempt follows.
     *
     * @return false when the caller must rethrow the error
     */
    bool RecordFailure(const std::exception_ptr& error);

    // Sleeps the delay chosen by the last RecordFailure() that returned true.
    void Backoff();

    [[nodiscard]] int Attempt() const { return attempt_; }

 private:
    void Notify(const AttemptOutcome& outcome) const;

    const RetryPolicy& policy_;
    const std::string context_;
    const RetryHooks& hooks_;
    int attempt_;
    AttemptOutcome pending_;
};

/**
 * Utilities for performing retries.
 */
class RetryUtils {
 public:
    RetryUtils() = delete; // prevent instantiation

    /**
     * Runs the callable until it succeeds, it throws an error the policy does
     * not retry, or policy.MaxAttempts() attempts were made. The last error is
     * rethrown as is, never wrapped.
     *
     * @param func the callable to retry
     * @param policy the retry policy to use
     * @param context a description of the operation, used in logs
     * @param hooks sleeper, random source and observer overrides
     * @return the result of the callable
     * @throws ValidationError if policy.MaxAttempts() is 0, before any attempt
     */
    template <typename T>
    static T ExecuteWithRetry(
        const CallableThrowsException<T>& func,
        const RetryPolicy& policy,
        const std::string& context = "",
        const RetryHooks& hooks = RetryHooks());

    static void ExecuteWithRetry(
        const RunnableThrowsException& func,
        const RetryPolicy& policy,
        const std::string& context = "",
        const RetryHooks& hooks = RetryHooks());

    /**
     * ExecuteWithRetry with RetryPolicy::ProtocolCall().
     */
    template <typename T>
    static T ExecuteProtocolCall(const CallableThrowsException<T>& func, const std::string& context = "protocol call");

    /**
     * ExecuteWithRetry with RetryPolicy::Download().
     */
    template <typename T>
    static T ExecuteDownload(const CallableThrowsException<T>& func, const std::string& context = "file download");

    /**
     * Runs the callable through the breaker. A rejected call throws
     * CircuitOpenError without invoking the callable and without counting as a
     * failure; otherwise the outcome is recorded and the callable's own error
     * is rethrown unchanged.
     *
     * @param func the callable to protect
     * @param breaker the breaker shared by every caller of the resource
     * @param context a description of the operation, used in logs and errors
     * @return the result of the callable
     */
    template <typename T>
    static T ExecuteWithCircuitBreaker(
        const CallableThrowsException<T>& func, CircuitBreaker& breaker, const std::string& context = "");

    static void ExecuteWithCircuitBreaker(
        const RunnableThrowsException& func, CircuitBreaker& breaker, const std::string& context = "");

 private:
    // Throws CircuitOpenError when the breaker does not admit the call.
    static void AcquireOrThrow(CircuitBreaker& breaker, const std::string& context);
};

template <typename T>
T RetryUtils::ExecuteWithRetry(
    const CallableThrowsException<T>& func,
    const RetryPolicy& policy,
    const std::string& context,
    const RetryHooks& hooks) {
    RetryState state(policy, context, hooks);
    while (true) {
        state.BeginAttempt();
        try {
            T result = func();
            state.RecordSuccess();
            return result;
        } catch (...) {
            if (!state.RecordFailure(std::current_exception())) {
                throw;
            }
        }
        state.Backoff();
    }
}

template <typename T>
T RetryUtils::ExecuteProtocolCall(const CallableThrowsException<T>& func, const std::string& context) {
    return ExecuteWithRetry<T>(func, RetryPolicy::ProtocolCall(), context);
}

template <typename T>
T RetryUtils::ExecuteDownload(const CallableThrowsException<T>& func, const std::string& context) {
    return ExecuteWithRetry<T>(func, RetryPolicy::Download(), context);
}

template <typename T>
T RetryUtils::ExecuteWithCircuitBreaker(
    const CallableThrowsException<T>& func, CircuitBreaker& breaker, const std::string& context) {
    AcquireOrThrow(breaker, context);
    try {
        T result = func();
        breaker.RecordSuccess();
        return result;
    } catch (...) {
        breaker.RecordFailure();
        throw;
    }
}

} // namespace backstop
