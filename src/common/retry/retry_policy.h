#pragma once

#include <string>

#include "backstop/types.h"

namespace backstop {

/**
 * Declarative description of how an operation is retried. A policy is an
 * immutable value: once built it has no setters, so one instance can be shared
 * by any number of concurrent executions.
 */
class RetryPolicy {
 public:
    /**
     * Builder for RetryPolicy. Starts from the default policy.
     */
    class Builder {
     public:
        Builder();

        /**
         * @param max_attempts total number of attempts, including the first one
         * @return the builder
         */
        Builder& WithMaxAttempts(int max_attempts);

        /**
         * @param initial_delay delay after the first failed attempt
         * @return the builder
         */
        Builder& WithInitialDelay(Seconds initial_delay);

        /**
         * @param max_delay cap applied before jitter
         * @return the builder
         */
        Builder& WithMaxDelay(Seconds max_delay);

        /**
         * @param exponential_base growth factor between consecutive delays
         * @return the builder
         */
        Builder& WithExponentialBase(double exponential_base);

        /**
         * @param jitter whether delays are scaled by a random factor in [1.0, 1.25]
         * @return the builder
         */
        Builder& WithJitter(bool jitter);

        /**
         * Replaces the retryable set entirely.
         *
         * @param retryable_kinds kinds that are retried, every other kind is not
         * @return the builder
         */
        Builder& WithRetryableKinds(ErrorKindSet retryable_kinds);

        /**
         * @return the built policy
         * @throws ValidationError if a field is out of range
         */
        [[nodiscard]] RetryPolicy Build() const;

     private:
        int max_attempts_;
        Seconds initial_delay_;
        Seconds max_delay_;
        double exponential_base_;
        bool jitter_;
        ErrorKindSet retryable_kinds_;
    };

    /**
     * 3 attempts, 1s initial delay, 60s cap, base 2.0, jitter on and the default
     * retryable kinds.
     */
    RetryPolicy();

    /**
     * @return a builder
     */
    static Builder CreateBuilder();

    /**
     * Preset for chatty query endpoints: more attempts, slower growth.
     */
    static RetryPolicy ProtocolCall();

    /**
     * Preset for large payload transfers: fewer attempts, transport failures
     * and server errors only.
     */
    static RetryPolicy Download();

    // SERVER_ERROR, RATE_LIMITED, TIMEOUT and CONNECTION_FAILURE.
    static const ErrorKindSet& DefaultRetryableKinds();

    [[nodiscard]] int MaxAttempts() const { return max_attempts_; }

    [[nodiscard]] Seconds InitialDelay() const { return initial_delay_; }

    [[nodiscard]] Seconds MaxDelay() const { return max_delay_; }

    [[nodiscard]] double ExponentialBase() const { return exponential_base_; }

    [[nodiscard]] bool Jitter() const { return jitter_; }

    [[nodiscard]] const ErrorKindSet& RetryableKinds() const { return retryable_kinds_; }

    [[nodiscard]] std::string ToString() const;

 private:
    RetryPolicy(
        int max_attempts,
        Seconds initial_delay,
        Seconds max_delay,
        double exponential_base,
        bool jitter,
        ErrorKindSet retryable_kinds);

    int max_attempts_;
    Seconds initial_delay_;
    Seconds max_delay_;
    double exponential_base_;
    bool jitter_;
    ErrorKindSet retryable_kinds_;
};

} // namespace backstop
