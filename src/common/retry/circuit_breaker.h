#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "backstop/types.h"
#include "common/macro_utils.h"

namespace backstop {

struct CircuitBreakerConfig {
    // Protected resource, used in logs and in CircuitOpenError.
    std::string name{"default"};

    // Consecutive failures in CLOSED before the circuit opens.
    int failure_threshold{5};

    // Time since the last failure before an OPEN circuit admits a trial call.
    Seconds recovery_timeout{60.0};

    /**
     * @throws ValidationError if failure_threshold <= 0 or recovery_timeout < 0
     */
    void Validate() const;
};

// Point-in-time view of the state machine.
struct CircuitStatus {
    CircuitState state;
    int failure_count;
    // Default constructed (epoch) while no failure was ever recorded.
    SteadyTimePoint last_failure_time;
};

struct CircuitBreakerStats {
    uint64_t admitted_calls{0};
    uint64_t successful_calls{0};
    uint64_t failed_calls{0};
    uint64_t rejected_calls{0};
    uint64_t state_transitions{0};
    CircuitState current_state{CircuitState::CLOSED};
    int failure_count{0};
};

/**
 * Guards one downstream resource. CLOSED lets calls through and counts
 * consecutive failures; at the threshold the circuit goes OPEN and rejects
 * calls until recovery_timeout has passed since the last failure. It then goes
 * HALF_OPEN and admits exactly one trial call: success closes the circuit,
 * failure reopens it.
 *
 * Every read that can move the state and every write is done under one mutex,
 * so concurrent callers see a linearizable sequence of transitions. Instances
 * are created once per resource and shared by reference.
 */
class CircuitBreaker {
 public:
    using Clock = std::function<SteadyTimePoint()>;

    BACKSTOP_DISALLOW_COPY_AND_MOVE(CircuitBreaker);

    /**
     * @param clock time source, steady_clock::now when empty
     * @throws ValidationError if the config is invalid
     */
    explicit CircuitBreaker(CircuitBreakerConfig config = CircuitBreakerConfig(), Clock clock = nullptr);

    CircuitBreaker(int failure_threshold, Seconds recovery_timeout);

    ~CircuitBreaker() = default;

    /**
     * Status check that precedes every call. Moves OPEN to HALF_OPEN once the
     * recovery timeout has elapsed, atomically with the check.
     *
     * @return true if the circuit is OPEN after the check
     */
    bool IsOpen();

    /**
     * Same check as IsOpen(), plus admission control: CLOSED admits, OPEN
     * rejects, HALF_OPEN admits a single trial until its outcome is recorded.
     * A rejection is counted in the stats but never as a failure.
     *
     * @return true if the caller may run the protected operation
     */
    [[nodiscard]] bool AllowRequest();

    void RecordSuccess();

    void RecordFailure();

    // Forces CLOSED with a zero failure count.
    void Reset();

    [[nodiscard]] CircuitStatus Status() const;

    [[nodiscard]] CircuitBreakerStats Stats() const;

    [[nodiscard]] CircuitState State() const;

    [[nodiscard]] int FailureCount() const;

    [[nodiscard]] const CircuitBreakerConfig& Config() const { return config_; }

    [[nodiscard]] const std::string& Name() const { return config_.name; }

 private:
    SteadyTimePoint Now() const;

    // Both require mutex_ to be held.
    void TransitionIfRecoveredLocked(SteadyTimePoint now);
    void TransitionLocked(CircuitState next);

    const CircuitBreakerConfig config_;
    const Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::CLOSED};
    int failure_count_{0};
    SteadyTimePoint last_failure_time_{};
    bool trial_in_flight_{false};
    CircuitBreakerStats stats_;
};

} // namespace backstop
