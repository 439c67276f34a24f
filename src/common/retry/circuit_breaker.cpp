#include "common/retry/circuit_breaker.h"

#include <chrono>
#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

#include "backstop/errors.h"

namespace backstop {

void CircuitBreakerConfig::Validate() const {
    if (failure_threshold <= 0) {
        throw ValidationError(
            "Circuit breaker [" + name + "] failure threshold must be positive, got "
            + std::to_string(failure_threshold));
    }
    if (std::isnan(recovery_timeout.count()) || recovery_timeout < Seconds(0)) {
        throw ValidationError("Circuit breaker [" + name + "] recovery timeout must be non-negative");
    }
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, Clock clock)
    : config_(std::move(config)),
      clock_(std::move(clock)) {
    config_.Validate();
    SPDLOG_INFO(
        "CircuitBreaker[{}] created: failure_threshold={}, recovery_timeout={}s",
        config_.name,
        config_.failure_threshold,
        config_.recovery_timeout.count());
}

CircuitBreaker::CircuitBreaker(int failure_threshold, Seconds recovery_timeout)
    : CircuitBreaker(CircuitBreakerConfig{"default", failure_threshold, recovery_timeout}) {}

bool CircuitBreaker::IsOpen() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::OPEN) {
        TransitionIfRecoveredLocked(Now());
    }
    return state_ == CircuitState::OPEN;
}

bool CircuitBreaker::AllowRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::OPEN) {
        TransitionIfRecoveredLocked(Now());
    }

    switch (state_) {
        case CircuitState::CLOSED:
            break;
        case CircuitState::HALF_OPEN:
            if (trial_in_flight_) {
                stats_.rejected_calls++;
                return false;
            }
            trial_in_flight_ = true;
            break;
        case CircuitState::OPEN:
            stats_.rejected_calls++;
            return false;
    }
    stats_.admitted_calls++;
    return true;
}

void CircuitBreaker::RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.successful_calls++;
    switch (state_) {
        case CircuitState::CLOSED:
            failure_count_ = 0;
            break;
        case CircuitState::HALF_OPEN:
            failure_count_ = 0;
            trial_in_flight_ = false;
            TransitionLocked(CircuitState::CLOSED);
            SPDLOG_INFO("CircuitBreaker[{}] closed after successful recovery", config_.name);
            break;
        case CircuitState::OPEN:
            // a call admitted before the circuit opened; it does not close it
            SPDLOG_DEBUG("CircuitBreaker[{}] ignoring late success while open", config_.name);
            break;
    }
}

void CircuitBreaker::RecordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.failed_calls++;
    failure_count_++;
    last_failure_time_ = Now();

    switch (state_) {
        case CircuitState::CLOSED:
            if (failure_count_ >= config_.failure_threshold) {
                TransitionLocked(CircuitState::OPEN);
                SPDLOG_WARN(
                    "CircuitBreaker[{}] opened: failures={}, threshold={}",
                    config_.name,
                    failure_count_,
                    config_.failure_threshold);
            }
            break;
        case CircuitState::HALF_OPEN:
            trial_in_flight_ = false;
            TransitionLocked(CircuitState::OPEN);
            SPDLOG_WARN("CircuitBreaker[{}] trial call failed, reopened: failures={}", config_.name, failure_count_);
            break;
        case CircuitState::OPEN:
            break;
    }
}

void CircuitBreaker::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_ = 0;
    trial_in_flight_ = false;
    if (state_ != CircuitState::CLOSED) {
        TransitionLocked(CircuitState::CLOSED);
    }
    SPDLOG_INFO("CircuitBreaker[{}] reset", config_.name);
}

CircuitStatus CircuitBreaker::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CircuitStatus{state_, failure_count_, last_failure_time_};
}

CircuitBreakerStats CircuitBreaker::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats stats = stats_;
    stats.current_state = state_;
    stats.failure_count = failure_count_;
    return stats;
}

CircuitState CircuitBreaker::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::FailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

SteadyTimePoint CircuitBreaker::Now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void CircuitBreaker::TransitionIfRecoveredLocked(SteadyTimePoint now) {
    if (Seconds(now - last_failure_time_) >= config_.recovery_timeout) {
        TransitionLocked(CircuitState::HALF_OPEN);
        trial_in_flight_ = false;
        SPDLOG_INFO("CircuitBreaker[{}] transitioning to half-open", config_.name);
    }
}

void CircuitBreaker::TransitionLocked(CircuitState next) {
    SPDLOG_DEBUG("CircuitBreaker[{}] {} -> {}", config_.name, ToString(state_), ToString(next));
    state_ = next;
    stats_.state_transitions++;
}

} // namespace backstop
