#include "common/retry/circuit_breaker.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "backstop/errors.h"
#include "common/time_utils.h"

namespace backstop {

namespace {

// Manually advanced time source shared with the breaker under test.
class FakeClock {
 public:
    FakeClock()
        : now_(std::chrono::steady_clock::now()) {}

    CircuitBreaker::Clock AsClock() {
        return [this]() { return now_; };
    }

    void Advance(Seconds delta) { now_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(delta); }

 private:
    SteadyTimePoint now_;
};

CircuitBreakerConfig Config(int threshold, double recovery_seconds) {
    CircuitBreakerConfig config;
    config.name = "test";
    config.failure_threshold = threshold;
    config.recovery_timeout = Seconds(recovery_seconds);
    return config;
}

} // namespace

class CircuitBreakerTest : public ::testing::Test {
 protected:
    FakeClock clock_;
};

TEST_F(CircuitBreakerTest, StartsClosed) {
    CircuitBreaker breaker(Config(3, 10.0), clock_.AsClock());

    auto status = breaker.Status();
    EXPECT_EQ(status.state, CircuitState::CLOSED);
    EXPECT_EQ(status.failure_count, 0);
    EXPECT_EQ(status.last_failure_time, SteadyTimePoint{});
    EXPECT_FALSE(breaker.IsOpen());
    EXPECT_EQ(breaker.Name(), "test");
}

TEST_F(CircuitBreakerTest, OpensAtThreshold) {
    CircuitBreaker breaker(Config(2, 10.0), clock_.AsClock());

    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordFailure();
    EXPECT_EQ(breaker.State(), CircuitState::CLOSED);
    EXPECT_EQ(breaker.FailureCount(), 1);

    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordFailure();
    EXPECT_EQ(breaker.State(), CircuitState::OPEN);
    EXPECT_TRUE(breaker.IsOpen());

    EXPECT_FALSE(breaker.AllowRequest());
    EXPECT_EQ(breaker.FailureCount(), 2);
    EXPECT_EQ(breaker.Stats().rejected_calls, 1U);
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureCountWhileClosed) {
    CircuitBreaker breaker(Config(3, 10.0), clock_.AsClock());

    breaker.RecordFailure();
    breaker.RecordFailure();
    breaker.RecordSuccess();
    EXPECT_EQ(breaker.FailureCount(), 0);

    breaker.RecordFailure();
    breaker.RecordFailure();
    EXPECT_EQ(breaker.State(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, StaysOpenBeforeRecoveryTimeout) {
    CircuitBreaker breaker(Config(1, 10.0), clock_.AsClock());

    breaker.RecordFailure();
    clock_.Advance(Seconds(9.5));
    EXPECT_TRUE(breaker.IsOpen());
    EXPECT_FALSE(breaker.AllowRequest());
}

TEST_F(CircuitBreakerTest, RecoverySuccessCloses) {
    CircuitBreaker breaker(Config(2, 10.0), clock_.AsClock());

    breaker.RecordFailure();
    breaker.RecordFailure();
    clock_.Advance(Seconds(10.0));

    EXPECT_FALSE(breaker.IsOpen());
    EXPECT_EQ(breaker.State(), CircuitState::HALF_OPEN);
    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordSuccess();

    EXPECT_EQ(breaker.State(), CircuitState::CLOSED);
    EXPECT_EQ(breaker.FailureCount(), 0);
}

TEST_F(CircuitBreakerTest, RecoveryFailureReopens) {
    CircuitBreaker breaker(Config(2, 10.0), clock_.AsClock());

    breaker.RecordFailure();
    breaker.RecordFailure();
    clock_.Advance(Seconds(11.0));

    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordFailure();

    EXPECT_EQ(breaker.State(), CircuitState::OPEN);
    EXPECT_EQ(breaker.FailureCount(), 3);
    EXPECT_FALSE(breaker.AllowRequest());

    // the recovery window restarts from the failed trial
    clock_.Advance(Seconds(5.0));
    EXPECT_TRUE(breaker.IsOpen());
    clock_.Advance(Seconds(5.0));
    EXPECT_FALSE(breaker.IsOpen());
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsSingleTrial) {
    CircuitBreaker breaker(Config(1, 1.0), clock_.AsClock());

    breaker.RecordFailure();
    clock_.Advance(Seconds(2.0));

    EXPECT_TRUE(breaker.AllowRequest());
    EXPECT_FALSE(breaker.AllowRequest());
    EXPECT_FALSE(breaker.AllowRequest());
    EXPECT_EQ(breaker.State(), CircuitState::HALF_OPEN);

    breaker.RecordSuccess();
    EXPECT_TRUE(breaker.AllowRequest());
    EXPECT_TRUE(breaker.AllowRequest());
}

TEST_F(CircuitBreakerTest, IsOpenIsIdempotentWhenClosed) {
    CircuitBreaker breaker(Config(3, 10.0), clock_.AsClock());

    breaker.RecordFailure();
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(breaker.IsOpen());
    }
    auto status = breaker.Status();
    EXPECT_EQ(status.state, CircuitState::CLOSED);
    EXPECT_EQ(status.failure_count, 1);
    EXPECT_EQ(breaker.Stats().state_transitions, 0U);
}

TEST_F(CircuitBreakerTest, LateSuccessDoesNotCloseOpenCircuit) {
    CircuitBreaker breaker(Config(1, 10.0), clock_.AsClock());

    breaker.RecordFailure();
    breaker.RecordSuccess();

    EXPECT_EQ(breaker.State(), CircuitState::OPEN);
    EXPECT_EQ(breaker.FailureCount(), 1);
}

TEST_F(CircuitBreakerTest, RecordsLastFailureTime) {
    CircuitBreaker breaker(Config(5, 10.0), clock_.AsClock());

    clock_.Advance(Seconds(3.0));
    auto expected = clock_.AsClock()();
    breaker.RecordFailure();

    EXPECT_EQ(breaker.Status().last_failure_time, expected);
}

TEST_F(CircuitBreakerTest, ResetForcesClosed) {
    CircuitBreaker breaker(Config(1, 60.0), clock_.AsClock());

    breaker.RecordFailure();
    ASSERT_TRUE(breaker.IsOpen());

    breaker.Reset();
    EXPECT_EQ(breaker.State(), CircuitState::CLOSED);
    EXPECT_EQ(breaker.FailureCount(), 0);
    EXPECT_TRUE(breaker.AllowRequest());
}

TEST_F(CircuitBreakerTest, StatsCountEveryOutcome) {
    CircuitBreaker breaker(Config(2, 10.0), clock_.AsClock());

    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordSuccess();
    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordFailure();
    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordFailure();
    EXPECT_FALSE(breaker.AllowRequest());

    clock_.Advance(Seconds(10.0));
    ASSERT_TRUE(breaker.AllowRequest());
    breaker.RecordSuccess();

    auto stats = breaker.Stats();
    EXPECT_EQ(stats.admitted_calls, 4U);
    EXPECT_EQ(stats.successful_calls, 2U);
    EXPECT_EQ(stats.failed_calls, 2U);
    EXPECT_EQ(stats.rejected_calls, 1U);
    // CLOSED -> OPEN -> HALF_OPEN -> CLOSED
    EXPECT_EQ(stats.state_transitions, 3U);
    EXPECT_EQ(stats.current_state, CircuitState::CLOSED);
    EXPECT_EQ(stats.failure_count, 0);
}

TEST(CircuitBreakerRealClockTest, RecoversAfterTimeout) {
    CircuitBreaker breaker(2, Seconds(0.1));

    breaker.RecordFailure();
    breaker.RecordFailure();
    EXPECT_TRUE(breaker.IsOpen());

    EXPECT_TRUE(WaitCondition([&breaker]() { return !breaker.IsOpen(); }, "breaker recovery", 1000));
    EXPECT_EQ(breaker.State(), CircuitState::HALF_OPEN);

    breaker.RecordSuccess();
    EXPECT_EQ(breaker.State(), CircuitState::CLOSED);
}

TEST(CircuitBreakerConfigTest, RejectsInvalidSettings) {
    EXPECT_THROW(CircuitBreaker(0, Seconds(1.0)), ValidationError);
    EXPECT_THROW(CircuitBreaker(-1, Seconds(1.0)), ValidationError);
    EXPECT_THROW(CircuitBreaker(1, Seconds(-0.5)), ValidationError);
    EXPECT_NO_THROW(CircuitBreaker(1, Seconds(0.0)));
}

TEST(CircuitBreakerConcurrencyTest, FailuresAreNeverLost) {
    CircuitBreaker breaker(CircuitBreakerConfig{"shared", 1000000, Seconds(60.0)});
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&breaker]() {
            for (int j = 0; j < 1000; ++j) {
                breaker.RecordFailure();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(breaker.FailureCount(), 8000);
    EXPECT_EQ(breaker.State(), CircuitState::CLOSED);
}

TEST(CircuitBreakerConcurrencyTest, OnlyOneTrialIsAdmittedWhenHalfOpen) {
    CircuitBreaker breaker(1, Seconds(0.0));
    breaker.RecordFailure();

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&breaker, &admitted]() {
            if (breaker.AllowRequest()) {
                admitted++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), 1);
    EXPECT_EQ(breaker.Stats().rejected_calls, 15U);
}

} // namespace backstop
