#include "common/retry/retry_options.h"

#include <chrono>
#include <vector>

#include <spdlog/spdlog.h>

#include "backstop/errors.h"
#include "common/time_utils.h"

namespace backstop {

RetryPolicy LoadRetryPolicy(const Options& options) {
    ErrorKindSet kinds;
    for (const auto& name : GetOptionValue<std::vector<std::string>>(options, RETRY_RETRYABLE_KINDS)) {
        kinds.insert(ParseErrorKind(name));
    }

    auto policy = RetryPolicy::CreateBuilder()
                      .WithMaxAttempts(GetOptionValue<int>(options, RETRY_MAX_ATTEMPTS))
                      .WithInitialDelay(MsToSeconds(GetOptionValue<int>(options, RETRY_INITIAL_DELAY_MS)))
                      .WithMaxDelay(MsToSeconds(GetOptionValue<int>(options, RETRY_MAX_DELAY_MS)))
                      .WithExponentialBase(GetOptionValue<double>(options, RETRY_EXPONENTIAL_BASE))
                      .WithJitter(GetOptionValue<bool>(options, RETRY_JITTER))
                      .WithRetryableKinds(kinds)
                      .Build();
    SPDLOG_INFO("Loaded retry policy from options: {}", policy.ToString());
    return policy;
}

CircuitBreakerConfig LoadCircuitBreakerConfig(const std::string& name, const Options& options) {
    CircuitBreakerConfig config;
    config.name = name;
    config.failure_threshold = GetOptionValue<int>(options, CIRCUIT_BREAKER_FAILURE_THRESHOLD);
    config.recovery_timeout = MsToSeconds(GetOptionValue<int>(options, CIRCUIT_BREAKER_RECOVERY_TIMEOUT_MS));
    config.Validate();
    return config;
}

} // namespace backstop
