#pragma once

#include <string>

#include "common/option.h"
#include "common/retry/circuit_breaker.h"
#include "common/retry/retry_policy.h"

namespace backstop {

/**
 * Builds the process default retry policy from the RETRY_* options.
 *
 * @throws ValidationError if a value is out of range or a kind name is unknown
 */
RetryPolicy LoadRetryPolicy(const Options& options);

/**
 * Builds the settings of breaker `name` from the CIRCUIT_BREAKER_* options.
 *
 * @throws ValidationError if a value is out of range
 */
CircuitBreakerConfig LoadCircuitBreakerConfig(const std::string& name, const Options& options);

} // namespace backstop
