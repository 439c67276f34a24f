#pragma once

#include <exception>
#include <string>

#include "backstop/types.h"
#include "common/retry/retry_policy.h"

namespace backstop {

/**
 * Maps a raised error onto the ErrorKind tag set.
 *
 * - BackstopError and subclasses report their own kind
 * - std::system_error with a timeout errc is TIMEOUT, with a refused, reset or
 *   unreachable errc it is CONNECTION_FAILURE
 * - std::invalid_argument, std::out_of_range, std::domain_error and
 *   std::length_error are VALIDATION
 * - anything else, including a null pointer, is UNKNOWN
 */
[[nodiscard]] ErrorKind ClassifyException(const std::exception_ptr& error);

// Consults policy.RetryableKinds() only.
[[nodiscard]] bool IsRetryable(ErrorKind kind, const RetryPolicy& policy);

[[nodiscard]] bool IsRetryable(const std::exception_ptr& error, const RetryPolicy& policy);

/**
 * @return what() of the error, or a placeholder for non std::exception types
 */
[[nodiscard]] std::string DescribeException(const std::exception_ptr& error);

} // namespace backstop
