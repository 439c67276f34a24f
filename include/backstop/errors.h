#pragma once

#include <stdexcept>
#include <string>

#include "backstop/types.h"

namespace backstop {

/**
 * Base class of every error raised by backstop or by the transport adapters
 * built on it. The kind is what the retry classifier looks at.
 */
class BackstopError : public std::runtime_error {
 public:
    BackstopError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg),
          kind_(kind) {}

    [[nodiscard]] ErrorKind Kind() const { return kind_; }

 private:
    ErrorKind kind_;
};

/**
 * Timeout or connection refused/reset before a response was received.
 */
class TransientNetworkError : public BackstopError {
 public:
    TransientNetworkError(ErrorKind kind, const std::string& msg);
};

/**
 * Upstream answered with a 5xx-equivalent status.
 */
class ServerError : public BackstopError {
 public:
    ServerError(int status, const std::string& msg)
        : BackstopError(ErrorKind::SERVER_ERROR, msg),
          status_(status) {}

    [[nodiscard]] int Status() const { return status_; }

 private:
    int status_;
};

/**
 * Upstream throttled the caller (429-equivalent).
 */
class RateLimitedError : public BackstopError {
 public:
    explicit RateLimitedError(const std::string& msg, Seconds retry_after = Seconds(0))
        : BackstopError(ErrorKind::RATE_LIMITED, msg),
          retry_after_(retry_after) {}

    // Server supplied hint, zero when absent.
    [[nodiscard]] Seconds RetryAfter() const { return retry_after_; }

 private:
    Seconds retry_after_;
};

/**
 * Upstream rejected the request itself (4xx-equivalent other than 429).
 */
class ClientError : public BackstopError {
 public:
    ClientError(int status, const std::string& msg)
        : BackstopError(ErrorKind::CLIENT_ERROR, msg),
          status_(status) {}

    [[nodiscard]] int Status() const { return status_; }

 private:
    int status_;
};

/**
 * Malformed policy or argument, raised before any attempt is made.
 */
class ValidationError : public BackstopError {
 public:
    explicit ValidationError(const std::string& msg)
        : BackstopError(ErrorKind::VALIDATION, msg) {}
};

/**
 * Raised only by a circuit breaker that refused to run the operation. The
 * operation was not attempted.
 */
class CircuitOpenError : public BackstopError {
 public:
    CircuitOpenError(const std::string& breaker_name, const std::string& context);

    [[nodiscard]] const std::string& BreakerName() const { return breaker_name_; }

    [[nodiscard]] const std::string& Context() const { return context_; }

 private:
    std::string breaker_name_;
    std::string context_;
};

/**
 * Maps an HTTP-like status code onto the kind taxonomy: 429 is RATE_LIMITED,
 * 408 is TIMEOUT, other 4xx are CLIENT_ERROR and 5xx are SERVER_ERROR.
 * Anything else is UNKNOWN.
 */
[[nodiscard]] ErrorKind ErrorKindFromHttpStatus(int status);

/**
 * Throws the error type matching ErrorKindFromHttpStatus(status).
 *
 * @throws ValidationError if the status does not denote a failure
 */
[[noreturn]] void ThrowForHttpStatus(int status, const std::string& msg);

} // namespace backstop
