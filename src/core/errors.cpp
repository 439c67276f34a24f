#include "backstop/errors.h"

namespace backstop {

namespace {

std::string CircuitOpenMessage(const std::string& breaker_name, const std::string& context) {
    std::string msg = "Circuit breaker [" + breaker_name + "] is open";
    if (!context.empty()) {
        msg += " for " + context;
    }
    return msg + ". Service unavailable.";
}

} // namespace

TransientNetworkError::TransientNetworkError(ErrorKind kind, const std::string& msg)
    : BackstopError(kind, msg) {
    if (kind != ErrorKind::TIMEOUT && kind != ErrorKind::CONNECTION_FAILURE) {
        throw ValidationError("TransientNetworkError requires TIMEOUT or CONNECTION_FAILURE, got " + ToString(kind));
    }
}

CircuitOpenError::CircuitOpenError(const std::string& breaker_name, const std::string& context)
    : BackstopError(ErrorKind::CIRCUIT_OPEN, CircuitOpenMessage(breaker_name, context)),
      breaker_name_(breaker_name),
      context_(context) {}

ErrorKind ErrorKindFromHttpStatus(int status) {
    if (status == 429) {
        return ErrorKind::RATE_LIMITED;
    }
    if (status == 408) {
        return ErrorKind::TIMEOUT;
    }
    if (status >= 400 && status < 500) {
        return ErrorKind::CLIENT_ERROR;
    }
    if (status >= 500 && status < 600) {
        return ErrorKind::SERVER_ERROR;
    }
    return ErrorKind::UNKNOWN;
}

void ThrowForHttpStatus(int status, const std::string& msg) {
    std::string full_msg = "HTTP " + std::to_string(status) + ": " + msg;
    switch (ErrorKindFromHttpStatus(status)) {
        case ErrorKind::RATE_LIMITED:
            throw RateLimitedError(full_msg);
        case ErrorKind::TIMEOUT:
            throw TransientNetworkError(ErrorKind::TIMEOUT, full_msg);
        case ErrorKind::CLIENT_ERROR:
            throw ClientError(status, full_msg);
        case ErrorKind::SERVER_ERROR:
            throw ServerError(status, full_msg);
        default:
            break;
    }
    throw ValidationError("Status " + std::to_string(status) + " does not denote a failure");
}

} // namespace backstop
