#include "common/retry/error_classifier.h"

#include <stdexcept>
#include <system_error>

#include "backstop/errors.h"

namespace backstop {

namespace {

ErrorKind ClassifySystemError(const std::error_code& code) {
    if (code == std::errc::timed_out) {
        return ErrorKind::TIMEOUT;
    }
    if (code == std::errc::connection_refused || code == std::errc::connection_reset
        || code == std::errc::connection_aborted || code == std::errc::host_unreachable
        || code == std::errc::network_unreachable || code == std::errc::network_down
        || code == std::errc::not_connected || code == std::errc::broken_pipe) {
        return ErrorKind::CONNECTION_FAILURE;
    }
    return ErrorKind::UNKNOWN;
}

} // namespace

ErrorKind ClassifyException(const std::exception_ptr& error) {
    if (!error) {
        return ErrorKind::UNKNOWN;
    }
    try {
        std::rethrow_exception(error);
    } catch (const BackstopError& e) {
        return e.Kind();
    } catch (const std::system_error& e) {
        return ClassifySystemError(e.code());
    } catch (const std::invalid_argument&) {
        return ErrorKind::VALIDATION;
    } catch (const std::out_of_range&) {
        return ErrorKind::VALIDATION;
    } catch (const std::domain_error&) {
        return ErrorKind::VALIDATION;
    } catch (const std::length_error&) {
        return ErrorKind::VALIDATION;
    } catch (...) {
        // foreign error, rethrown unchanged by the caller
        return ErrorKind::UNKNOWN;
    }
}

bool IsRetryable(ErrorKind kind, const RetryPolicy& policy) {
    return policy.RetryableKinds().count(kind) > 0;
}

bool IsRetryable(const std::exception_ptr& error, const RetryPolicy& policy) {
    return IsRetryable(ClassifyException(error), policy);
}

std::string DescribeException(const std::exception_ptr& error) {
    if (!error) {
        return "<no error>";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "<non-standard exception>";
    }
}

} // namespace backstop
