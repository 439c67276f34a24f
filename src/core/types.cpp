#include "backstop/types.h"

#include <sstream>

#include "backstop/errors.h"
#include "common/string_utils.h"

namespace backstop {

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::CONNECTION_FAILURE:
            return "CONNECTION_FAILURE";
        case ErrorKind::SERVER_ERROR:
            return "SERVER_ERROR";
        case ErrorKind::RATE_LIMITED:
            return "RATE_LIMITED";
        case ErrorKind::CLIENT_ERROR:
            return "CLIENT_ERROR";
        case ErrorKind::VALIDATION:
            return "VALIDATION";
        case ErrorKind::CIRCUIT_OPEN:
            return "CIRCUIT_OPEN";
        case ErrorKind::UNKNOWN:
            break;
    }
    return "UNKNOWN";
}

std::string ToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:
            return "CLOSED";
        case CircuitState::OPEN:
            return "OPEN";
        case CircuitState::HALF_OPEN:
            return "HALF_OPEN";
        default:
            break;
    }
    return "UNKNOWN";
}

ErrorKind ParseErrorKind(const std::string& name) {
    static const ErrorKind kAllKinds[] = {
        ErrorKind::TIMEOUT,
        ErrorKind::CONNECTION_FAILURE,
        ErrorKind::SERVER_ERROR,
        ErrorKind::RATE_LIMITED,
        ErrorKind::CLIENT_ERROR,
        ErrorKind::VALIDATION,
        ErrorKind::CIRCUIT_OPEN,
        ErrorKind::UNKNOWN,
    };

    std::string upper = ToUpper(TrimCopy(name));
    for (auto kind : kAllKinds) {
        if (ToString(kind) == upper) {
            return kind;
        }
    }
    throw ValidationError("Unknown error kind: '" + name + "'");
}

std::string ToString(const ErrorKindSet& kinds) {
    std::ostringstream oss;
    oss << "[";
    for (auto it = kinds.begin(); it != kinds.end(); ++it) {
        if (it != kinds.begin()) {
            oss << ", ";
        }
        oss << ToString(*it);
    }
    oss << "]";
    return oss.str();
}

} // namespace backstop
