#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

namespace backstop {

// Tag produced at the transport boundary for every failed attempt.
enum class ErrorKind : uint8_t {
    TIMEOUT = 0,
    CONNECTION_FAILURE = 1,
    SERVER_ERROR = 2,
    RATE_LIMITED = 3,
    CLIENT_ERROR = 4,
    VALIDATION = 5,
    CIRCUIT_OPEN = 6,
    UNKNOWN = 255,
};

enum class CircuitState : uint8_t {
    CLOSED = 0,
    OPEN = 1,
    HALF_OPEN = 2,
};

using ErrorKindSet = std::set<ErrorKind>;

// Fractional seconds, the unit delays and timeouts are expressed in.
using Seconds = std::chrono::duration<double>;

using SteadyTimePoint = std::chrono::steady_clock::time_point;

[[nodiscard]] std::string ToString(ErrorKind kind);

[[nodiscard]] std::string ToString(CircuitState state);

/**
 * Parses an upper-case kind name such as "RATE_LIMITED". Matching ignores case
 * and surrounding whitespace.
 *
 * @throws ValidationError if the name is not a known kind
 */
ErrorKind ParseErrorKind(const std::string& name);

[[nodiscard]] std::string ToString(const ErrorKindSet& kinds);

} // namespace backstop
