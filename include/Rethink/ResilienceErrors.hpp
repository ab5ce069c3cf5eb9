// =================================================================
// include/Rethink/ResilienceErrors.hpp
// =================================================================
// Error kinds and exception types raised by the resilience layers.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace Rethink {

/**
 * @brief Classification of a failed upstream call
 */
enum class ErrorKind {
    TRANSIENT,          ///< Network timeout, 5xx, connection reset
    RATE_LIMITED,       ///< Upstream throttling (HTTP 429)
    INVALID_REQUEST,    ///< Malformed call, never retried
    UNAUTHORIZED,       ///< Bad credentials, never retried
    CIRCUIT_OPEN,       ///< Refused locally by an open circuit breaker
    CANCELLED           ///< Abandoned by a hedge winner or by the caller
};

std::string errorKindToString(ErrorKind kind);

/**
 * @brief Failure of one generation attempt, tagged with its kind
 */
class GenerationError : public std::runtime_error {
public:
    GenerationError(ErrorKind kind, const std::string& message, bool timeout = false)
        : std::runtime_error(message), m_kind(kind), m_timeout(timeout) {}

    ErrorKind kind() const { return m_kind; }

    /**
     * @brief True when the failure is a per-call deadline overrun
     */
    bool isTimeout() const { return m_timeout; }

private:
    ErrorKind m_kind;
    bool m_timeout;
};

/**
 * @brief Raised instead of attempting a call while a breaker refuses traffic
 */
class CircuitOpenError : public GenerationError {
public:
    explicit CircuitOpenError(const std::string& breaker_id)
        : GenerationError(ErrorKind::CIRCUIT_OPEN, "Circuit open for endpoint: " + breaker_id),
          m_breaker_id(breaker_id) {}

    const std::string& breakerId() const { return m_breaker_id; }

private:
    std::string m_breaker_id;
};

/**
 * @brief Raised when work is abandoned through a CancellationToken
 */
class CancelledError : public GenerationError {
public:
    explicit CancelledError(const std::string& message = "Operation cancelled")
        : GenerationError(ErrorKind::CANCELLED, message) {}
};

/**
 * @brief Cache backend I/O failure. Never escapes CacheCoordinator.
 */
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Every candidate of a round failed after the round retry limit
 */
class AllCandidatesFailedError : public std::runtime_error {
public:
    AllCandidatesFailedError(size_t round_index, size_t attempts, ErrorKind last_kind,
                             const std::string& last_message)
        : std::runtime_error("All candidates failed in round " + std::to_string(round_index) +
                             " after " + std::to_string(attempts) + " attempt(s): " + last_message),
          m_round_index(round_index), m_attempts(attempts),
          m_last_kind(last_kind), m_last_message(last_message) {}

    size_t roundIndex() const { return m_round_index; }
    size_t attempts() const { return m_attempts; }

    /**
     * @brief Kind of the last candidate failure observed in the final attempt
     */
    ErrorKind lastErrorKind() const { return m_last_kind; }
    const std::string& lastErrorMessage() const { return m_last_message; }

private:
    size_t m_round_index;
    size_t m_attempts;
    ErrorKind m_last_kind;
    std::string m_last_message;
};

} // namespace Rethink
