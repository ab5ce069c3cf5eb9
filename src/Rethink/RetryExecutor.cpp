// =================================================================
// src/Rethink/RetryExecutor.cpp
// =================================================================
// Implementation of retry with backoff and breaker gating.

#include "Rethink/RetryExecutor.hpp"
#include "Rethink/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Rethink {

// =================================================================
// RetryPolicy
// =================================================================

bool RetryPolicy::defaultRetryable(ErrorKind kind) {
    return kind == ErrorKind::TRANSIENT || kind == ErrorKind::RATE_LIMITED;
}

bool RetryPolicy::shouldRetry(ErrorKind kind) const {
    if (kind == ErrorKind::CIRCUIT_OPEN || kind == ErrorKind::CANCELLED) {
        return false;
    }
    if (is_retryable) {
        return is_retryable(kind);
    }
    return defaultRetryable(kind);
}

std::chrono::milliseconds RetryPolicy::computeDelay(size_t attempt, ErrorKind kind,
                                                    double jitter_sample) const {
    double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    double delay_ms = static_cast<double>(base_delay.count()) * std::pow(multiplier, exponent);

    if (kind == ErrorKind::RATE_LIMITED) {
        delay_ms *= rate_limit_multiplier;
    }

    double jitter = std::clamp(jitter_fraction, 0.0, 1.0);
    delay_ms *= 1.0 + jitter * std::clamp(jitter_sample, -1.0, 1.0);

    delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));
    delay_ms = std::max(delay_ms, 0.0);

    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

// =================================================================
// RetryExecutor
// =================================================================

RetryExecutor::RetryExecutor(CircuitBreakerRegistry& registry)
    : m_registry(registry), m_rng(std::random_device{}()) {}

double RetryExecutor::sampleJitter() {
    std::lock_guard<std::mutex> lock(m_rng_mutex);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return dist(m_rng);
}

std::string RetryExecutor::execute(const std::string& endpoint_id,
                                   const AttemptFunction& operation,
                                   const RetryPolicy& policy,
                                   const CancellationToken& token,
                                   std::chrono::steady_clock::time_point deadline) {
    size_t max_attempts = std::max<size_t>(policy.max_attempts, 1);
    std::shared_ptr<CircuitBreaker> breaker = m_registry.getBreaker(endpoint_id);

    for (size_t attempt = 1; ; ++attempt) {
        if (token.isCancelled()) {
            m_cancelled++;
            throw CancelledError("Attempt sequence cancelled for endpoint: " + endpoint_id);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw GenerationError(ErrorKind::TRANSIENT,
                                  "Call deadline exceeded before attempt " + std::to_string(attempt) +
                                  " on endpoint: " + endpoint_id, true);
        }

        BreakerPermit permit = breaker->allow();
        if (!permit) {
            m_circuit_rejections++;
            Logger::getInstance().debug("RetryExecutor", "Attempt refused by open circuit", endpoint_id);
            throw CircuitOpenError(endpoint_id);
        }

        m_attempts++;
        if (attempt > 1) {
            m_retries++;
        }

        ErrorKind failure_kind = ErrorKind::TRANSIENT;
        std::string failure_message;

        std::string text;
        bool succeeded = false;

        try {
            text = operation(token);
            succeeded = true;
        } catch (const GenerationError& e) {
            if (token.isCancelled() || e.kind() == ErrorKind::CANCELLED) {
                breaker->releaseProbe(permit);
                m_cancelled++;
                throw CancelledError("Attempt cancelled on endpoint: " + endpoint_id);
            }

            breaker->recordFailure(permit, e.kind());

            if (!policy.shouldRetry(e.kind())) {
                m_terminal_failures++;
                Logger::getInstance().warning("RetryExecutor",
                    "Terminal failure, not retried: " + std::string(e.what()),
                    "Endpoint: " + endpoint_id + ", Kind: " + errorKindToString(e.kind()));
                throw;
            }
            if (attempt >= max_attempts) {
                m_exhausted++;
                Logger::getInstance().warning("RetryExecutor",
                    "Retry budget exhausted after " + std::to_string(attempt) + " attempt(s)",
                    "Endpoint: " + endpoint_id + ", Last error: " + e.what());
                throw;
            }
            failure_kind = e.kind();
            failure_message = e.what();
        } catch (const std::exception& e) {
            if (token.isCancelled()) {
                breaker->releaseProbe(permit);
                m_cancelled++;
                throw CancelledError("Attempt cancelled on endpoint: " + endpoint_id);
            }

            // Unclassified provider failure, treated as transient
            breaker->recordFailure(permit, ErrorKind::TRANSIENT);
            if (attempt >= max_attempts || !policy.shouldRetry(ErrorKind::TRANSIENT)) {
                m_exhausted++;
                throw GenerationError(ErrorKind::TRANSIENT,
                                      "Unclassified provider failure: " + std::string(e.what()));
            }
            failure_message = e.what();
        }

        if (succeeded) {
            if (token.isCancelled()) {
                // Abandoned while in flight: the result belongs to nobody
                breaker->releaseProbe(permit);
                m_cancelled++;
                throw CancelledError("Attempt completed after cancellation on endpoint: " + endpoint_id);
            }
            breaker->recordSuccess(permit);
            return text;
        }

        auto delay = policy.computeDelay(attempt, failure_kind, sampleJitter());
        if (std::chrono::steady_clock::now() + delay >= deadline) {
            throw GenerationError(ErrorKind::TRANSIENT,
                                  "Call deadline exceeded while backing off on endpoint: " + endpoint_id +
                                  " (last error: " + failure_message + ")", true);
        }

        Logger::getInstance().debug("RetryExecutor",
            "Retrying after " + std::to_string(delay.count()) + "ms",
            "Endpoint: " + endpoint_id + ", Attempt: " + std::to_string(attempt) +
            ", Kind: " + errorKindToString(failure_kind));

        if (token.waitFor(delay)) {
            m_cancelled++;
            throw CancelledError("Backoff cancelled on endpoint: " + endpoint_id);
        }
    }
}

RetryStatistics RetryExecutor::getStatistics() const {
    RetryStatistics stats;
    stats.attempts = m_attempts.load();
    stats.retries = m_retries.load();
    stats.circuit_rejections = m_circuit_rejections.load();
    stats.terminal_failures = m_terminal_failures.load();
    stats.exhausted = m_exhausted.load();
    stats.cancelled = m_cancelled.load();
    return stats;
}

void RetryExecutor::resetStatistics() {
    m_attempts = 0;
    m_retries = 0;
    m_circuit_rejections = 0;
    m_terminal_failures = 0;
    m_exhausted = 0;
    m_cancelled = 0;
}

} // namespace Rethink
