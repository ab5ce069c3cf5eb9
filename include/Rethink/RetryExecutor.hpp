// =================================================================
// include/Rethink/RetryExecutor.hpp
// =================================================================
// Retry with exponential backoff around one sequence of attempts,
// gated attempt by attempt by the endpoint's circuit breaker.

#pragma once

#include "Rethink/CircuitBreaker.hpp"
#include "Rethink/CancellationToken.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include <string>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <random>

namespace Rethink {

/**
 * @brief Retry and backoff policy. Treated as immutable once built.
 *
 * Delay before attempt n+1 is base_delay * multiplier^(n-1) * (1 +/- jitter),
 * stretched by rate_limit_multiplier after a RATE_LIMITED failure and capped
 * at max_delay.
 */
struct RetryPolicy {
    size_t max_attempts = 3;                      ///< Attempts including the first one
    std::chrono::milliseconds base_delay{200};    ///< Delay after the first failure
    double multiplier = 2.0;                      ///< Exponential growth factor
    double jitter_fraction = 0.2;                 ///< Relative random spread, in [0, 1]
    std::chrono::milliseconds max_delay{5000};    ///< Upper bound of any single delay
    double rate_limit_multiplier = 3.0;           ///< Extra stretch after RATE_LIMITED
    std::function<bool(ErrorKind)> is_retryable;  ///< Classifier, defaults to defaultRetryable

    /**
     * @brief TRANSIENT and RATE_LIMITED are retryable, everything else is terminal
     */
    static bool defaultRetryable(ErrorKind kind);

    bool shouldRetry(ErrorKind kind) const;

    /**
     * @brief Backoff before the next attempt
     * @param attempt Number of the attempt that just failed (1-based)
     * @param kind Kind of that failure
     * @param jitter_sample Uniform sample in [-1, 1]
     */
    std::chrono::milliseconds computeDelay(size_t attempt, ErrorKind kind, double jitter_sample) const;
};

/**
 * @brief Counters kept by RetryExecutor
 */
struct RetryStatistics {
    size_t attempts = 0;                          ///< Upstream attempts actually made
    size_t retries = 0;                           ///< Attempts that followed a failure
    size_t circuit_rejections = 0;                ///< Calls refused by a breaker
    size_t terminal_failures = 0;                 ///< Non-retryable failures
    size_t exhausted = 0;                         ///< Sequences that ran out of attempts
    size_t cancelled = 0;                         ///< Sequences abandoned by cancellation
};

/**
 * @brief One upstream attempt; throws GenerationError on failure
 */
using AttemptFunction = std::function<std::string(const CancellationToken&)>;

class RetryExecutor {
public:
    explicit RetryExecutor(CircuitBreakerRegistry& registry);

    /**
     * @brief Run an attempt sequence against one endpoint
     *
     * Each attempt first asks the endpoint's breaker; a refusal throws
     * CircuitOpenError at once without spending an attempt. Completed
     * attempts are recorded on the breaker, cancelled ones are not.
     *
     * @param endpoint_id Breaker key
     * @param operation Attempt to run
     * @param policy Retry policy
     * @param token Cancellation for the whole sequence
     * @param deadline No attempt or backoff starts past this point
     * @return Text of the first successful attempt
     */
    std::string execute(const std::string& endpoint_id,
                        const AttemptFunction& operation,
                        const RetryPolicy& policy,
                        const CancellationToken& token,
                        std::chrono::steady_clock::time_point deadline =
                            std::chrono::steady_clock::time_point::max());

    RetryStatistics getStatistics() const;
    void resetStatistics();

private:
    double sampleJitter();

    CircuitBreakerRegistry& m_registry;

    std::mt19937 m_rng;
    std::mutex m_rng_mutex;

    std::atomic<size_t> m_attempts{0};
    std::atomic<size_t> m_retries{0};
    std::atomic<size_t> m_circuit_rejections{0};
    std::atomic<size_t> m_terminal_failures{0};
    std::atomic<size_t> m_exhausted{0};
    std::atomic<size_t> m_cancelled{0};
};

} // namespace Rethink
