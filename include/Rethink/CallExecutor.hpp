// =================================================================
// include/Rethink/CallExecutor.hpp
// =================================================================
// One logical upstream call: breaker gating, retries and hedging.

#pragma once

#include "Rethink/GenerationProvider.hpp"
#include "Rethink/CircuitBreaker.hpp"
#include "Rethink/RetryExecutor.hpp"
#include "Rethink/HedgingExecutor.hpp"
#include <string>
#include <memory>
#include <chrono>

namespace Rethink {

/**
 * @brief Resilience options for one logical call
 */
struct CallOptions {
    RetryPolicy retry_policy;                     ///< Retry policy of each attempt sequence
    HedgeConfig hedge_config;                     ///< Hedge batch configuration
    bool enable_hedging = true;                   ///< False forces max_hedges = 0
    std::chrono::milliseconds deadline{60000};    ///< Overall per-call deadline
};

/**
 * @brief Result of a successful logical call
 */
struct CallOutcome {
    std::string text;                             ///< Generated text
    std::string endpoint_id;                      ///< Endpoint that served the call
    size_t attempts_launched = 0;                 ///< Primary plus hedges issued
    size_t winning_attempt = 0;                   ///< 0 for primary, n for the n-th hedge
    std::chrono::milliseconds latency{0};         ///< Wall time of the call
};

/**
 * @brief Composes the resilience layers in a fixed order
 *
 * The breaker gates every attempt, the retry executor wraps one attempt
 * sequence, and the hedging executor wraps a batch of such sequences. A
 * failed batch is not retried here.
 */
class CallExecutor {
public:
    explicit CallExecutor(CircuitBreakerRegistry& registry);

    /**
     * @brief Execute one logical call
     * @param provider Upstream provider; its endpoint id selects the breaker
     * @param prompt Prompt text
     * @param params Generation parameters
     * @param options Retry, hedge and deadline options
     * @param token Caller cancellation
     * @return Outcome of the winning attempt
     * @throws GenerationError (including CircuitOpenError and CancelledError)
     */
    CallOutcome call(const std::shared_ptr<GenerationProvider>& provider,
                     const std::string& prompt,
                     const GenerationParams& params,
                     const CallOptions& options,
                     const CancellationToken& token);

    CircuitBreakerRegistry& getRegistry() { return m_registry; }
    RetryStatistics getRetryStatistics() const { return m_retry.getStatistics(); }
    HedgeStatistics getHedgeStatistics() const { return m_hedging.getStatistics(); }

private:
    CircuitBreakerRegistry& m_registry;
    // Declared before m_hedging so that abandoned hedge attempts, joined by
    // ~HedgingExecutor, never outlive it
    RetryExecutor m_retry;
    HedgingExecutor m_hedging;
};

} // namespace Rethink
