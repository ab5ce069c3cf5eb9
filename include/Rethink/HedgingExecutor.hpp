// =================================================================
// include/Rethink/HedgingExecutor.hpp
// =================================================================
// Request hedging: delayed duplicate attempts, first success wins.

#pragma once

#include "Rethink/CancellationToken.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <future>
#include <mutex>
#include <atomic>

namespace Rethink {

/**
 * @brief Hedge batch configuration
 */
struct HedgeConfig {
    std::chrono::milliseconds hedge_delay{2000};  ///< Wait before each duplicate attempt
    size_t max_hedges = 1;                        ///< Duplicates allowed besides the primary
};

/**
 * @brief Accepted result of a hedge batch
 */
struct HedgeResult {
    std::string text;                             ///< Winning payload
    size_t winning_attempt = 0;                   ///< 0 for the primary, n for the n-th hedge
    size_t attempts_launched = 0;                 ///< Primary plus hedges issued
};

/**
 * @brief Counters kept by HedgingExecutor
 */
struct HedgeStatistics {
    size_t batches = 0;                           ///< Hedge batches executed
    size_t hedges_launched = 0;                   ///< Duplicate attempts issued
    size_t primary_wins = 0;                      ///< Batches won by the primary attempt
    size_t hedge_wins = 0;                        ///< Batches won by a duplicate
    size_t failed_batches = 0;                    ///< Batches where every attempt failed
    size_t cancelled_attempts = 0;                ///< Losing attempts cancelled
};

/**
 * @brief One attempt of a batch; throws on failure
 */
using HedgedAttempt = std::function<std::string(const CancellationToken&)>;

/**
 * @brief Runs hedge batches
 *
 * Each attempt runs on its own thread with a child cancellation token. When a
 * winner is known every other attempt is cancelled and the batch returns at
 * once; threads of losing attempts are kept until they finish and joined at
 * the latest by the destructor.
 */
class HedgingExecutor {
public:
    HedgingExecutor() = default;
    ~HedgingExecutor();

    HedgingExecutor(const HedgingExecutor&) = delete;
    HedgingExecutor& operator=(const HedgingExecutor&) = delete;

    /**
     * @brief Execute one hedge batch
     *
     * @param attempt Attempt body, invoked once per primary or hedge
     * @param config Hedge configuration
     * @param token Caller cancellation; cancels every attempt
     * @param deadline Batch deadline; overrun raises a TRANSIENT timeout
     * @return The first successful attempt
     * @throws The last failure by completion time when every attempt failed
     */
    HedgeResult executeHedged(const HedgedAttempt& attempt,
                              const HedgeConfig& config,
                              const CancellationToken& token,
                              std::chrono::steady_clock::time_point deadline =
                                  std::chrono::steady_clock::time_point::max());

    HedgeStatistics getStatistics() const;

    /**
     * @brief Number of cancelled attempts still running
     */
    size_t getPendingAbandoned();

private:
    void abandon(std::vector<std::future<void>>& futures);
    void reapAbandoned();

    std::vector<std::future<void>> m_abandoned;
    std::mutex m_abandoned_mutex;

    std::atomic<size_t> m_batches{0};
    std::atomic<size_t> m_hedges_launched{0};
    std::atomic<size_t> m_primary_wins{0};
    std::atomic<size_t> m_hedge_wins{0};
    std::atomic<size_t> m_failed_batches{0};
    std::atomic<size_t> m_cancelled_attempts{0};
};

} // namespace Rethink
