// =================================================================
// include/Rethink/AdaptiveRefinementEngine.hpp
// =================================================================
// Multi-round refinement loop: propose, generate, evaluate, decide.

#pragma once

#include "Rethink/StoppingStrategy.hpp"
#include "Rethink/ParallelThinkingScheduler.hpp"
#include "Rethink/CircuitBreaker.hpp"
#include "Rethink/GenerationProvider.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <chrono>

namespace Rethink {

/**
 * @brief Per-call configuration of think()
 */
struct ThinkConfig {
    size_t max_rounds = 3;                        ///< Hard upper bound of rounds
    size_t fanout = 3;                            ///< Candidates per round
    double convergence_epsilon = 0.05;            ///< Minimum improvement to keep going
    size_t token_budget = 4096;                   ///< History budget passed to the context manager
    HedgeConfig hedge_config;
    RetryPolicy retry_policy;
    bool enable_hedging = true;
    std::chrono::milliseconds call_deadline{60000};
    std::chrono::milliseconds cache_ttl{3600000};
    PartialFailurePolicy failure_policy;
    GenerationParams generation_params;

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

/**
 * @brief Result of think() with provenance
 */
struct FinalAnswer {
    std::string text;                             ///< Best answer across all rounds
    size_t rounds_used = 0;                       ///< Rounds that completed
    Cost total_cost;                              ///< Calls and tokens spent
    std::map<std::string, BreakerState> breaker_states; ///< Endpoints touched, state at return
    bool recursion_failed = false;                ///< Loop ended early on a failed round
    std::string failure_message;                  ///< Failure that ended the loop, if any
    StopReason stop_reason = StopReason::NONE;
    size_t best_round_index = 0;
    double best_score = 0.0;
    std::vector<ThinkingRound> rounds;            ///< Completed rounds in order
};

class AdaptiveRefinementEngine {
public:
    /**
     * @param scheduler Round scheduler
     * @param registry Breaker registry, read for provenance
     * @param context_manager History trimmer
     * @param conversation_store History storage
     * @param strategy Stopping rule, fixed for the engine's lifetime
     */
    AdaptiveRefinementEngine(ParallelThinkingScheduler& scheduler,
                             CircuitBreakerRegistry& registry,
                             std::shared_ptr<ContextManager> context_manager,
                             std::shared_ptr<ConversationStore> conversation_store,
                             const StoppingStrategy& strategy = AdaptiveStopping{});

    /**
     * @brief Refine an answer to a query over several rounds
     *
     * @param query User question
     * @param conversation_id Conversation whose history frames the question
     * @param config Loop and resilience configuration
     * @param token Caller cancellation
     * @return Best answer observed across the rounds
     * @throws AllCandidatesFailedError when no round ever succeeded
     * @throws CancelledError when cancelled
     * @throws std::invalid_argument on an invalid config
     */
    FinalAnswer think(const std::string& query,
                      const std::string& conversation_id,
                      const ThinkConfig& config,
                      const CancellationToken& token = CancellationToken());

    StoppingRule getStoppingRule() const { return Rethink::getStoppingRule(m_strategy); }

    static std::string renderHistory(const std::vector<ConversationMessage>& history);

private:
    RoundInput buildRoundInput(const RefinementState& state, const ThinkConfig& config) const;
    void recordRound(RefinementState& state, ThinkingRound round) const;
    FinalAnswer buildFinalAnswer(RefinementState& state) const;

    ParallelThinkingScheduler& m_scheduler;
    CircuitBreakerRegistry& m_registry;
    std::shared_ptr<ContextManager> m_context_manager;
    std::shared_ptr<ConversationStore> m_conversation_store;
    StoppingStrategy m_strategy;
};

} // namespace Rethink
