// =================================================================
// include/Rethink/StoppingStrategy.hpp
// =================================================================
// Refinement state and the closed set of stopping rules that decide,
// round by round, what to ask next and when to stop.

#pragma once

#include "Rethink/ParallelThinkingScheduler.hpp"
#include <string>
#include <vector>
#include <variant>

namespace Rethink {

/**
 * @brief Why a refinement loop ended
 */
enum class StopReason {
    NONE,               ///< Still running
    CONVERGED,          ///< Improvement fell below the convergence epsilon
    MAX_ROUNDS,         ///< Round limit reached
    BUDGET_EXHAUSTED,   ///< Call or token budget reached
    ROUND_FAILED        ///< A round failed entirely after earlier successes
};

std::string stopReasonToString(StopReason reason);

/**
 * @brief Available stopping rules
 */
enum class StoppingRule {
    ADAPTIVE,
    FIXED_DEPTH,
    BUDGET_CONSTRAINED
};

std::string stoppingRuleToString(StoppingRule rule);
StoppingRule stoppingRuleFromString(const std::string& name);

/**
 * @brief Cumulative upstream cost
 */
struct Cost {
    size_t calls = 0;
    size_t tokens = 0;
};

/**
 * @brief Progress of one think() call
 */
struct RefinementState {
    std::string conversation_id;
    std::string query;
    std::string history_text;                     ///< Trimmed history rendered for prompts
    std::vector<std::string> touched_endpoints;   ///< Endpoints candidates are routed to
    std::vector<ThinkingRound> rounds;            ///< Completed rounds, index strictly increasing
    bool has_best = false;
    std::string best_text;
    double best_score = 0.0;
    size_t best_round_index = 0;
    Cost total_cost;
    StopReason stop_reason = StopReason::NONE;
};

/**
 * @brief Limits shared by every stopping rule
 */
struct StopLimits {
    size_t max_rounds = 3;
    double convergence_epsilon = 0.05;
};

/**
 * @brief Stop on convergence or at the round limit
 */
struct AdaptiveStopping {
    std::string propose(const RefinementState& state) const;
    StopReason shouldStop(const RefinementState& state, const StopLimits& limits) const;
};

/**
 * @brief Always run max_rounds rounds
 */
struct FixedDepthStopping {
    std::string propose(const RefinementState& state) const;
    StopReason shouldStop(const RefinementState& state, const StopLimits& limits) const;
};

/**
 * @brief Adaptive, plus a stop once cumulative cost reaches a budget
 */
struct BudgetConstrainedStopping {
    size_t max_calls = 0;                         ///< 0 = unlimited
    size_t max_tokens = 0;                        ///< 0 = unlimited

    std::string propose(const RefinementState& state) const;
    StopReason shouldStop(const RefinementState& state, const StopLimits& limits) const;
};

using StoppingStrategy = std::variant<AdaptiveStopping, FixedDepthStopping, BudgetConstrainedStopping>;

/**
 * @brief Build the prompt of the next round
 */
std::string proposeNextPrompt(const StoppingStrategy& strategy, const RefinementState& state);

/**
 * @brief Decide whether the loop ends after the last completed round
 * @return StopReason::NONE to continue
 */
StopReason evaluateStop(const StoppingStrategy& strategy, const RefinementState& state, const StopLimits& limits);

StoppingRule getStoppingRule(const StoppingStrategy& strategy);

/**
 * @brief Create a strategy for a rule; the budget applies to BUDGET_CONSTRAINED only
 */
StoppingStrategy makeStoppingStrategy(StoppingRule rule, size_t max_calls = 0, size_t max_tokens = 0);

/**
 * @brief Prompt builder shared by all rules
 *
 * The first round asks the query with the conversation history; later rounds
 * include the best answer so far and its score and ask for an improvement.
 */
std::string buildRefinementPrompt(const RefinementState& state);

} // namespace Rethink
