// =================================================================
// src/Rethink/StoppingStrategy.cpp
// =================================================================
// Implementation of the stopping rules and refinement prompts.

#include "Rethink/StoppingStrategy.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Rethink {

namespace {

bool hasConverged(const RefinementState& state, double epsilon) {
    if (state.rounds.size() < 2) {
        return false;
    }
    double current = state.rounds[state.rounds.size() - 1].selected_score;
    double previous = state.rounds[state.rounds.size() - 2].selected_score;
    return (current - previous) < epsilon;
}

bool reachedRoundLimit(const RefinementState& state, const StopLimits& limits) {
    return state.rounds.size() >= limits.max_rounds;
}

} // namespace

std::string stopReasonToString(StopReason reason) {
    switch (reason) {
        case StopReason::NONE: return "NONE";
        case StopReason::CONVERGED: return "CONVERGED";
        case StopReason::MAX_ROUNDS: return "MAX_ROUNDS";
        case StopReason::BUDGET_EXHAUSTED: return "BUDGET_EXHAUSTED";
        case StopReason::ROUND_FAILED: return "ROUND_FAILED";
    }
    return "UNKNOWN";
}

std::string stoppingRuleToString(StoppingRule rule) {
    switch (rule) {
        case StoppingRule::ADAPTIVE: return "adaptive";
        case StoppingRule::FIXED_DEPTH: return "fixed_depth";
        case StoppingRule::BUDGET_CONSTRAINED: return "budget_constrained";
    }
    return "unknown";
}

StoppingRule stoppingRuleFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "adaptive") return StoppingRule::ADAPTIVE;
    if (lower == "fixed_depth") return StoppingRule::FIXED_DEPTH;
    if (lower == "budget_constrained") return StoppingRule::BUDGET_CONSTRAINED;

    throw std::invalid_argument("Unknown stopping rule: " + name);
}

std::string buildRefinementPrompt(const RefinementState& state) {
    std::ostringstream prompt;

    if (!state.history_text.empty()) {
        prompt << "Conversation so far:\n" << state.history_text << "\n";
    }

    if (!state.has_best) {
        prompt << "Question:\n" << state.query << "\n\n"
               << "Answer the question thoroughly and accurately.";
        return prompt.str();
    }

    prompt << "Question:\n" << state.query << "\n\n"
           << "Best answer so far (quality score " << std::fixed << std::setprecision(2)
           << state.best_score << " of 1.00):\n"
           << state.best_text << "\n\n"
           << "Write an improved answer. Fix any mistakes, fill gaps and keep what is already correct.";
    return prompt.str();
}

std::string AdaptiveStopping::propose(const RefinementState& state) const {
    return buildRefinementPrompt(state);
}

StopReason AdaptiveStopping::shouldStop(const RefinementState& state, const StopLimits& limits) const {
    if (hasConverged(state, limits.convergence_epsilon)) {
        return StopReason::CONVERGED;
    }
    if (reachedRoundLimit(state, limits)) {
        return StopReason::MAX_ROUNDS;
    }
    return StopReason::NONE;
}

std::string FixedDepthStopping::propose(const RefinementState& state) const {
    return buildRefinementPrompt(state);
}

StopReason FixedDepthStopping::shouldStop(const RefinementState& state, const StopLimits& limits) const {
    return reachedRoundLimit(state, limits) ? StopReason::MAX_ROUNDS : StopReason::NONE;
}

std::string BudgetConstrainedStopping::propose(const RefinementState& state) const {
    return buildRefinementPrompt(state);
}

StopReason BudgetConstrainedStopping::shouldStop(const RefinementState& state, const StopLimits& limits) const {
    StopReason reason = AdaptiveStopping().shouldStop(state, limits);
    if (reason != StopReason::NONE) {
        return reason;
    }

    bool calls_spent = max_calls > 0 && state.total_cost.calls >= max_calls;
    bool tokens_spent = max_tokens > 0 && state.total_cost.tokens >= max_tokens;
    return (calls_spent || tokens_spent) ? StopReason::BUDGET_EXHAUSTED : StopReason::NONE;
}

std::string proposeNextPrompt(const StoppingStrategy& strategy, const RefinementState& state) {
    return std::visit([&state](const auto& rule) { return rule.propose(state); }, strategy);
}

StopReason evaluateStop(const StoppingStrategy& strategy, const RefinementState& state, const StopLimits& limits) {
    return std::visit([&state, &limits](const auto& rule) { return rule.shouldStop(state, limits); }, strategy);
}

StoppingRule getStoppingRule(const StoppingStrategy& strategy) {
    switch (strategy.index()) {
        case 1: return StoppingRule::FIXED_DEPTH;
        case 2: return StoppingRule::BUDGET_CONSTRAINED;
        default: return StoppingRule::ADAPTIVE;
    }
}

StoppingStrategy makeStoppingStrategy(StoppingRule rule, size_t max_calls, size_t max_tokens) {
    switch (rule) {
        case StoppingRule::FIXED_DEPTH:
            return FixedDepthStopping{};
        case StoppingRule::BUDGET_CONSTRAINED: {
            BudgetConstrainedStopping budget;
            budget.max_calls = max_calls;
            budget.max_tokens = max_tokens;
            return budget;
        }
        case StoppingRule::ADAPTIVE:
            break;
    }
    return AdaptiveStopping{};
}

} // namespace Rethink
