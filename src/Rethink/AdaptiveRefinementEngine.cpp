// =================================================================
// src/Rethink/AdaptiveRefinementEngine.cpp
// =================================================================
// Implementation of the adaptive refinement engine.

#include "Rethink/AdaptiveRefinementEngine.hpp"
#include "Rethink/Logger.hpp"
#include <sstream>
#include <stdexcept>

namespace Rethink {

void ThinkConfig::validate() const {
    if (max_rounds == 0) {
        throw std::invalid_argument("max_rounds must be at least 1");
    }
    if (fanout == 0) {
        throw std::invalid_argument("fanout must be at least 1");
    }
    if (convergence_epsilon < 0.0) {
        throw std::invalid_argument("convergence_epsilon must not be negative");
    }
    if (token_budget == 0) {
        throw std::invalid_argument("token_budget must be positive");
    }
    if (retry_policy.max_attempts == 0) {
        throw std::invalid_argument("retry max_attempts must be at least 1");
    }
    if (retry_policy.multiplier < 1.0) {
        throw std::invalid_argument("retry multiplier must be at least 1.0");
    }
    if (retry_policy.jitter_fraction < 0.0 || retry_policy.jitter_fraction > 1.0) {
        throw std::invalid_argument("retry jitter_fraction must be within [0, 1]");
    }
    if (call_deadline.count() <= 0) {
        throw std::invalid_argument("call_deadline must be positive");
    }
    if (cache_ttl.count() <= 0) {
        throw std::invalid_argument("cache_ttl must be positive");
    }
    if (failure_policy.quorum == 0 || failure_policy.quorum > fanout) {
        throw std::invalid_argument("quorum must be between 1 and the fanout");
    }
}

AdaptiveRefinementEngine::AdaptiveRefinementEngine(ParallelThinkingScheduler& scheduler,
                                                   CircuitBreakerRegistry& registry,
                                                   std::shared_ptr<ContextManager> context_manager,
                                                   std::shared_ptr<ConversationStore> conversation_store,
                                                   const StoppingStrategy& strategy)
    : m_scheduler(scheduler), m_registry(registry),
      m_context_manager(std::move(context_manager)),
      m_conversation_store(std::move(conversation_store)),
      m_strategy(strategy) {
    if (!m_context_manager) {
        throw std::invalid_argument("AdaptiveRefinementEngine requires a context manager");
    }
    if (!m_conversation_store) {
        throw std::invalid_argument("AdaptiveRefinementEngine requires a conversation store");
    }

    Logger::getInstance().info("RefinementEngine", "Initialized",
        "Stopping rule: " + stoppingRuleToString(getStoppingRule()));
}

FinalAnswer AdaptiveRefinementEngine::think(const std::string& query,
                                            const std::string& conversation_id,
                                            const ThinkConfig& config,
                                            const CancellationToken& token) {
    config.validate();
    if (query.empty()) {
        throw std::invalid_argument("query must not be empty");
    }
    token.throwIfCancelled();

    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().info("RefinementEngine", "Thinking on conversation " + conversation_id,
        "Max rounds: " + std::to_string(config.max_rounds) + ", Fanout: " + std::to_string(config.fanout) +
        ", Epsilon: " + std::to_string(config.convergence_epsilon));

    // Propose: frame the question with the trimmed history
    std::vector<ConversationMessage> history = m_conversation_store->load(conversation_id);
    std::vector<ConversationMessage> trimmed = m_context_manager->trim(history, config.token_budget);

    RefinementState state;
    state.conversation_id = conversation_id;
    state.query = query;
    state.history_text = renderHistory(trimmed);

    // Candidate i is routed to endpoint i % n
    std::vector<std::string> endpoint_ids = m_scheduler.getEndpointIds();
    for (size_t i = 0; i < endpoint_ids.size() && i < config.fanout; ++i) {
        state.touched_endpoints.push_back(endpoint_ids[i]);
    }

    StopLimits limits;
    limits.max_rounds = config.max_rounds;
    limits.convergence_epsilon = config.convergence_epsilon;

    std::string failure_message;

    while (state.stop_reason == StopReason::NONE) {
        token.throwIfCancelled();

        RoundInput input = buildRoundInput(state, config);

        ThinkingRound round;
        try {
            round = m_scheduler.runRound(input, config.fanout, config.failure_policy, token);
        } catch (const AllCandidatesFailedError& e) {
            if (!state.has_best) {
                Logger::getInstance().error("RefinementEngine",
                    "First round failed, no answer to return", e.what());
                throw;
            }
            Logger::getInstance().warning("RefinementEngine",
                "Round " + std::to_string(input.round_index) + " failed, returning best answer so far",
                e.what());
            failure_message = e.what();
            state.stop_reason = StopReason::ROUND_FAILED;
            break;
        }

        recordRound(state, std::move(round));
        state.stop_reason = evaluateStop(m_strategy, state, limits);
    }

    FinalAnswer answer = buildFinalAnswer(state);
    answer.failure_message = failure_message;

    m_conversation_store->append(conversation_id, {"user", query});
    m_conversation_store->append(conversation_id, {"assistant", answer.text});

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().info("RefinementEngine", "Finished thinking on conversation " + conversation_id,
        "Rounds: " + std::to_string(answer.rounds_used) +
        ", Stop reason: " + stopReasonToString(answer.stop_reason) +
        ", Best round: " + std::to_string(answer.best_round_index) +
        ", Calls: " + std::to_string(answer.total_cost.calls) +
        ", Duration: " + std::to_string(duration.count()) + "ms");

    return answer;
}

RoundInput AdaptiveRefinementEngine::buildRoundInput(const RefinementState& state,
                                                     const ThinkConfig& config) const {
    RoundInput input;
    input.round_index = state.rounds.size();
    input.prompt = proposeNextPrompt(m_strategy, state);
    input.context_snapshot = state.history_text;
    input.evaluation_context = state.query;
    input.params = config.generation_params;
    // Seeds never repeat across rounds of one think()
    input.params.seed = config.generation_params.seed + static_cast<int>(input.round_index * config.fanout);
    input.call_options.retry_policy = config.retry_policy;
    input.call_options.hedge_config = config.hedge_config;
    input.call_options.enable_hedging = config.enable_hedging;
    input.call_options.deadline = config.call_deadline;
    input.cache_ttl = config.cache_ttl;
    return input;
}

void AdaptiveRefinementEngine::recordRound(RefinementState& state, ThinkingRound round) const {
    state.total_cost.calls += round.total_calls;
    state.total_cost.tokens += round.total_tokens;

    // Evaluate: strictly better replaces, so ties keep the earlier round
    if (!state.has_best || round.selected_score > state.best_score) {
        state.has_best = true;
        state.best_text = round.selected_output;
        state.best_score = round.selected_score;
        state.best_round_index = round.round_index;
    }

    Logger::getInstance().debug("RefinementEngine",
        "Round " + std::to_string(round.round_index) + " scored " + std::to_string(round.selected_score),
        "Best so far: " + std::to_string(state.best_score) + " (round " +
        std::to_string(state.best_round_index) + ")");

    state.rounds.push_back(std::move(round));
}

FinalAnswer AdaptiveRefinementEngine::buildFinalAnswer(RefinementState& state) const {
    FinalAnswer answer;
    answer.text = state.best_text;
    answer.rounds_used = state.rounds.size();
    answer.total_cost = state.total_cost;
    answer.recursion_failed = state.stop_reason == StopReason::ROUND_FAILED;
    answer.stop_reason = state.stop_reason;
    answer.best_round_index = state.best_round_index;
    answer.best_score = state.best_score;

    for (const auto& endpoint_id : state.touched_endpoints) {
        answer.breaker_states[endpoint_id] = m_registry.getState(endpoint_id);
    }

    answer.rounds = std::move(state.rounds);
    return answer;
}

std::string AdaptiveRefinementEngine::renderHistory(const std::vector<ConversationMessage>& history) {
    std::ostringstream oss;
    for (const auto& message : history) {
        oss << message.role << ": " << message.content << "\n";
    }
    return oss.str();
}

} // namespace Rethink
