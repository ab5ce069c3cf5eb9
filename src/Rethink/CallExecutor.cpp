// =================================================================
// src/Rethink/CallExecutor.cpp
// =================================================================
// Implementation of the call executor.

#include "Rethink/CallExecutor.hpp"
#include "Rethink/Logger.hpp"
#include <stdexcept>

namespace Rethink {

CallExecutor::CallExecutor(CircuitBreakerRegistry& registry)
    : m_registry(registry), m_retry(registry) {}

CallOutcome CallExecutor::call(const std::shared_ptr<GenerationProvider>& provider,
                               const std::string& prompt,
                               const GenerationParams& params,
                               const CallOptions& options,
                               const CancellationToken& token) {
    if (!provider) {
        throw std::invalid_argument("CallExecutor requires a generation provider");
    }

    auto start_time = std::chrono::steady_clock::now();
    auto deadline = start_time + options.deadline;
    std::string endpoint_id = provider->getEndpointId();

    auto policy = std::make_shared<const RetryPolicy>(options.retry_policy);
    RetryExecutor* retry = &m_retry;

    HedgedAttempt attempt = [retry, provider, endpoint_id, prompt, params, policy, deadline]
                            (const CancellationToken& attempt_token) {
        return retry->execute(endpoint_id,
            [&](const CancellationToken& inner_token) {
                return provider->generate(prompt, params, inner_token);
            },
            *policy, attempt_token, deadline);
    };

    HedgeConfig hedge_config = options.hedge_config;
    if (!options.enable_hedging) {
        hedge_config.max_hedges = 0;
    }

    HedgeResult result = m_hedging.executeHedged(attempt, hedge_config, token, deadline);

    CallOutcome outcome;
    outcome.text = std::move(result.text);
    outcome.endpoint_id = endpoint_id;
    outcome.attempts_launched = result.attempts_launched;
    outcome.winning_attempt = result.winning_attempt;
    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().debug("CallExecutor", "Call completed on " + endpoint_id,
        "Latency: " + std::to_string(outcome.latency.count()) + "ms, Attempts launched: " +
        std::to_string(outcome.attempts_launched));
    return outcome;
}

} // namespace Rethink
