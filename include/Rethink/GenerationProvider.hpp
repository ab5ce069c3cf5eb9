// =================================================================
// include/Rethink/GenerationProvider.hpp
// =================================================================
// Interfaces of the collaborators consumed by the refinement core:
// the upstream text generator, the quality evaluator, the context
// trimmer and the conversation history store.

#pragma once

#include "Rethink/CancellationToken.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <chrono>

namespace Rethink {

/**
 * @brief Sampling parameters forwarded to the upstream provider
 */
struct GenerationParams {
    int max_tokens = 2048;                        ///< Maximum output tokens
    double temperature = 0.7;                     ///< Sampling temperature
    int seed = 0;                                 ///< Candidate seed / variant
    std::chrono::milliseconds timeout{60000};     ///< Transport timeout for one attempt
    std::unordered_map<std::string, std::string> extra; ///< Provider-specific options
};

/**
 * @brief Upstream text generation service
 *
 * Implementations report failures by throwing GenerationError with one of
 * TRANSIENT, RATE_LIMITED, INVALID_REQUEST or UNAUTHORIZED. The token is
 * advisory: a provider that can stop early should poll it.
 */
class GenerationProvider {
public:
    virtual ~GenerationProvider() = default;

    virtual std::string generate(const std::string& prompt,
                                 const GenerationParams& params,
                                 const CancellationToken& token) = 0;

    /**
     * @brief Endpoint key used to select the circuit breaker
     */
    virtual std::string getEndpointId() const = 0;
};

/**
 * @brief Scores a candidate answer in [0, 1]
 */
class QualityEvaluator {
public:
    virtual ~QualityEvaluator() = default;
    virtual double score(const std::string& candidate_text, const std::string& context) = 0;
};

/**
 * @brief One turn of conversation history
 */
struct ConversationMessage {
    std::string role;                             ///< "user" or "assistant"
    std::string content;                          ///< Message text
};

/**
 * @brief Token-budget history compression
 */
class ContextManager {
public:
    virtual ~ContextManager() = default;
    virtual std::vector<ConversationMessage> trim(const std::vector<ConversationMessage>& history,
                                                  size_t token_budget) = 0;
};

/**
 * @brief Storage of conversation history keyed by conversation id
 */
class ConversationStore {
public:
    virtual ~ConversationStore() = default;
    virtual std::vector<ConversationMessage> load(const std::string& conversation_id) = 0;
    virtual void append(const std::string& conversation_id, const ConversationMessage& message) = 0;
};

} // namespace Rethink
