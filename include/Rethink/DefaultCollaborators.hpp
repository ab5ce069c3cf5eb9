// =================================================================
// include/Rethink/DefaultCollaborators.hpp
// =================================================================
// Reference implementations of the quality evaluator, context
// manager and conversation store used by the command-line front end.

#pragma once

#include "Rethink/GenerationProvider.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace Rethink {

/**
 * @brief Heuristic scorer based on length, refusal phrases, structure and
 *        word overlap with the question
 */
class HeuristicQualityEvaluator : public QualityEvaluator {
public:
    double score(const std::string& candidate_text, const std::string& context) override;

    /**
     * @brief Jaccard index of the word sets of two texts
     */
    static double wordSimilarity(const std::string& first, const std::string& second);
};

/**
 * @brief Keeps the newest messages that fit in the token budget
 *
 * Tokens are estimated at four characters each. Order is preserved.
 */
class TokenBudgetContextManager : public ContextManager {
public:
    std::vector<ConversationMessage> trim(const std::vector<ConversationMessage>& history,
                                          size_t token_budget) override;
};

/**
 * @brief Thread-safe process-local conversation history
 */
class InMemoryConversationStore : public ConversationStore {
public:
    std::vector<ConversationMessage> load(const std::string& conversation_id) override;
    void append(const std::string& conversation_id, const ConversationMessage& message) override;

    size_t getConversationCount() const;

private:
    std::unordered_map<std::string, std::vector<ConversationMessage>> m_conversations;
    mutable std::mutex m_mutex;
};

} // namespace Rethink
