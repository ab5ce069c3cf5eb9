// =================================================================
// src/Rethink/DefaultCollaborators.cpp
// =================================================================
// Implementation of the reference collaborators.

#include "Rethink/DefaultCollaborators.hpp"
#include "Rethink/ParallelThinkingScheduler.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace Rethink {

double HeuristicQualityEvaluator::score(const std::string& candidate_text, const std::string& context) {
    if (candidate_text.empty()) {
        return 0.0;
    }

    double score = 0.4; // Base score

    // Length appropriateness relative to the question
    double length_ratio = context.empty() ? 1.0
        : static_cast<double>(candidate_text.length()) / context.length();
    if (length_ratio >= 0.5 && length_ratio <= 20.0) {
        score += 0.2;
    }

    // Refusals and error echoes
    std::string lower_text = candidate_text;
    std::transform(lower_text.begin(), lower_text.end(), lower_text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower_text.find("error") == std::string::npos &&
        lower_text.find("sorry") == std::string::npos &&
        lower_text.find("unable") == std::string::npos) {
        score += 0.2;
    }

    // Basic sentence structure
    size_t sentence_count = std::count(candidate_text.begin(), candidate_text.end(), '.') +
                            std::count(candidate_text.begin(), candidate_text.end(), '!') +
                            std::count(candidate_text.begin(), candidate_text.end(), '?');
    if (sentence_count > 0) {
        score += 0.1;
    }

    // Stays on topic
    score += 0.1 * wordSimilarity(lower_text, context);

    return std::min(1.0, score);
}

double HeuristicQualityEvaluator::wordSimilarity(const std::string& first, const std::string& second) {
    std::string p1 = first;
    std::string p2 = second;
    std::transform(p1.begin(), p1.end(), p1.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    std::transform(p2.begin(), p2.end(), p2.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    std::regex word_regex(R"(\w+)");
    std::unordered_set<std::string> set1, set2;

    for (std::sregex_iterator it(p1.begin(), p1.end(), word_regex), end; it != end; ++it) {
        set1.insert(it->str());
    }
    for (std::sregex_iterator it(p2.begin(), p2.end(), word_regex), end; it != end; ++it) {
        set2.insert(it->str());
    }

    if (set1.empty() || set2.empty()) {
        return 0.0;
    }

    size_t intersection = 0;
    for (const auto& word : set1) {
        if (set2.count(word)) {
            intersection++;
        }
    }
    size_t union_size = set1.size() + set2.size() - intersection;

    return static_cast<double>(intersection) / union_size;
}

std::vector<ConversationMessage> TokenBudgetContextManager::trim(const std::vector<ConversationMessage>& history,
                                                                 size_t token_budget) {
    std::vector<ConversationMessage> kept;
    size_t used = 0;

    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        size_t cost = estimateTokens(it->role) + estimateTokens(it->content);
        if (used + cost > token_budget) {
            break;
        }
        used += cost;
        kept.push_back(*it);
    }

    std::reverse(kept.begin(), kept.end());
    return kept;
}

std::vector<ConversationMessage> InMemoryConversationStore::load(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_conversations.find(conversation_id);
    if (it == m_conversations.end()) {
        return {};
    }
    return it->second;
}

void InMemoryConversationStore::append(const std::string& conversation_id, const ConversationMessage& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_conversations[conversation_id].push_back(message);
}

size_t InMemoryConversationStore::getConversationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conversations.size();
}

} // namespace Rethink
