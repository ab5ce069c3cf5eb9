// =================================================================
// include/Rethink/ParallelThinkingScheduler.hpp
// =================================================================
// Fans one thinking round out into concurrent candidate generations
// and reconciles them under a partial-failure policy.

#pragma once

#include "Rethink/GenerationProvider.hpp"
#include "Rethink/CallExecutor.hpp"
#include "Rethink/CacheCoordinator.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <limits>

namespace Rethink {

/**
 * @brief Everything a round needs to issue its candidates
 */
struct RoundInput {
    size_t round_index = 0;                       ///< Index of the round within the conversation
    std::string prompt;                           ///< Prompt sent upstream
    std::string context_snapshot;                 ///< Rendered trimmed history, part of the cache key
    std::string evaluation_context;               ///< Context handed to the quality evaluator
    GenerationParams params;                      ///< Base parameters; the seed is offset per candidate
    CallOptions call_options;                     ///< Retry, hedge and deadline options of each call
    std::chrono::milliseconds cache_ttl{3600000}; ///< TTL of cached candidates
};

/**
 * @brief Outcome of one candidate generation
 */
struct CandidateOutcome {
    size_t candidate_index = 0;                   ///< Submission index within the round
    std::string endpoint_id;                      ///< Endpoint the candidate was routed to
    bool success = false;
    std::string text;                             ///< Payload on success
    ErrorKind error_kind = ErrorKind::TRANSIENT;  ///< Failure kind when !success
    std::string error_message;
    double score = 0.0;                           ///< Quality score in [0, 1]
    std::chrono::milliseconds latency{0};
    bool cache_hit = false;                       ///< Served from cache or an in-flight twin
    size_t calls = 0;                             ///< Upstream attempts issued, 0 when cached
    size_t tokens = 0;                            ///< Estimated tokens, 0 when cached
    size_t completion_rank = 0;                   ///< Position in completion order
};

/**
 * @brief Result of a completed round
 */
struct ThinkingRound {
    size_t round_index = 0;
    RoundInput input;
    std::vector<CandidateOutcome> candidates;     ///< Ordered by candidate index
    std::vector<size_t> completion_order;         ///< Candidate indices as they completed
    size_t selected_index = 0;
    std::string selected_output;
    double selected_score = 0.0;
    size_t attempts = 1;                          ///< Round attempts including retries
    size_t total_calls = 0;
    size_t total_tokens = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief How many candidate failures a round tolerates
 */
struct PartialFailurePolicy {
    size_t quorum = 1;                            ///< Successful candidates required
    size_t round_retry_limit = 1;                 ///< Round retries before giving up
};

/**
 * @brief Scheduler configuration
 */
struct SchedulerConfig {
    size_t max_fanout = 8;                        ///< Upper bound of concurrent candidates
};

class ParallelThinkingScheduler {
public:
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    /**
     * @param providers Endpoints; candidate i goes to providers[i % size]
     * @param executor Resilient call path
     * @param cache Single-flight cache in front of the executor
     * @param evaluator Quality scorer
     * @param config Scheduler limits
     */
    ParallelThinkingScheduler(std::vector<std::shared_ptr<GenerationProvider>> providers,
                              CallExecutor& executor,
                              CacheCoordinator& cache,
                              std::shared_ptr<QualityEvaluator> evaluator,
                              const SchedulerConfig& config = SchedulerConfig());

    /**
     * @brief Run one round of fanout concurrent candidates
     *
     * The round succeeds once at least policy.quorum candidates succeed;
     * otherwise it is rerun up to policy.round_retry_limit times.
     *
     * @throws std::invalid_argument on fanout 0 or above max_fanout
     * @throws AllCandidatesFailedError when the quorum is never met
     * @throws CancelledError when the token is cancelled
     */
    ThinkingRound runRound(const RoundInput& input,
                           size_t fanout,
                           const PartialFailurePolicy& policy,
                           const CancellationToken& token);

    /**
     * @brief Highest score, then lowest latency, then lowest index
     * @return Index into candidates, npos if none succeeded
     */
    static size_t selectCandidate(const std::vector<CandidateOutcome>& candidates);

    std::vector<std::string> getEndpointIds() const;
    const SchedulerConfig& getConfig() const { return m_config; }

private:
    struct Attempt {
        std::vector<CandidateOutcome> candidates;
        std::vector<size_t> completion_order;
    };

    Attempt runCandidates(const RoundInput& input, size_t fanout, const CancellationToken& token);

    CandidateOutcome runCandidate(const RoundInput& input, size_t candidate_index,
                                  const CancellationToken& token);

    std::vector<std::shared_ptr<GenerationProvider>> m_providers;
    CallExecutor& m_executor;
    CacheCoordinator& m_cache;
    std::shared_ptr<QualityEvaluator> m_evaluator;
    SchedulerConfig m_config;
};

/**
 * @brief Rough token estimate used for cost accounting (4 chars per token)
 */
size_t estimateTokens(const std::string& text);

} // namespace Rethink
