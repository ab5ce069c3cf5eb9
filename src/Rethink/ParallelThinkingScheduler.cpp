// =================================================================
// src/Rethink/ParallelThinkingScheduler.cpp
// =================================================================
// Implementation of the parallel thinking scheduler.

#include "Rethink/ParallelThinkingScheduler.hpp"
#include "Rethink/Logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>

namespace Rethink {

size_t estimateTokens(const std::string& text) {
    return (text.size() + 3) / 4;
}

ParallelThinkingScheduler::ParallelThinkingScheduler(std::vector<std::shared_ptr<GenerationProvider>> providers,
                                                     CallExecutor& executor,
                                                     CacheCoordinator& cache,
                                                     std::shared_ptr<QualityEvaluator> evaluator,
                                                     const SchedulerConfig& config)
    : m_providers(std::move(providers)), m_executor(executor), m_cache(cache),
      m_evaluator(std::move(evaluator)), m_config(config) {
    if (m_providers.empty()) {
        throw std::invalid_argument("ParallelThinkingScheduler requires at least one provider");
    }
    for (const auto& provider : m_providers) {
        if (!provider) {
            throw std::invalid_argument("ParallelThinkingScheduler received a null provider");
        }
    }
    if (!m_evaluator) {
        throw std::invalid_argument("ParallelThinkingScheduler requires a quality evaluator");
    }
    if (m_config.max_fanout == 0) {
        throw std::invalid_argument("max_fanout must be at least 1");
    }
}

ThinkingRound ParallelThinkingScheduler::runRound(const RoundInput& input,
                                                  size_t fanout,
                                                  const PartialFailurePolicy& policy,
                                                  const CancellationToken& token) {
    if (fanout == 0 || fanout > m_config.max_fanout) {
        throw std::invalid_argument("fanout must be between 1 and " + std::to_string(m_config.max_fanout) +
                                    ", got " + std::to_string(fanout));
    }
    if (policy.quorum == 0 || policy.quorum > fanout) {
        throw std::invalid_argument("quorum must be between 1 and the fanout");
    }

    auto start_time = std::chrono::steady_clock::now();
    size_t max_attempts = policy.round_retry_limit + 1;

    ErrorKind last_kind = ErrorKind::TRANSIENT;
    std::string last_message = "no candidate completed";

    for (size_t attempt = 1; attempt <= max_attempts; ++attempt) {
        token.throwIfCancelled();

        Logger::getInstance().debug("ParallelScheduler",
            "Starting round " + std::to_string(input.round_index) + " attempt " + std::to_string(attempt),
            "Fanout: " + std::to_string(fanout));

        Attempt result = runCandidates(input, fanout, token);

        // Candidates of a cancelled round fail with CANCELLED; report the cancellation itself
        token.throwIfCancelled();

        size_t succeeded = 0;
        for (const auto& candidate : result.candidates) {
            if (candidate.success) {
                succeeded++;
            }
        }

        if (succeeded >= policy.quorum) {
            ThinkingRound round;
            round.round_index = input.round_index;
            round.input = input;
            round.attempts = attempt;
            round.selected_index = selectCandidate(result.candidates);

            const CandidateOutcome& selected = result.candidates[round.selected_index];
            round.selected_output = selected.text;
            round.selected_score = selected.score;

            for (const auto& candidate : result.candidates) {
                round.total_calls += candidate.calls;
                round.total_tokens += candidate.tokens;
            }
            round.candidates = std::move(result.candidates);
            round.completion_order = std::move(result.completion_order);
            round.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);

            Logger::getInstance().logRoundSummary(round.round_index, succeeded, fanout,
                                                  round.selected_score, round.duration.count());
            return round;
        }

        // Report the failure that completed last
        for (auto it = result.completion_order.rbegin(); it != result.completion_order.rend(); ++it) {
            const CandidateOutcome& candidate = result.candidates[*it];
            if (!candidate.success) {
                last_kind = candidate.error_kind;
                last_message = candidate.error_message;
                break;
            }
        }

        Logger::getInstance().warning("ParallelScheduler",
            "Round " + std::to_string(input.round_index) + " missed its quorum",
            "Succeeded: " + std::to_string(succeeded) + "/" + std::to_string(fanout) +
            ", Attempt: " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
            ", Last error: " + last_message);
    }

    Logger::getInstance().error("ParallelScheduler",
        "All candidates failed in round " + std::to_string(input.round_index),
        "Last error kind: " + errorKindToString(last_kind));
    throw AllCandidatesFailedError(input.round_index, max_attempts, last_kind, last_message);
}

ParallelThinkingScheduler::Attempt ParallelThinkingScheduler::runCandidates(const RoundInput& input,
                                                                            size_t fanout,
                                                                            const CancellationToken& token) {
    std::mutex completion_mutex;
    std::condition_variable completion_cv;
    std::vector<size_t> completed;

    std::vector<std::future<CandidateOutcome>> futures;
    futures.reserve(fanout);

    for (size_t i = 0; i < fanout; ++i) {
        futures.push_back(std::async(std::launch::async,
            [this, &input, i, &token, &completion_mutex, &completion_cv, &completed]() {
                CandidateOutcome outcome = runCandidate(input, i, token);
                {
                    std::lock_guard<std::mutex> lock(completion_mutex);
                    outcome.completion_rank = completed.size();
                    completed.push_back(i);
                }
                completion_cv.notify_one();
                return outcome;
            }));
    }

    // Collect in completion order
    Attempt attempt;
    attempt.candidates.resize(fanout);
    size_t collected = 0;
    while (collected < fanout) {
        size_t index = 0;
        {
            std::unique_lock<std::mutex> lock(completion_mutex);
            completion_cv.wait(lock, [&completed, collected]() { return completed.size() > collected; });
            index = completed[collected];
        }

        attempt.candidates[index] = futures[index].get();
        attempt.completion_order.push_back(index);
        collected++;

        const CandidateOutcome& outcome = attempt.candidates[index];
        if (outcome.success) {
            Logger::getInstance().debug("ParallelScheduler",
                "Candidate " + std::to_string(index) + " completed",
                "Score: " + std::to_string(outcome.score) + ", Latency: " +
                std::to_string(outcome.latency.count()) + "ms" + (outcome.cache_hit ? ", cached" : ""));
        } else {
            Logger::getInstance().debug("ParallelScheduler",
                "Candidate " + std::to_string(index) + " failed",
                errorKindToString(outcome.error_kind) + ": " + outcome.error_message);
        }
    }

    return attempt;
}

CandidateOutcome ParallelThinkingScheduler::runCandidate(const RoundInput& input, size_t candidate_index,
                                                         const CancellationToken& token) {
    auto start_time = std::chrono::steady_clock::now();

    const std::shared_ptr<GenerationProvider>& provider = m_providers[candidate_index % m_providers.size()];

    CandidateOutcome outcome;
    outcome.candidate_index = candidate_index;
    outcome.endpoint_id = provider->getEndpointId();

    GenerationParams params = input.params;
    params.seed = input.params.seed + static_cast<int>(candidate_index);

    std::string key = CacheCoordinator::makeKey(outcome.endpoint_id, input.prompt, params,
                                                input.context_snapshot);

    CallOutcome call_outcome;
    auto compute = [this, &provider, &input, &params, &call_outcome](const CancellationToken& compute_token) {
        call_outcome = m_executor.call(provider, input.prompt, params, input.call_options, compute_token);
        return call_outcome.text;
    };

    try {
        CacheResult cached = m_cache.getOrCompute(key, compute, token, input.cache_ttl);

        outcome.text = std::move(cached.value);
        outcome.cache_hit = !cached.computed;
        if (cached.computed) {
            outcome.calls = call_outcome.attempts_launched;
            outcome.tokens = estimateTokens(input.prompt) + estimateTokens(outcome.text);
        }

        double score = m_evaluator->score(outcome.text, input.evaluation_context);
        outcome.score = std::max(0.0, std::min(1.0, score));
        outcome.success = true;
    } catch (const GenerationError& e) {
        outcome.success = false;
        outcome.error_kind = e.kind();
        outcome.error_message = e.what();
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error_kind = ErrorKind::TRANSIENT;
        outcome.error_message = e.what();
    }

    if (!outcome.success && call_outcome.attempts_launched == 0) {
        // A failed call still spent at least the primary attempt unless refused locally
        if (outcome.error_kind != ErrorKind::CIRCUIT_OPEN && outcome.error_kind != ErrorKind::CANCELLED) {
            outcome.calls = 1;
        }
    }

    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return outcome;
}

size_t ParallelThinkingScheduler::selectCandidate(const std::vector<CandidateOutcome>& candidates) {
    size_t best = npos;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const CandidateOutcome& candidate = candidates[i];
        if (!candidate.success) {
            continue;
        }
        if (best == npos) {
            best = i;
            continue;
        }

        const CandidateOutcome& current = candidates[best];
        if (candidate.score > current.score) {
            best = i;
        } else if (candidate.score == current.score) {
            if (candidate.latency < current.latency ||
                (candidate.latency == current.latency &&
                 candidate.candidate_index < current.candidate_index)) {
                best = i;
            }
        }
    }
    return best;
}

std::vector<std::string> ParallelThinkingScheduler::getEndpointIds() const {
    std::vector<std::string> ids;
    for (const auto& provider : m_providers) {
        std::string id = provider->getEndpointId();
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace Rethink
