// =================================================================
// src/Rethink/HedgingExecutor.cpp
// =================================================================
// Implementation of hedge batches.

#include "Rethink/HedgingExecutor.hpp"
#include "Rethink/Logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <memory>

namespace Rethink {

namespace {

// Caller cancellation is observed by polling at this interval
constexpr std::chrono::milliseconds kCancellationPollInterval{10};

struct BatchState {
    std::mutex mutex;
    std::condition_variable cv;
    bool has_winner = false;
    std::string winner_text;
    size_t winner_index = 0;
    size_t outstanding = 0;
    std::exception_ptr last_error;
};

} // namespace

HedgingExecutor::~HedgingExecutor() {
    std::lock_guard<std::mutex> lock(m_abandoned_mutex);
    for (auto& future : m_abandoned) {
        if (future.valid()) {
            future.wait();
        }
    }
    m_abandoned.clear();
}

HedgeResult HedgingExecutor::executeHedged(const HedgedAttempt& attempt,
                                           const HedgeConfig& config,
                                           const CancellationToken& token,
                                           std::chrono::steady_clock::time_point deadline) {
    reapAbandoned();
    m_batches++;

    auto state = std::make_shared<BatchState>();
    std::vector<CancellationToken> attempt_tokens;
    std::vector<std::future<void>> futures;
    const size_t max_attempts = 1 + config.max_hedges;

    auto launch = [&](size_t index) {
        CancellationToken attempt_token = token.createChild();
        attempt_tokens.push_back(attempt_token);

        futures.push_back(std::async(std::launch::async,
            [state, attempt, attempt_token, index]() {
                try {
                    std::string text = attempt(attempt_token);
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (!state->has_winner && !attempt_token.isCancelled()) {
                        state->has_winner = true;
                        state->winner_text = std::move(text);
                        state->winner_index = index;
                    }
                } catch (const CancelledError&) {
                    // A cancelled attempt reports nothing
                } catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (!state->has_winner && !attempt_token.isCancelled()) {
                        state->last_error = std::current_exception();
                    }
                }

                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->outstanding--;
                }
                state->cv.notify_all();
            }));
    };

    std::unique_lock<std::mutex> lock(state->mutex);
    state->outstanding = 1;
    lock.unlock();
    launch(0);
    lock.lock();

    size_t launched = 1;
    auto next_hedge_at = std::chrono::steady_clock::now() + config.hedge_delay;
    bool deadline_exceeded = false;
    bool caller_cancelled = false;

    while (true) {
        if (state->has_winner || state->outstanding == 0) {
            break;
        }
        if (token.isCancelled()) {
            caller_cancelled = true;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            deadline_exceeded = true;
            break;
        }

        if (launched < max_attempts && now >= next_hedge_at) {
            state->outstanding++;
            lock.unlock();
            Logger::getInstance().debug("HedgingExecutor",
                "Issuing hedge " + std::to_string(launched) + " of " + std::to_string(config.max_hedges));
            launch(launched);
            m_hedges_launched++;
            lock.lock();
            launched++;
            next_hedge_at = now + config.hedge_delay;
            continue;
        }

        auto wake_at = std::min(deadline, now + kCancellationPollInterval);
        if (launched < max_attempts) {
            wake_at = std::min(wake_at, next_hedge_at);
        }
        state->cv.wait_until(lock, wake_at, [&]() {
            return state->has_winner || state->outstanding == 0;
        });
    }

    bool has_winner = state->has_winner;
    std::string winner_text = state->winner_text;
    size_t winner_index = state->winner_index;
    std::exception_ptr last_error = state->last_error;
    size_t still_running = state->outstanding;
    lock.unlock();

    // Losers, or everything on cancellation and deadline, are abandoned
    for (auto& attempt_token : attempt_tokens) {
        attempt_token.cancel();
    }
    m_cancelled_attempts += still_running;
    abandon(futures);

    if (has_winner) {
        if (winner_index == 0) {
            m_primary_wins++;
        } else {
            m_hedge_wins++;
            Logger::getInstance().debug("HedgingExecutor",
                "Hedge " + std::to_string(winner_index) + " won the batch",
                "Attempts launched: " + std::to_string(launched));
        }

        HedgeResult result;
        result.text = std::move(winner_text);
        result.winning_attempt = winner_index;
        result.attempts_launched = launched;
        return result;
    }

    m_failed_batches++;

    if (caller_cancelled) {
        throw CancelledError("Hedge batch cancelled by caller");
    }
    if (deadline_exceeded) {
        Logger::getInstance().warning("HedgingExecutor", "Hedge batch exceeded its deadline",
                                      "Attempts launched: " + std::to_string(launched));
        throw GenerationError(ErrorKind::TRANSIENT, "Call deadline exceeded", true);
    }
    if (last_error) {
        std::rethrow_exception(last_error);
    }
    throw GenerationError(ErrorKind::TRANSIENT, "Hedge batch finished without a result");
}

void HedgingExecutor::abandon(std::vector<std::future<void>>& futures) {
    std::lock_guard<std::mutex> lock(m_abandoned_mutex);
    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            future.get();
        } else {
            m_abandoned.push_back(std::move(future));
        }
    }
    futures.clear();
}

void HedgingExecutor::reapAbandoned() {
    std::lock_guard<std::mutex> lock(m_abandoned_mutex);
    m_abandoned.erase(std::remove_if(m_abandoned.begin(), m_abandoned.end(),
        [](std::future<void>& future) {
            if (!future.valid()) {
                return true;
            }
            if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                future.get();
                return true;
            }
            return false;
        }), m_abandoned.end());
}

size_t HedgingExecutor::getPendingAbandoned() {
    reapAbandoned();
    std::lock_guard<std::mutex> lock(m_abandoned_mutex);
    return m_abandoned.size();
}

HedgeStatistics HedgingExecutor::getStatistics() const {
    HedgeStatistics stats;
    stats.batches = m_batches.load();
    stats.hedges_launched = m_hedges_launched.load();
    stats.primary_wins = m_primary_wins.load();
    stats.hedge_wins = m_hedge_wins.load();
    stats.failed_batches = m_failed_batches.load();
    stats.cancelled_attempts = m_cancelled_attempts.load();
    return stats;
}

} // namespace Rethink
