// =================================================================
// include/Rethink/CancellationToken.hpp
// =================================================================
// Hierarchical cooperative cancellation shared between the engine,
// the scheduler and the executors.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace Rethink {

/**
 * @brief Copyable handle on a cancellation flag
 *
 * A default-constructed token is live and can be cancelled. Child tokens are
 * cancelled together with their parent, but cancelling a child leaves the
 * parent untouched. Copies share the same flag.
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * @brief Create a token that is cancelled whenever this one is
     */
    CancellationToken createChild() const;

    /**
     * @brief Cancel this token and every child created from it
     */
    void cancel() const;

    bool isCancelled() const;

    /**
     * @brief Throw CancelledError if the token is cancelled
     */
    void throwIfCancelled() const;

    /**
     * @brief Sleep for a duration, waking early on cancellation
     * @return True if the token was cancelled before the duration elapsed
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    static void cancelState(const std::shared_ptr<State>& state);

    std::shared_ptr<State> m_state;
};

} // namespace Rethink
