// =================================================================
// src/Rethink/CancellationToken.cpp
// =================================================================
// Implementation of hierarchical cancellation tokens.

#include "Rethink/CancellationToken.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include <algorithm>

namespace Rethink {

CancellationToken::CancellationToken() : m_state(std::make_shared<State>()) {}

CancellationToken CancellationToken::createChild() const {
    auto child = std::make_shared<State>();

    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->cancelled.load()) {
        child->cancelled.store(true);
    } else {
        // Drop registrations of children that no longer exist
        auto& children = m_state->children;
        children.erase(std::remove_if(children.begin(), children.end(),
                                      [](const std::weak_ptr<State>& weak) { return weak.expired(); }),
                       children.end());
        children.push_back(child);
    }
    return CancellationToken(child);
}

void CancellationToken::cancel() const {
    cancelState(m_state);
}

void CancellationToken::cancelState(const std::shared_ptr<State>& state) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled.exchange(true)) {
            return;
        }
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (const auto& weak : children) {
        if (auto child = weak.lock()) {
            cancelState(child);
        }
    }
}

bool CancellationToken::isCancelled() const {
    return m_state->cancelled.load();
}

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw CancelledError();
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->cv.wait_for(lock, duration, [this]() { return m_state->cancelled.load(); });
}

} // namespace Rethink
