// =================================================================
// src/Rethink/CircuitBreaker.cpp
// =================================================================
// Implementation of circuit breakers and the breaker registry.

#include "Rethink/CircuitBreaker.hpp"
#include "Rethink/Logger.hpp"
#include <algorithm>

namespace Rethink {

std::string breakerStateToString(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED: return "CLOSED";
        case BreakerState::OPEN: return "OPEN";
        case BreakerState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

// =================================================================
// CircuitBreaker
// =================================================================

CircuitBreaker::CircuitBreaker(const std::string& breaker_id, const CircuitBreakerConfig& config)
    : m_breaker_id(breaker_id), m_config(config) {
    if (m_config.failure_threshold == 0) {
        m_config.failure_threshold = 1;
    }
    if (m_config.half_open_trial_budget == 0) {
        m_config.half_open_trial_budget = 1;
    }
    if (m_config.half_open_success_threshold == 0) {
        m_config.half_open_success_threshold = 1;
    }
}

bool CircuitBreaker::countsAsFailure(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT:
        case ErrorKind::RATE_LIMITED:
            return true;
        default:
            return false;
    }
}

BreakerPermit CircuitBreaker::allow() {
    std::lock_guard<std::mutex> lock(m_mutex);

    BreakerPermit permit;

    if (m_state == BreakerState::OPEN) {
        auto elapsed = std::chrono::steady_clock::now() - m_opened_at;
        if (elapsed < m_config.open_duration) {
            m_rejected_calls++;
            return permit;
        }
        transitionTo(BreakerState::HALF_OPEN);
    }

    if (m_state == BreakerState::HALF_OPEN) {
        if (m_half_open_in_flight >= m_config.half_open_trial_budget) {
            m_rejected_calls++;
            return permit;
        }
        m_half_open_in_flight++;
        permit.probe = true;
    }

    permit.admitted = true;
    permit.generation = m_generation;
    return permit;
}

bool CircuitBreaker::holdsCurrentProbe(const BreakerPermit& permit) const {
    return permit.admitted && permit.probe &&
           permit.generation == m_generation &&
           m_state == BreakerState::HALF_OPEN;
}

void CircuitBreaker::recordSuccess(const BreakerPermit& permit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total_successes++;

    if (!permit.admitted || permit.generation != m_generation) {
        // Admitted before the last transition
        return;
    }

    switch (m_state) {
        case BreakerState::CLOSED:
            m_consecutive_failures = 0;
            break;
        case BreakerState::HALF_OPEN:
            if (!holdsCurrentProbe(permit)) {
                break;
            }
            if (m_half_open_in_flight > 0) {
                m_half_open_in_flight--;
            }
            m_half_open_successes++;
            if (m_half_open_successes >= m_config.half_open_success_threshold) {
                transitionTo(BreakerState::CLOSED);
            }
            break;
        case BreakerState::OPEN:
            break;
    }
}

void CircuitBreaker::recordFailure(const BreakerPermit& permit, ErrorKind kind) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!countsAsFailure(kind)) {
        if (holdsCurrentProbe(permit) && m_half_open_in_flight > 0) {
            m_half_open_in_flight--;
        }
        return;
    }

    m_total_failures++;

    if (!permit.admitted || permit.generation != m_generation) {
        return;
    }

    switch (m_state) {
        case BreakerState::CLOSED:
            m_consecutive_failures++;
            if (m_consecutive_failures >= m_config.failure_threshold) {
                transitionTo(BreakerState::OPEN);
            }
            break;
        case BreakerState::HALF_OPEN:
            if (holdsCurrentProbe(permit)) {
                m_consecutive_failures++;
                transitionTo(BreakerState::OPEN);
            }
            break;
        case BreakerState::OPEN:
            break;
    }
}

void CircuitBreaker::releaseProbe(const BreakerPermit& permit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (holdsCurrentProbe(permit) && m_half_open_in_flight > 0) {
        m_half_open_in_flight--;
    }
}

BreakerState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

BreakerSnapshot CircuitBreaker::getSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    BreakerSnapshot snapshot;
    snapshot.breaker_id = m_breaker_id;
    snapshot.state = m_state;
    snapshot.consecutive_failures = m_consecutive_failures;
    snapshot.half_open_successes = m_half_open_successes;
    snapshot.half_open_in_flight = m_half_open_in_flight;
    snapshot.total_successes = m_total_successes;
    snapshot.total_failures = m_total_failures;
    snapshot.rejected_calls = m_rejected_calls;
    snapshot.times_opened = m_times_opened;
    snapshot.generation = m_generation;
    return snapshot;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    transitionTo(BreakerState::CLOSED);
}

void CircuitBreaker::transitionTo(BreakerState next) {
    BreakerState previous = m_state;
    size_t failures_at_transition = m_consecutive_failures;

    m_state = next;
    m_generation++;
    m_half_open_successes = 0;
    m_half_open_in_flight = 0;

    switch (next) {
        case BreakerState::OPEN:
            m_opened_at = std::chrono::steady_clock::now();
            m_times_opened++;
            break;
        case BreakerState::CLOSED:
            m_consecutive_failures = 0;
            break;
        case BreakerState::HALF_OPEN:
            break;
    }

    if (previous != next) {
        Logger::getInstance().logBreakerTransition(m_breaker_id,
                                                   breakerStateToString(previous),
                                                   breakerStateToString(next),
                                                   failures_at_transition);
    }
}

// =================================================================
// CircuitBreakerRegistry
// =================================================================

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig& default_config)
    : m_default_config(default_config) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getBreaker(const std::string& breaker_id) {
    {
        std::shared_lock<std::shared_mutex> lock(m_breakers_mutex);
        auto it = m_breakers.find(breaker_id);
        if (it != m_breakers.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_breakers_mutex);
    auto it = m_breakers.find(breaker_id);
    if (it != m_breakers.end()) {
        return it->second;
    }

    CircuitBreakerConfig config = m_default_config;
    auto config_it = m_endpoint_configs.find(breaker_id);
    if (config_it != m_endpoint_configs.end()) {
        config = config_it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(breaker_id, config);
    m_breakers.emplace(breaker_id, breaker);

    RETHINK_LOG_DEBUG("CircuitBreaker", "Created breaker for endpoint: " + breaker_id);
    return breaker;
}

BreakerPermit CircuitBreakerRegistry::allow(const std::string& breaker_id) {
    return getBreaker(breaker_id)->allow();
}

void CircuitBreakerRegistry::recordSuccess(const std::string& breaker_id, const BreakerPermit& permit) {
    getBreaker(breaker_id)->recordSuccess(permit);
}

void CircuitBreakerRegistry::recordFailure(const std::string& breaker_id, const BreakerPermit& permit,
                                           ErrorKind kind) {
    getBreaker(breaker_id)->recordFailure(permit, kind);
}

void CircuitBreakerRegistry::releaseProbe(const std::string& breaker_id, const BreakerPermit& permit) {
    getBreaker(breaker_id)->releaseProbe(permit);
}

BreakerState CircuitBreakerRegistry::getState(const std::string& breaker_id) const {
    std::shared_lock<std::shared_mutex> lock(m_breakers_mutex);
    auto it = m_breakers.find(breaker_id);
    if (it == m_breakers.end()) {
        return BreakerState::CLOSED;
    }
    return it->second->getState();
}

void CircuitBreakerRegistry::setEndpointConfig(const std::string& breaker_id,
                                               const CircuitBreakerConfig& config) {
    std::unique_lock<std::shared_mutex> lock(m_breakers_mutex);
    m_endpoint_configs[breaker_id] = config;
}

std::vector<BreakerSnapshot> CircuitBreakerRegistry::snapshot() const {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::shared_lock<std::shared_mutex> lock(m_breakers_mutex);
        breakers.reserve(m_breakers.size());
        for (const auto& [id, breaker] : m_breakers) {
            breakers.push_back(breaker);
        }
    }

    std::vector<BreakerSnapshot> snapshots;
    snapshots.reserve(breakers.size());
    for (const auto& breaker : breakers) {
        snapshots.push_back(breaker->getSnapshot());
    }

    std::sort(snapshots.begin(), snapshots.end(),
              [](const BreakerSnapshot& a, const BreakerSnapshot& b) {
                  return a.breaker_id < b.breaker_id;
              });
    return snapshots;
}

void CircuitBreakerRegistry::reset(const std::string& breaker_id) {
    getBreaker(breaker_id)->reset();
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_breakers_mutex);
    return m_breakers.size();
}

} // namespace Rethink
