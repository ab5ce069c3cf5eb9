// =================================================================
// include/Rethink/CircuitBreaker.hpp
// =================================================================
// Per-endpoint circuit breakers and the registry that owns them.

#pragma once

#include "Rethink/ResilienceErrors.hpp"
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <shared_mutex>

namespace Rethink {

/**
 * @brief Breaker state
 */
enum class BreakerState {
    CLOSED,     ///< Calls pass through, consecutive failures are counted
    OPEN,       ///< Calls are refused until open_duration elapses
    HALF_OPEN   ///< A bounded number of probe calls is let through
};

std::string breakerStateToString(BreakerState state);

/**
 * @brief Circuit breaker configuration
 */
struct CircuitBreakerConfig {
    size_t failure_threshold = 5;                 ///< Consecutive failures that open the breaker
    std::chrono::milliseconds open_duration{30000}; ///< Time spent Open before probing
    size_t half_open_trial_budget = 1;            ///< Concurrent probes allowed while HalfOpen
    size_t half_open_success_threshold = 1;       ///< Successful probes needed to close again
};

/**
 * @brief Point-in-time view of one breaker
 */
struct BreakerSnapshot {
    std::string breaker_id;
    BreakerState state = BreakerState::CLOSED;
    size_t consecutive_failures = 0;
    size_t half_open_successes = 0;
    size_t half_open_in_flight = 0;
    size_t total_successes = 0;
    size_t total_failures = 0;
    size_t rejected_calls = 0;
    size_t times_opened = 0;
    uint64_t generation = 0;
};

/**
 * @brief Admission handed out by CircuitBreaker::allow()
 *
 * The outcome of an admitted call is reported back with its permit. Each
 * state transition starts a new breaker generation, and outcomes of permits
 * from an earlier generation only update the totals.
 */
struct BreakerPermit {
    bool admitted = false;    ///< False when the breaker refused the call
    bool probe = false;       ///< Holds a HalfOpen probe slot
    uint64_t generation = 0;  ///< Breaker generation at admission

    explicit operator bool() const { return admitted; }
};

/**
 * @brief Fault-isolation state machine for one upstream endpoint
 *
 * Closed -> Open after failure_threshold consecutive counted failures.
 * Open -> HalfOpen lazily on the first allow() after open_duration.
 * HalfOpen -> Closed after half_open_success_threshold successful probes,
 * HalfOpen -> Open (timer reset) on any counted probe failure.
 *
 * INVALID_REQUEST and UNAUTHORIZED failures describe the request, not the
 * endpoint, and are not counted. All state changes go through transitionTo().
 */
class CircuitBreaker {
public:
    CircuitBreaker(const std::string& breaker_id, const CircuitBreakerConfig& config);

    /**
     * @brief Decide whether a call may proceed
     * @return A refused permit while Open, or while HalfOpen with the probe budget in use
     */
    BreakerPermit allow();

    void recordSuccess(const BreakerPermit& permit);
    void recordFailure(const BreakerPermit& permit, ErrorKind kind);

    /**
     * @brief Release an admitted call that was cancelled before completing
     *
     * Records neither success nor failure; only frees the probe slot the
     * permit holds, if any.
     */
    void releaseProbe(const BreakerPermit& permit);

    BreakerState getState() const;
    BreakerSnapshot getSnapshot() const;

    /**
     * @brief Force the breaker back to Closed with cleared counters
     */
    void reset();

    const std::string& getId() const { return m_breaker_id; }

    static bool countsAsFailure(ErrorKind kind);

private:
    void transitionTo(BreakerState next);
    bool holdsCurrentProbe(const BreakerPermit& permit) const;

    std::string m_breaker_id;
    CircuitBreakerConfig m_config;

    BreakerState m_state = BreakerState::CLOSED;
    size_t m_consecutive_failures = 0;
    size_t m_half_open_successes = 0;
    size_t m_half_open_in_flight = 0;
    std::chrono::steady_clock::time_point m_opened_at;
    uint64_t m_generation = 1;

    size_t m_total_successes = 0;
    size_t m_total_failures = 0;
    size_t m_rejected_calls = 0;
    size_t m_times_opened = 0;

    mutable std::mutex m_mutex;
};

/**
 * @brief Owner of all breakers of a process, keyed by endpoint id
 *
 * Breakers are created lazily on first use. Lookups take a shared lock on the
 * map only; each breaker synchronizes on its own mutex, so unrelated
 * endpoints never contend.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const CircuitBreakerConfig& default_config = CircuitBreakerConfig());

    /**
     * @brief Get or create the breaker for an endpoint
     * @return Shared pointer to the breaker (never null)
     */
    std::shared_ptr<CircuitBreaker> getBreaker(const std::string& breaker_id);

    BreakerPermit allow(const std::string& breaker_id);
    void recordSuccess(const std::string& breaker_id, const BreakerPermit& permit);
    void recordFailure(const std::string& breaker_id, const BreakerPermit& permit, ErrorKind kind);
    void releaseProbe(const std::string& breaker_id, const BreakerPermit& permit);

    /**
     * @brief Current state, CLOSED for endpoints never seen
     */
    BreakerState getState(const std::string& breaker_id) const;

    /**
     * @brief Override the configuration used for breakers created later
     */
    void setEndpointConfig(const std::string& breaker_id, const CircuitBreakerConfig& config);

    std::vector<BreakerSnapshot> snapshot() const;
    void reset(const std::string& breaker_id);
    size_t size() const;

private:
    CircuitBreakerConfig m_default_config;
    std::unordered_map<std::string, CircuitBreakerConfig> m_endpoint_configs;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> m_breakers;
    mutable std::shared_mutex m_breakers_mutex;
};

} // namespace Rethink
