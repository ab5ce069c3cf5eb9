// =================================================================
// include/Rethink/CacheCoordinator.hpp
// =================================================================
// Content-addressed generation cache with single-flight deduplication.

#pragma once

#include "Rethink/CacheBackend.hpp"
#include "Rethink/CancellationToken.hpp"
#include "Rethink/GenerationProvider.hpp"
#include <string>
#include <memory>
#include <array>
#include <functional>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <atomic>

namespace Rethink {

/**
 * @brief Value returned by getOrCompute
 */
struct CacheResult {
    std::string value;                            ///< Cached or computed payload
    bool cache_hit = false;                       ///< Served from the backend
    bool joined = false;                          ///< Served by another caller's computation
    bool computed = false;                        ///< This caller ran the compute function
};

/**
 * @brief Counters kept by CacheCoordinator
 */
struct CacheStatistics {
    size_t hits = 0;
    size_t misses = 0;
    size_t joins = 0;                             ///< Callers that waited on an in-flight computation
    size_t computations = 0;
    size_t compute_failures = 0;
    size_t backend_errors = 0;                    ///< CacheError caught and treated as a miss
    size_t evictions = 0;
    size_t size = 0;
};

using ComputeFunction = std::function<std::string(const CancellationToken&)>;

/**
 * @brief Single-flight front of a CacheBackend
 *
 * At most one computation per key is in flight; concurrent callers for that
 * key wait for it. In-flight bookkeeping is split over independently locked
 * shards so that unrelated keys rarely share a lock. Failed computations are
 * never cached.
 */
class CacheCoordinator {
public:
    /**
     * @param backend Storage backend (memory, disk or layered)
     * @param default_ttl TTL used when getOrCompute is given none
     */
    explicit CacheCoordinator(std::unique_ptr<CacheBackend> backend,
                              std::chrono::milliseconds default_ttl = std::chrono::hours(1));

    /**
     * @brief Return the cached value for a key or compute it exactly once
     *
     * @param key Fingerprint of the request
     * @param compute Invoked only by the leading caller on a miss
     * @param token Caller cancellation; also handed to compute
     * @param ttl Entry TTL, default_ttl when empty
     * @throws Whatever compute throws (followers receive the leader's failure),
     *         CancelledError when the caller is cancelled while waiting
     */
    CacheResult getOrCompute(const std::string& key,
                             const ComputeFunction& compute,
                             const CancellationToken& token,
                             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /**
     * @brief Build the fingerprint of a generation request
     */
    static std::string makeKey(const std::string& endpoint_id,
                               const std::string& prompt,
                               const GenerationParams& params,
                               const std::string& context_snapshot);

    void remove(const std::string& key);
    void clear();

    CacheStatistics getStatistics() const;

    /**
     * @brief Number of keys currently being computed
     */
    size_t getInFlightCount() const;

    CacheBackend& getBackend() { return *m_backend; }

private:
    struct InFlight {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool succeeded = false;
        bool leader_cancelled = false;
        std::string value;
        std::exception_ptr error;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<InFlight>> in_flight;
    };

    static constexpr size_t kShardCount = 16;

    Shard& shardFor(const std::string& key);

    CacheResult lead(const std::string& key, const std::shared_ptr<InFlight>& flight,
                     const ComputeFunction& compute, const CancellationToken& token,
                     std::chrono::milliseconds ttl);

    void publish(const std::string& key, const std::shared_ptr<InFlight>& flight,
                 bool succeeded, const std::string& value,
                 std::exception_ptr error, bool leader_cancelled);

    std::optional<CacheLookup> lookupBackend(const std::string& key);
    void storeBackend(const std::string& key, const std::string& value, std::chrono::milliseconds ttl);

    std::unique_ptr<CacheBackend> m_backend;
    std::chrono::milliseconds m_default_ttl;
    std::array<Shard, kShardCount> m_shards;

    std::atomic<size_t> m_hits{0};
    std::atomic<size_t> m_misses{0};
    std::atomic<size_t> m_joins{0};
    std::atomic<size_t> m_computations{0};
    std::atomic<size_t> m_compute_failures{0};
    std::atomic<size_t> m_backend_errors{0};
};

} // namespace Rethink
