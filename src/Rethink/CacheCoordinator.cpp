// =================================================================
// src/Rethink/CacheCoordinator.cpp
// =================================================================
// Implementation of the single-flight cache coordinator.

#include "Rethink/CacheCoordinator.hpp"
#include "Rethink/Fingerprint.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include "Rethink/Logger.hpp"
#include <map>
#include <stdexcept>

namespace Rethink {

namespace {

// Keeps a key pinned in the backend for the lifetime of a computation
class PinGuard {
public:
    PinGuard(CacheBackend& backend, const std::string& key) : m_backend(backend), m_key(key) {
        m_backend.pin(m_key);
    }
    ~PinGuard() { m_backend.unpin(m_key); }

    PinGuard(const PinGuard&) = delete;
    PinGuard& operator=(const PinGuard&) = delete;

private:
    CacheBackend& m_backend;
    std::string m_key;
};

constexpr std::chrono::milliseconds kFollowerPollInterval{10};

} // namespace

CacheCoordinator::CacheCoordinator(std::unique_ptr<CacheBackend> backend,
                                   std::chrono::milliseconds default_ttl)
    : m_backend(std::move(backend)), m_default_ttl(default_ttl) {
    if (!m_backend) {
        throw std::invalid_argument("CacheCoordinator requires a cache backend");
    }
    Logger::getInstance().info("CacheCoordinator", "Initialized with " + m_backend->getName() + " backend",
        "Default TTL: " + std::to_string(m_default_ttl.count()) + "ms");
}

CacheResult CacheCoordinator::getOrCompute(const std::string& key,
                                           const ComputeFunction& compute,
                                           const CancellationToken& token,
                                           std::optional<std::chrono::milliseconds> ttl) {
    std::chrono::milliseconds entry_ttl = ttl.value_or(m_default_ttl);

    while (true) {
        token.throwIfCancelled();

        if (auto hit = lookupBackend(key)) {
            m_hits++;
            CacheResult result;
            result.value = std::move(hit->value);
            result.cache_hit = true;
            return result;
        }

        std::shared_ptr<InFlight> flight;
        bool leader = false;
        {
            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);
            auto it = shard.in_flight.find(key);
            if (it != shard.in_flight.end()) {
                flight = it->second;
            } else {
                flight = std::make_shared<InFlight>();
                shard.in_flight.emplace(key, flight);
                leader = true;
            }
        }

        if (leader) {
            return lead(key, flight, compute, token, entry_ttl);
        }

        m_joins++;
        Logger::getInstance().debug("CacheCoordinator", "Joining in-flight computation", key);

        std::unique_lock<std::mutex> lock(flight->mutex);
        while (!flight->done) {
            if (token.isCancelled()) {
                throw CancelledError("Cancelled while waiting for in-flight computation");
            }
            flight->cv.wait_for(lock, kFollowerPollInterval);
        }

        if (flight->succeeded) {
            CacheResult result;
            result.value = flight->value;
            result.joined = true;
            return result;
        }
        if (!flight->leader_cancelled) {
            std::rethrow_exception(flight->error);
        }

        // The leader gave up; take another turn, possibly as the new leader
        Logger::getInstance().debug("CacheCoordinator", "Leader cancelled, retrying lookup", key);
    }
}

CacheResult CacheCoordinator::lead(const std::string& key, const std::shared_ptr<InFlight>& flight,
                                   const ComputeFunction& compute, const CancellationToken& token,
                                   std::chrono::milliseconds ttl) {
    PinGuard pin(*m_backend, key);

    // A previous leader may have stored the value between our lookup and registration
    if (auto hit = lookupBackend(key)) {
        m_hits++;
        publish(key, flight, true, hit->value, nullptr, false);
        CacheResult result;
        result.value = std::move(hit->value);
        result.cache_hit = true;
        return result;
    }

    m_misses++;
    m_computations++;

    std::string value;
    try {
        value = compute(token);
    } catch (const GenerationError& e) {
        bool cancelled = e.kind() == ErrorKind::CANCELLED || token.isCancelled();
        if (!cancelled) {
            m_compute_failures++;
        }
        publish(key, flight, false, std::string(), std::current_exception(), cancelled);
        throw;
    } catch (const std::exception& e) {
        bool cancelled = token.isCancelled();
        if (!cancelled) {
            m_compute_failures++;
        }
        Logger::getInstance().debug("CacheCoordinator", "Computation failed", std::string(e.what()));
        publish(key, flight, false, std::string(), std::current_exception(), cancelled);
        throw;
    }

    if (token.isCancelled()) {
        publish(key, flight, false, std::string(),
                std::make_exception_ptr(CancelledError()), true);
        throw CancelledError("Cancelled after computation completed");
    }

    storeBackend(key, value, ttl);
    publish(key, flight, true, value, nullptr, false);

    CacheResult result;
    result.value = std::move(value);
    result.computed = true;
    return result;
}

void CacheCoordinator::publish(const std::string& key, const std::shared_ptr<InFlight>& flight,
                               bool succeeded, const std::string& value,
                               std::exception_ptr error, bool leader_cancelled) {
    {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.in_flight.find(key);
        if (it != shard.in_flight.end() && it->second == flight) {
            shard.in_flight.erase(it);
        }
    }

    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        flight->done = true;
        flight->succeeded = succeeded;
        flight->leader_cancelled = leader_cancelled;
        flight->value = value;
        flight->error = std::move(error);
    }
    flight->cv.notify_all();
}

std::string CacheCoordinator::makeKey(const std::string& endpoint_id,
                                      const std::string& prompt,
                                      const GenerationParams& params,
                                      const std::string& context_snapshot) {
    Fingerprint fingerprint;
    fingerprint.add("endpoint", endpoint_id)
               .add("prompt", prompt)
               .add("max_tokens", static_cast<long long>(params.max_tokens))
               .add("temperature", params.temperature)
               .add("seed", static_cast<long long>(params.seed))
               .add("context", context_snapshot);

    // Ordered so that the key does not depend on hash map iteration order
    std::map<std::string, std::string> extra(params.extra.begin(), params.extra.end());
    for (const auto& option : extra) {
        fingerprint.add("extra:" + option.first, option.second);
    }
    return fingerprint.hex();
}

void CacheCoordinator::remove(const std::string& key) {
    try {
        m_backend->remove(key);
    } catch (const CacheError& e) {
        m_backend_errors++;
        Logger::getInstance().warning("CacheCoordinator", "Cache remove failed", e.what());
    }
}

void CacheCoordinator::clear() {
    try {
        m_backend->clear();
        RETHINK_LOG_INFO("CacheCoordinator", "Cache cleared");
    } catch (const CacheError& e) {
        m_backend_errors++;
        Logger::getInstance().warning("CacheCoordinator", "Cache clear failed", e.what());
    }
}

CacheStatistics CacheCoordinator::getStatistics() const {
    CacheStatistics stats;
    stats.hits = m_hits.load();
    stats.misses = m_misses.load();
    stats.joins = m_joins.load();
    stats.computations = m_computations.load();
    stats.compute_failures = m_compute_failures.load();
    stats.backend_errors = m_backend_errors.load();
    stats.evictions = m_backend->getEvictionCount();
    stats.size = m_backend->size();
    return stats;
}

size_t CacheCoordinator::getInFlightCount() const {
    size_t count = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        count += shard.in_flight.size();
    }
    return count;
}

CacheCoordinator::Shard& CacheCoordinator::shardFor(const std::string& key) {
    return m_shards[std::hash<std::string>{}(key) % kShardCount];
}

std::optional<CacheLookup> CacheCoordinator::lookupBackend(const std::string& key) {
    try {
        return m_backend->get(key);
    } catch (const CacheError& e) {
        m_backend_errors++;
        Logger::getInstance().warning("CacheCoordinator", "Cache lookup failed, treating as miss", e.what());
        return std::nullopt;
    }
}

void CacheCoordinator::storeBackend(const std::string& key, const std::string& value,
                                    std::chrono::milliseconds ttl) {
    try {
        m_backend->set(key, value, ttl);
    } catch (const CacheError& e) {
        m_backend_errors++;
        Logger::getInstance().warning("CacheCoordinator", "Cache store failed, value not cached", e.what());
    }
}

} // namespace Rethink
