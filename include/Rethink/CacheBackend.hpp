// =================================================================
// include/Rethink/CacheBackend.hpp
// =================================================================
// Storage backends for cached generations: bounded in-memory LRU,
// JSON files on disk, and a memory-over-disk layered combination.

#pragma once

#include <string>
#include <memory>
#include <list>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <chrono>
#include <mutex>
#include <atomic>

namespace Rethink {

/**
 * @brief Value found by a backend lookup
 */
struct CacheLookup {
    std::string value;                            ///< Cached payload
    std::chrono::milliseconds remaining_ttl{0};   ///< Time left before expiry
};

/**
 * @brief Key/value store with per-entry TTL
 *
 * Backends throw CacheError on I/O failure; expired entries behave as absent.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual std::optional<CacheLookup> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual size_t size() const = 0;

    /**
     * @brief Protect a key from eviction while its value is being computed
     */
    virtual void pin(const std::string& key) { (void)key; }
    virtual void unpin(const std::string& key) { (void)key; }

    virtual size_t getEvictionCount() const { return 0; }
    virtual std::string getName() const = 0;
};

/**
 * @brief Capacity limits of the in-memory backend
 */
struct MemoryCacheConfig {
    size_t max_entries = 1000;                    ///< Entry count budget, 0 = unlimited
    size_t max_bytes = 64 * 1024 * 1024;          ///< Byte budget (key + value), 0 = unlimited
};

/**
 * @brief Least-recently-used in-memory backend
 *
 * Eviction runs synchronously on insert while either budget is exceeded and
 * skips pinned keys.
 */
class MemoryCacheBackend : public CacheBackend {
public:
    explicit MemoryCacheBackend(const MemoryCacheConfig& config = MemoryCacheConfig());

    std::optional<CacheLookup> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    void clear() override;
    size_t size() const override;

    void pin(const std::string& key) override;
    void unpin(const std::string& key) override;

    size_t getEvictionCount() const override { return m_evictions.load(); }
    std::string getName() const override { return "memory"; }

    size_t getByteSize() const;

    /**
     * @brief Check for a live entry without touching its recency
     */
    bool contains(const std::string& key) const;

private:
    struct Entry {
        std::string value;
        size_t size_bytes = 0;
        std::chrono::steady_clock::time_point expires_at;
        std::chrono::steady_clock::time_point last_access;
        std::list<std::string>::iterator lru_position;
    };

    void eraseLocked(std::unordered_map<std::string, Entry>::iterator it);
    void evictLocked(const std::string& protected_key);

    MemoryCacheConfig m_config;
    std::unordered_map<std::string, Entry> m_entries;
    std::list<std::string> m_lru;                 // most recent at front
    std::unordered_map<std::string, size_t> m_pinned;
    size_t m_total_bytes = 0;
    std::atomic<size_t> m_evictions{0};
    mutable std::mutex m_mutex;
};

/**
 * @brief Disk backend storing one JSON document per key
 */
class DiskCacheBackend : public CacheBackend {
public:
    /**
     * @param directory Cache directory, created if missing
     * @param max_entries Entry budget, 0 = unlimited; least recently used files go first
     */
    explicit DiskCacheBackend(const std::string& directory, size_t max_entries = 0);

    std::optional<CacheLookup> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    void clear() override;
    size_t size() const override;

    size_t getEvictionCount() const override { return m_evictions.load(); }
    std::string getName() const override { return "disk"; }

    std::string pathForKey(const std::string& key) const;

private:
    void enforceCapacity();

    std::string m_directory;
    size_t m_max_entries;
    std::atomic<size_t> m_evictions{0};
    mutable std::mutex m_mutex;
};

/**
 * @brief Memory checked first, disk on miss, writes go to both
 *
 * Disk hits are promoted into memory with their remaining TTL.
 */
class LayeredCacheBackend : public CacheBackend {
public:
    LayeredCacheBackend(std::unique_ptr<MemoryCacheBackend> memory,
                        std::unique_ptr<DiskCacheBackend> disk);

    std::optional<CacheLookup> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    void clear() override;
    size_t size() const override;

    void pin(const std::string& key) override;
    void unpin(const std::string& key) override;

    size_t getEvictionCount() const override;
    std::string getName() const override { return "layered"; }

    MemoryCacheBackend& getMemory() { return *m_memory; }
    DiskCacheBackend& getDisk() { return *m_disk; }

private:
    std::unique_ptr<MemoryCacheBackend> m_memory;
    std::unique_ptr<DiskCacheBackend> m_disk;
};

} // namespace Rethink
