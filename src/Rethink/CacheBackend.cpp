// =================================================================
// src/Rethink/CacheBackend.cpp
// =================================================================
// Implementation of the memory, disk and layered cache backends.

#include "Rethink/CacheBackend.hpp"
#include "Rethink/Fingerprint.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include "Rethink/Logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace Rethink {

// =================================================================
// MemoryCacheBackend
// =================================================================

MemoryCacheBackend::MemoryCacheBackend(const MemoryCacheConfig& config)
    : m_config(config) {}

std::optional<CacheLookup> MemoryCacheBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= it->second.expires_at) {
        eraseLocked(it);
        return std::nullopt;
    }

    // Move to the most recently used position
    m_lru.splice(m_lru.begin(), m_lru, it->second.lru_position);
    it->second.last_access = now;

    CacheLookup lookup;
    lookup.value = it->second.value;
    lookup.remaining_ttl = std::chrono::duration_cast<std::chrono::milliseconds>(
        it->second.expires_at - now);
    return lookup;
}

void MemoryCacheBackend::set(const std::string& key, const std::string& value,
                             std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_entries.find(key);
    if (existing != m_entries.end()) {
        eraseLocked(existing);
    }

    auto now = std::chrono::steady_clock::now();
    m_lru.push_front(key);

    Entry entry;
    entry.value = value;
    entry.size_bytes = key.size() + value.size();
    entry.expires_at = now + ttl;
    entry.last_access = now;
    entry.lru_position = m_lru.begin();

    m_total_bytes += entry.size_bytes;
    m_entries.emplace(key, std::move(entry));

    evictLocked(key);
}

void MemoryCacheBackend::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        eraseLocked(it);
    }
}

void MemoryCacheBackend::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_lru.clear();
    m_total_bytes = 0;
}

size_t MemoryCacheBackend::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

size_t MemoryCacheBackend::getByteSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_bytes;
}

bool MemoryCacheBackend::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    return it != m_entries.end() && std::chrono::steady_clock::now() < it->second.expires_at;
}

void MemoryCacheBackend::pin(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pinned[key]++;
}

void MemoryCacheBackend::unpin(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pinned.find(key);
    if (it == m_pinned.end()) {
        return;
    }
    if (--it->second == 0) {
        m_pinned.erase(it);
    }
}

void MemoryCacheBackend::eraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
    m_total_bytes -= it->second.size_bytes;
    m_lru.erase(it->second.lru_position);
    m_entries.erase(it);
}

void MemoryCacheBackend::evictLocked(const std::string& protected_key) {
    auto over_budget = [this]() {
        bool over_count = m_config.max_entries > 0 && m_entries.size() > m_config.max_entries;
        bool over_bytes = m_config.max_bytes > 0 && m_total_bytes > m_config.max_bytes;
        return over_count || over_bytes;
    };

    auto candidate = m_lru.end();
    while (over_budget() && candidate != m_lru.begin()) {
        --candidate;
        const std::string& key = *candidate;
        if (key == protected_key || m_pinned.count(key) > 0) {
            continue;
        }

        auto victim = m_entries.find(key);
        auto next = candidate;
        ++next;
        Logger::getInstance().debug("CacheBackend", "Evicting least recently used entry", key);
        eraseLocked(victim);
        m_evictions++;
        candidate = next;
    }

    if (over_budget()) {
        Logger::getInstance().warning("CacheBackend",
            "Memory cache over budget, remaining entries are pinned",
            "Entries: " + std::to_string(m_entries.size()) + ", Bytes: " + std::to_string(m_total_bytes));
    }
}

// =================================================================
// DiskCacheBackend
// =================================================================

namespace {

long long toEpochMillis(std::chrono::system_clock::time_point time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count();
}

} // namespace

DiskCacheBackend::DiskCacheBackend(const std::string& directory, size_t max_entries)
    : m_directory(directory), m_max_entries(max_entries) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        throw CacheError("Cannot create cache directory " + m_directory + ": " + ec.message());
    }
}

std::string DiskCacheBackend::pathForKey(const std::string& key) const {
    return (fs::path(m_directory) / (Fingerprint::of(key) + ".json")).string();
}

std::optional<CacheLookup> DiskCacheBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string path = pathForKey(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw CacheError("Cannot stat cache file " + path + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw CacheError("Cannot open cache file: " + path);
    }

    std::string stored_key;
    std::string stored_value;
    long long expires_at_ms = 0;
    try {
        nlohmann::json document;
        file >> document;
        if (!document.is_object()) {
            throw CacheError("Corrupt cache file " + path + ": entry is not an object");
        }
        stored_key = document.value("key", std::string());
        stored_value = document.value("value", std::string());
        expires_at_ms = document.value("expires_at_ms", 0LL);
    } catch (const nlohmann::json::exception& e) {
        throw CacheError("Corrupt cache file " + path + ": " + e.what());
    }
    file.close();

    // Different key with the same fingerprint
    if (stored_key != key) {
        return std::nullopt;
    }

    long long now_ms = toEpochMillis(std::chrono::system_clock::now());
    if (now_ms >= expires_at_ms) {
        fs::remove(path, ec);
        return std::nullopt;
    }

    // Recency for LRU capacity enforcement
    fs::last_write_time(path, fs::file_time_type::clock::now(), ec);

    CacheLookup lookup;
    lookup.value = std::move(stored_value);
    lookup.remaining_ttl = std::chrono::milliseconds(expires_at_ms - now_ms);
    return lookup;
}

void DiskCacheBackend::set(const std::string& key, const std::string& value,
                           std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(m_mutex);

    long long now_ms = toEpochMillis(std::chrono::system_clock::now());

    nlohmann::json document = {
        {"key", key},
        {"value", value},
        {"created_at_ms", now_ms},
        {"expires_at_ms", now_ms + ttl.count()}
    };

    std::string path = pathForKey(key);
    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw CacheError("Cannot write cache file: " + temp_path);
        }
        file << document.dump();
        if (!file.good()) {
            throw CacheError("Short write on cache file: " + temp_path);
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        throw CacheError("Cannot move cache file into place " + path + ": " + ec.message());
    }

    enforceCapacity();
}

void DiskCacheBackend::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    fs::remove(pathForKey(key), ec);
    if (ec) {
        throw CacheError("Cannot remove cache file for key " + key + ": " + ec.message());
    }
}

void DiskCacheBackend::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            fs::remove(entry.path(), ec);
        }
    }
    if (ec) {
        throw CacheError("Cannot clear cache directory " + m_directory + ": " + ec.message());
    }
}

size_t DiskCacheBackend::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            count++;
        }
    }
    return count;
}

void DiskCacheBackend::enforceCapacity() {
    if (m_max_entries == 0) {
        return;
    }

    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw CacheError("Cannot scan cache directory " + m_directory + ": " + ec.message());
    }
    if (files.size() <= m_max_entries) {
        return;
    }

    // Oldest first
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        std::error_code ignored;
        return fs::last_write_time(a, ignored) < fs::last_write_time(b, ignored);
    });

    size_t excess = files.size() - m_max_entries;
    for (size_t i = 0; i < excess; ++i) {
        if (fs::remove(files[i], ec)) {
            m_evictions++;
        }
    }
}

// =================================================================
// LayeredCacheBackend
// =================================================================

LayeredCacheBackend::LayeredCacheBackend(std::unique_ptr<MemoryCacheBackend> memory,
                                         std::unique_ptr<DiskCacheBackend> disk)
    : m_memory(std::move(memory)), m_disk(std::move(disk)) {
    if (!m_memory || !m_disk) {
        throw std::invalid_argument("LayeredCacheBackend requires both a memory and a disk layer");
    }
}

std::optional<CacheLookup> LayeredCacheBackend::get(const std::string& key) {
    if (auto hit = m_memory->get(key)) {
        return hit;
    }

    auto disk_hit = m_disk->get(key);
    if (disk_hit) {
        m_memory->set(key, disk_hit->value, disk_hit->remaining_ttl);
    }
    return disk_hit;
}

void LayeredCacheBackend::set(const std::string& key, const std::string& value,
                              std::chrono::milliseconds ttl) {
    m_memory->set(key, value, ttl);
    m_disk->set(key, value, ttl);
}

void LayeredCacheBackend::remove(const std::string& key) {
    m_memory->remove(key);
    m_disk->remove(key);
}

void LayeredCacheBackend::clear() {
    m_memory->clear();
    m_disk->clear();
}

size_t LayeredCacheBackend::size() const {
    return m_disk->size();
}

void LayeredCacheBackend::pin(const std::string& key) {
    m_memory->pin(key);
}

void LayeredCacheBackend::unpin(const std::string& key) {
    m_memory->unpin(key);
}

size_t LayeredCacheBackend::getEvictionCount() const {
    return m_memory->getEvictionCount() + m_disk->getEvictionCount();
}

} // namespace Rethink
