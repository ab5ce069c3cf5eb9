// =================================================================
// include/Rethink/Fingerprint.hpp
// =================================================================
// Stable 64-bit FNV-1a fingerprints for cache keys.

#pragma once

#include <cstdint>
#include <string>

namespace Rethink {

/**
 * @brief Incremental fingerprint builder
 *
 * Fields are hashed in call order, each preceded by its tag and a separator,
 * so that reordering or renaming fields changes the key. Doubles are hashed
 * by their bit pattern.
 */
class Fingerprint {
public:
    Fingerprint& add(const std::string& tag, const std::string& value);
    Fingerprint& add(const std::string& tag, long long value);
    Fingerprint& add(const std::string& tag, double value);

    uint64_t value() const { return m_hash; }

    /**
     * @brief 16 lowercase hex digits
     */
    std::string hex() const;

    static std::string of(const std::string& text);

private:
    void update(const void* data, size_t length);
    void updateTag(const std::string& tag);

    uint64_t m_hash = 14695981039346656037ULL;
};

} // namespace Rethink
