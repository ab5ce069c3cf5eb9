// =================================================================
// src/Rethink/Fingerprint.cpp
// =================================================================
// Implementation of FNV-1a fingerprints.

#include "Rethink/Fingerprint.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace Rethink {

namespace {
constexpr uint64_t kFnvPrime = 1099511628211ULL;
constexpr unsigned char kFieldSeparator = 0x1F;
}

void Fingerprint::update(const void* data, size_t length) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < length; ++i) {
        m_hash ^= bytes[i];
        m_hash *= kFnvPrime;
    }
}

void Fingerprint::updateTag(const std::string& tag) {
    update(tag.data(), tag.size());
    update(&kFieldSeparator, 1);
}

Fingerprint& Fingerprint::add(const std::string& tag, const std::string& value) {
    updateTag(tag);
    uint64_t length = value.size();
    update(&length, sizeof(length));
    update(value.data(), value.size());
    return *this;
}

Fingerprint& Fingerprint::add(const std::string& tag, long long value) {
    updateTag(tag);
    update(&value, sizeof(value));
    return *this;
}

Fingerprint& Fingerprint::add(const std::string& tag, double value) {
    updateTag(tag);
    if (value == 0.0) {
        value = 0.0; // fold -0.0 into +0.0
    }
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    update(&bits, sizeof(bits));
    return *this;
}

std::string Fingerprint::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << m_hash;
    return oss.str();
}

std::string Fingerprint::of(const std::string& text) {
    Fingerprint fingerprint;
    fingerprint.add("text", text);
    return fingerprint.hex();
}

} // namespace Rethink
