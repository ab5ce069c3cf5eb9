// =================================================================
// src/Rethink/ResilienceErrors.cpp
// =================================================================
// String conversion for error kinds.

#include "Rethink/ResilienceErrors.hpp"

namespace Rethink {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT: return "TRANSIENT";
        case ErrorKind::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorKind::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorKind::UNAUTHORIZED: return "UNAUTHORIZED";
        case ErrorKind::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case ErrorKind::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

} // namespace Rethink
