#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace sage_join {

/**
 * @brief Common utilities
 */

// Version information
constexpr const char* SAGE_JOIN_VERSION = "0.1.0";
constexpr int SAGE_JOIN_VERSION_MAJOR = 0;
constexpr int SAGE_JOIN_VERSION_MINOR = 1;
constexpr int SAGE_JOIN_VERSION_PATCH = 0;

// Stream time before any record has been observed
constexpr int64_t NO_TIMESTAMP = -1;

// +infinity for event-time bounds
constexpr int64_t MAX_TIMESTAMP = std::numeric_limits<int64_t>::max();

/**
 * @brief Saturating addition for event-time arithmetic
 *
 * MAX_TIMESTAMP stays MAX_TIMESTAMP, so "+infinity + window" never wraps.
 */
inline int64_t saturating_add(int64_t a, int64_t b) {
    if (b > 0 && a > MAX_TIMESTAMP - b) {
        return MAX_TIMESTAMP;
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return std::numeric_limits<int64_t>::min();
    }
    return a + b;
}

} // namespace sage_join
