#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sage_join {

/**
 * @brief Value carried by a stream record
 * 
 * Supports single values, arrays and opaque string payloads
 */
using RecordValue = std::variant<double, std::vector<double>, std::string>;

/**
 * @brief Record headers (string key-value pairs)
 */
using Tags = std::map<std::string, std::string>;

/**
 * @brief The two input sides of a binary join
 *
 * LEFT orders before RIGHT; the outer-join buffer relies on it.
 */
enum class JoinSide {
    LEFT = 0,
    RIGHT = 1
};

inline JoinSide other_side(JoinSide side) {
    return side == JoinSide::LEFT ? JoinSide::RIGHT : JoinSide::LEFT;
}

inline std::string side_to_string(JoinSide side) {
    return side == JoinSide::LEFT ? "left" : "right";
}

/**
 * @brief Stream record
 * 
 * Represents one event delivered on either input side:
 * - key: partitioning key, absent for null-key records
 * - value: payload, absent for tombstones
 * - timestamp: event time in milliseconds
 * - headers: free-form metadata, carried through untouched
 */
struct Record {
    std::optional<std::string> key;
    std::optional<RecordValue> value;
    int64_t timestamp;
    Tags headers;

    Record() : timestamp(0) {}

    Record(std::optional<std::string> k, std::optional<RecordValue> v, int64_t ts)
        : key(std::move(k)), value(std::move(v)), timestamp(ts) {}

    Record(std::optional<std::string> k, std::optional<RecordValue> v, int64_t ts,
           const Tags& h)
        : key(std::move(k)), value(std::move(v)), timestamp(ts), headers(h) {}

    bool has_key() const { return key.has_value(); }
    bool has_value() const { return value.has_value(); }

    /**
     * @brief Copy of this record with a different value
     */
    Record with_value(std::optional<RecordValue> v) const;

    /**
     * @brief Copy of this record with a different key, value and timestamp
     */
    Record with(std::optional<std::string> k, std::optional<RecordValue> v,
                int64_t ts) const;
};

/**
 * @brief Render a value for logs and test diagnostics
 */
std::string value_to_string(const RecordValue& value);

/**
 * @brief Render an optional value, "null" when absent
 */
std::string value_to_string(const std::optional<RecordValue>& value);

} // namespace sage_join
