#pragma once

#include "record.h"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace sage_join {

/**
 * @brief Composite key of the outer-join buffer
 * 
 * Combines (timestamp, side, key) and orders primarily by timestamp,
 * then by side (left before right), then by key. An ordered scan of the
 * buffer therefore visits candidates in event-time order, which is what
 * lets the buffer scanner stop at the first open window of each side.
 */
class TimestampedSideKey {
public:
    TimestampedSideKey(int64_t timestamp, JoinSide side, std::string key)
        : timestamp_(timestamp), side_(side), key_(std::move(key)) {}

    static TimestampedSideKey make_left(const std::string& key, int64_t timestamp) {
        return TimestampedSideKey(timestamp, JoinSide::LEFT, key);
    }

    static TimestampedSideKey make_right(const std::string& key, int64_t timestamp) {
        return TimestampedSideKey(timestamp, JoinSide::RIGHT, key);
    }

    int64_t timestamp() const { return timestamp_; }
    JoinSide side() const { return side_; }
    const std::string& key() const { return key_; }
    bool is_left_side() const { return side_ == JoinSide::LEFT; }

    bool operator==(const TimestampedSideKey& other) const {
        return timestamp_ == other.timestamp_ && side_ == other.side_ &&
               key_ == other.key_;
    }

    bool operator!=(const TimestampedSideKey& other) const {
        return !(*this == other);
    }

    bool operator<(const TimestampedSideKey& other) const {
        // Primary order: timestamp (ascending)
        if (timestamp_ != other.timestamp_) {
            return timestamp_ < other.timestamp_;
        }
        // Secondary order: side (left first)
        if (side_ != other.side_) {
            return side_ < other.side_;
        }
        return key_ < other.key_;
    }

    bool operator>(const TimestampedSideKey& other) const { return other < *this; }
    bool operator<=(const TimestampedSideKey& other) const { return !(other < *this); }
    bool operator>=(const TimestampedSideKey& other) const { return !(*this < other); }

    std::string to_string() const;

private:
    int64_t timestamp_;
    JoinSide side_;
    std::string key_;
};

std::ostream& operator<<(std::ostream& out, const TimestampedSideKey& key);

/**
 * @brief Value of the outer-join buffer
 * 
 * Holds the value of a record still waiting for a match from the other
 * side. Exactly one of left_value() / right_value() is populated.
 */
class BufferedJoinValue {
public:
    static BufferedJoinValue make_left(RecordValue value) {
        return BufferedJoinValue(JoinSide::LEFT, std::move(value));
    }

    static BufferedJoinValue make_right(RecordValue value) {
        return BufferedJoinValue(JoinSide::RIGHT, std::move(value));
    }

    static BufferedJoinValue make(JoinSide side, RecordValue value) {
        return BufferedJoinValue(side, std::move(value));
    }

    JoinSide side() const { return side_; }

    /**
     * @brief Left value, empty when this entry was buffered by the right side
     */
    const std::optional<RecordValue>& left_value() const { return left_; }

    /**
     * @brief Right value, empty when this entry was buffered by the left side
     */
    const std::optional<RecordValue>& right_value() const { return right_; }

    /**
     * @brief The populated value
     * @throws std::out_of_range never for values built by the factories
     */
    const RecordValue& value() const;

    bool operator==(const BufferedJoinValue& other) const {
        return side_ == other.side_ && left_ == other.left_ && right_ == other.right_;
    }

private:
    BufferedJoinValue(JoinSide side, RecordValue value);

    JoinSide side_;
    std::optional<RecordValue> left_;
    std::optional<RecordValue> right_;
};

} // namespace sage_join
