#pragma once

#include "../core/record.h"
#include <cstdint>
#include <map>
#include <string>

namespace sage_join {

/**
 * @brief Join configuration (string key-value pairs)
 */
using JoinConfig = std::map<std::string, std::string>;

/**
 * @brief Which sides emit a result for records that never found a match
 */
enum class JoinType {
    INNER,
    LEFT,
    RIGHT,
    OUTER
};

/**
 * @brief Timestamp attached to an inner join result
 */
enum class TimestampPolicy {
    TRIGGERING_RECORD,  ///< Timestamp of the record that completed the pair
    MAX_OF_BOTH         ///< Larger of the two record timestamps
};

constexpr int64_t DEFAULT_EMIT_INTERVAL_MS = 1000;

std::string join_type_to_string(JoinType type);

/**
 * @throws std::invalid_argument for unknown names
 */
JoinType string_to_join_type(const std::string& str);

/**
 * @brief Window bounds and join options
 * 
 * A left record at time t joins right records in [t - before, t + after];
 * a right record at time t joins left records in [t - after, t + before].
 * Candidates become non-matchable grace milliseconds after that.
 * 
 * Configuration keys for from_config():
 * - before_ms, after_ms: window bounds (required unless time_difference_ms is set)
 * - time_difference_ms: sets both bounds
 * - grace_ms: default 0
 * - emit_interval_ms: outer scan throttle, default 1000
 * - join_type: inner | left | right | outer, default inner
 * - timestamp_policy: triggering | max, default triggering
 * - outer_buffer: true | false, default true
 * 
 * All builders throw std::invalid_argument for negative values.
 */
class JoinWindows {
public:
    static JoinWindows of_time_difference_and_grace(int64_t time_difference_ms,
                                                    int64_t grace_ms);

    static JoinWindows of_time_difference_no_grace(int64_t time_difference_ms);

    static JoinWindows from_config(const JoinConfig& config);

    JoinWindows before(int64_t before_ms) const;
    JoinWindows after(int64_t after_ms) const;
    JoinWindows grace(int64_t grace_ms) const;
    JoinWindows with_join_type(JoinType type) const;
    JoinWindows with_timestamp_policy(TimestampPolicy policy) const;
    JoinWindows with_emit_interval(int64_t emit_interval_ms) const;
    JoinWindows with_outer_buffer(bool enabled) const;

    int64_t before_ms() const { return before_ms_; }
    int64_t after_ms() const { return after_ms_; }
    int64_t grace_ms() const { return grace_ms_; }
    int64_t emit_interval_ms() const { return emit_interval_ms_; }
    JoinType join_type() const { return join_type_; }
    TimestampPolicy timestamp_policy() const { return timestamp_policy_; }
    bool outer_buffer() const { return outer_buffer_; }

    /**
     * @brief before + after
     */
    int64_t size_ms() const { return before_ms_ + after_ms_; }

    /**
     * @brief Minimum retention for the window stores of this join
     */
    int64_t retention_ms() const { return size_ms() + grace_ms_; }

    /**
     * @brief Whether unmatched records of this side produce a result
     */
    bool is_outer(JoinSide side) const;

    /**
     * @brief Whether an outer-join buffer is used at all
     */
    bool uses_outer_buffer() const {
        return outer_buffer_ && (is_outer(JoinSide::LEFT) || is_outer(JoinSide::RIGHT));
    }

    /**
     * @brief How far back a record of this side probes the other side
     */
    int64_t probe_before_ms(JoinSide side) const {
        return side == JoinSide::LEFT ? before_ms_ : after_ms_;
    }

    /**
     * @brief How far ahead a record of this side probes the other side
     */
    int64_t probe_after_ms(JoinSide side) const {
        return side == JoinSide::LEFT ? after_ms_ : before_ms_;
    }

    /**
     * @brief Distance past a buffered record of this side after which
     *        no record of the other side can match it anymore
     */
    int64_t outer_lookback_ms(JoinSide side) const {
        return probe_after_ms(side);
    }

    std::string to_string() const;

private:
    JoinWindows(int64_t before_ms, int64_t after_ms, int64_t grace_ms);

    int64_t before_ms_;
    int64_t after_ms_;
    int64_t grace_ms_;
    int64_t emit_interval_ms_;
    JoinType join_type_;
    TimestampPolicy timestamp_policy_;
    bool outer_buffer_;
};

} // namespace sage_join
