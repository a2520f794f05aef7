#pragma once

#include "../utils/common.h"
#include <cstdint>

namespace sage_join {

/**
 * @brief Event-time state shared by both sides of one join operator
 * 
 * Owned by the join operator; both side processors hold a reference.
 * All access happens on the partition's task thread, so there is no locking.
 */
class TimeTracker {
public:
    explicit TimeTracker(int64_t emit_interval_ms = 1000)
        : stream_time(NO_TIMESTAMP),
          min_time(MAX_TIMESTAMP),
          next_time_to_emit(0),
          emit_interval_ms_(emit_interval_ms) {}

    /**
     * @brief stream_time = max(stream_time, timestamp)
     */
    void advance_stream_time(int64_t timestamp);

    /**
     * @brief min_time = min(min_time, timestamp)
     */
    void update_min_time(int64_t timestamp);

    /**
     * @brief Mark the buffer as possibly empty (min_time = +infinity)
     */
    void reset_min_time() { min_time = MAX_TIMESTAMP; }

    /**
     * @brief Resync the emit deadline to now + emit interval
     */
    void advance_next_time_to_emit(int64_t now_ms);

    int64_t emit_interval_ms() const { return emit_interval_ms_; }

    // Max timestamp seen on either side
    int64_t stream_time;
    // Lower bound of buffered timestamps, MAX_TIMESTAMP when none
    int64_t min_time;
    // Processing-time deadline of the next outer scan
    int64_t next_time_to_emit;

private:
    int64_t emit_interval_ms_;
};

} // namespace sage_join
