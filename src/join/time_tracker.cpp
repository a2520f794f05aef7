#include "sage_join/join/time_tracker.h"
#include <algorithm>

namespace sage_join {

void TimeTracker::advance_stream_time(int64_t timestamp) {
    stream_time = std::max(stream_time, timestamp);
}

void TimeTracker::update_min_time(int64_t timestamp) {
    min_time = std::min(min_time, timestamp);
}

void TimeTracker::advance_next_time_to_emit(int64_t now_ms) {
    // Rebased on the current clock, not on the previous deadline
    next_time_to_emit = saturating_add(now_ms, emit_interval_ms_);
}

} // namespace sage_join
