#include "sage_join/join/stream_stream_join.h"
#include <stdexcept>

namespace sage_join {

namespace {

void check_window_store(const JoinWindows& windows, const WindowStore& store) {
    if (store.retention_period() < windows.retention_ms()) {
        throw std::invalid_argument(
            "Window store '" + store.name() + "' retention " +
            std::to_string(store.retention_period()) +
            "ms is shorter than window size plus grace " +
            std::to_string(windows.retention_ms()) + "ms");
    }
}

} // namespace

StreamStreamJoin::StreamStreamJoin(const JoinWindows& windows,
                                   WindowStore& left_store,
                                   WindowStore& right_store,
                                   OuterJoinStore* outer_store,
                                   ValueJoiner joiner,
                                   ProcessorContext& context,
                                   RecordValidator validator)
    : windows_(windows),
      outer_store_(select_outer_store(windows, outer_store)),
      tracker_(windows.emit_interval_ms()),
      left_processor_(JoinSide::LEFT, windows_, tracker_, left_store, right_store,
                      outer_store_, joiner, context, metrics_, validator),
      right_processor_(JoinSide::RIGHT, windows_, tracker_, right_store, left_store,
                       outer_store_, joiner, context, metrics_, validator) {
    if (&left_store == &right_store) {
        throw std::invalid_argument("Left and right sides need distinct window stores");
    }
    check_window_store(windows_, left_store);
    check_window_store(windows_, right_store);
}

OuterJoinStore* StreamStreamJoin::select_outer_store(const JoinWindows& windows,
                                                     OuterJoinStore* outer_store) {
    // Inner joins, and joins with buffering switched off, never buffer
    return windows.uses_outer_buffer() ? outer_store : nullptr;
}

void StreamStreamJoin::process(JoinSide side, const Record& record) {
    if (side == JoinSide::LEFT) {
        left_processor_.process(record);
    } else {
        right_processor_.process(record);
    }
}

std::map<std::string, int64_t> StreamStreamJoin::get_stats() const {
    return {
        {"left_records_processed", metrics_.left_records_processed},
        {"right_records_processed", metrics_.right_records_processed},
        {"inner_join_results", metrics_.inner_join_results},
        {"outer_results_immediate", metrics_.outer_results_immediate},
        {"outer_results_buffered", metrics_.outer_results_buffered},
        {"dropped_records", metrics_.dropped_records},
        {"buffered_records", metrics_.buffered_records},
        {"outer_scans", metrics_.outer_scans},
        {"outer_scan_steps", metrics_.outer_scan_steps},
        {"stream_time", tracker_.stream_time}
    };
}

} // namespace sage_join
