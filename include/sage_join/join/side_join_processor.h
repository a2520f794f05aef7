#pragma once

#include "../core/outer_join_store.h"
#include "../core/record.h"
#include "../core/window_store.h"
#include "join_windows.h"
#include "processor_context.h"
#include "time_tracker.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace sage_join {

/**
 * @brief Builds the result value of a join
 * 
 * Arguments are always in (key, left, right) order. An absent side means
 * the result is a non-joined outer result; the key is absent only for
 * null-key records passed through by an outer side.
 */
using ValueJoiner = std::function<RecordValue(const std::optional<std::string>& key,
                                              const std::optional<RecordValue>& left,
                                              const std::optional<RecordValue>& right)>;

/**
 * @brief Extra validity check; records it rejects are dropped and counted
 */
using RecordValidator = std::function<bool(const Record&)>;

/**
 * @brief Counters of one join operator, shared by both side processors
 */
struct JoinMetrics {
    int64_t left_records_processed = 0;
    int64_t right_records_processed = 0;
    int64_t inner_join_results = 0;
    int64_t outer_results_immediate = 0;    // null-key or already-closed windows
    int64_t outer_results_buffered = 0;     // emitted by the buffer scanner
    int64_t dropped_records = 0;
    int64_t buffered_records = 0;
    int64_t outer_scans = 0;
    int64_t outer_scan_steps = 0;
};

/**
 * @brief Join logic for records arriving on one side
 * 
 * The same class serves both sides; this_side selects which window store is
 * written, which one is probed, which probe bounds apply and whether
 * unmatched records of this side produce outer results.
 * 
 * Per record:
 * 1. Advance the shared stream time
 * 2. Pass null-key records straight through on an outer side
 * 3. Drop invalid records
 * 4. Store the record in this side's window store
 * 5. On a new stream time, flush outer candidates whose window closed
 * 6. Probe the other side's window store and emit matches
 * 7. Buffer or emit the record as non-joined when nothing matched
 * 
 * Store failures propagate as StoreException. Not thread-safe: one
 * partition task drives both processors of an operator.
 */
class SideJoinProcessor {
public:
    /**
     * @param this_side Side whose records this processor receives
     * @param windows Window bounds and join type
     * @param tracker Shared time tracker (not owned)
     * @param this_window_store Window store of this side (not owned)
     * @param other_window_store Window store of the other side (not owned)
     * @param outer_store Outer-join buffer, nullptr disables buffering (not owned)
     * @param joiner Result builder
     * @param context Emission sink and clock (not owned)
     * @param metrics Operator counters (not owned)
     * @param validator Optional extra validity check
     */
    SideJoinProcessor(JoinSide this_side,
                      const JoinWindows& windows,
                      TimeTracker& tracker,
                      WindowStore& this_window_store,
                      WindowStore& other_window_store,
                      OuterJoinStore* outer_store,
                      ValueJoiner joiner,
                      ProcessorContext& context,
                      JoinMetrics& metrics,
                      RecordValidator validator = nullptr);

    /**
     * @brief Process one record of this side
     * @throws StoreException on store failure; anything the context throws
     */
    void process(const Record& record);

private:
    bool skip_record(const Record& record);

    void perform_inner_join(const Record& record);

    void emit_inner_join(const Record& record, const WindowStoreEntry& other);

    /**
     * @brief Emit and prune buffered candidates whose window has closed
     * 
     * The scan follows TimestampedSideKey order and stops once neither
     * side can have a closed candidate further on. Emitted keys are
     * deleted one step behind the cursor, because a delete drops every
     * value under the key and the cursor may not have visited all of them.
     */
    void emit_non_joined_outer_records(const Record& record);

    /**
     * @brief Place this/other values into left/right order and join them
     */
    RecordValue join_values(const std::optional<std::string>& key,
                            const std::optional<RecordValue>& this_value,
                            const std::optional<RecordValue>& other_value) const;

    int64_t& processed_counter();

    JoinSide this_side_;
    JoinSide other_side_;
    JoinWindows windows_;
    bool outer_;
    bool other_outer_;
    int64_t join_before_ms_;
    int64_t join_after_ms_;
    int64_t join_grace_ms_;
    int64_t min_outer_lookback_ms_;

    TimeTracker& tracker_;
    WindowStore& this_window_store_;
    WindowStore& other_window_store_;
    OuterJoinStore* outer_store_;
    ValueJoiner joiner_;
    ProcessorContext& context_;
    JoinMetrics& metrics_;
    RecordValidator validator_;
};

} // namespace sage_join
