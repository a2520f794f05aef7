#pragma once

#include "side_join_processor.h"
#include <cstdint>
#include <map>
#include <string>

namespace sage_join {

/**
 * @brief Windowed stream-stream join operator of one partition
 * 
 * Owns the shared TimeTracker and the two SideJoinProcessors. Stores and
 * the context are borrowed and must outlive the operator.
 * 
 * Join types:
 * - inner: only matched pairs are emitted
 * - left / right: unmatched records of that side are emitted with an
 *   absent counterpart once their window has closed
 * - outer: unmatched records of both sides are emitted
 * 
 * Unmatched candidates wait in the outer-join store until the stream time
 * passes record time + look-back + grace. Without an outer store they are
 * emitted as soon as they fail to match.
 */
class StreamStreamJoin {
public:
    /**
     * @param windows Window bounds and join options
     * @param left_store Window store of the left side (not owned)
     * @param right_store Window store of the right side (not owned)
     * @param outer_store Outer-join buffer, may be nullptr (not owned)
     * @param joiner Result builder
     * @param context Emission sink and clock (not owned)
     * @param validator Optional extra validity check
     * @throws std::invalid_argument for unusable stores or a missing joiner
     */
    StreamStreamJoin(const JoinWindows& windows,
                     WindowStore& left_store,
                     WindowStore& right_store,
                     OuterJoinStore* outer_store,
                     ValueJoiner joiner,
                     ProcessorContext& context,
                     RecordValidator validator = nullptr);

    StreamStreamJoin(const StreamStreamJoin&) = delete;
    StreamStreamJoin& operator=(const StreamStreamJoin&) = delete;

    void process_left(const Record& record) { left_processor_.process(record); }
    void process_right(const Record& record) { right_processor_.process(record); }

    void process(JoinSide side, const Record& record);

    const JoinWindows& windows() const { return windows_; }
    const TimeTracker& time_tracker() const { return tracker_; }
    const JoinMetrics& metrics() const { return metrics_; }

    /**
     * @brief Whether unmatched candidates are buffered
     */
    bool buffers_outer_results() const { return outer_store_ != nullptr; }

    /**
     * @brief Get join statistics
     */
    std::map<std::string, int64_t> get_stats() const;

private:
    static OuterJoinStore* select_outer_store(const JoinWindows& windows,
                                              OuterJoinStore* outer_store);

    JoinWindows windows_;
    OuterJoinStore* outer_store_;
    TimeTracker tracker_;
    JoinMetrics metrics_;
    SideJoinProcessor left_processor_;
    SideJoinProcessor right_processor_;
};

} // namespace sage_join
