#include "sage_join/join/side_join_processor.h"
#include "sage_join/core/timestamped_side_key.h"
#include "sage_join/utils/common.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sage_join {

namespace {

/**
 * @brief Shortest look-back over the sides that buffer candidates
 */
int64_t min_outer_lookback(const JoinWindows& windows) {
    int64_t lookback_ms = MAX_TIMESTAMP;
    for (JoinSide side : {JoinSide::LEFT, JoinSide::RIGHT}) {
        if (windows.is_outer(side)) {
            lookback_ms = std::min(lookback_ms, windows.outer_lookback_ms(side));
        }
    }
    return lookback_ms;
}

} // namespace

SideJoinProcessor::SideJoinProcessor(JoinSide this_side,
                                     const JoinWindows& windows,
                                     TimeTracker& tracker,
                                     WindowStore& this_window_store,
                                     WindowStore& other_window_store,
                                     OuterJoinStore* outer_store,
                                     ValueJoiner joiner,
                                     ProcessorContext& context,
                                     JoinMetrics& metrics,
                                     RecordValidator validator)
    : this_side_(this_side),
      other_side_(other_side(this_side)),
      windows_(windows),
      outer_(windows.is_outer(this_side)),
      other_outer_(windows.is_outer(other_side(this_side))),
      join_before_ms_(windows.probe_before_ms(this_side)),
      join_after_ms_(windows.probe_after_ms(this_side)),
      join_grace_ms_(windows.grace_ms()),
      min_outer_lookback_ms_(min_outer_lookback(windows)),
      tracker_(tracker),
      this_window_store_(this_window_store),
      other_window_store_(other_window_store),
      outer_store_(outer_store),
      joiner_(std::move(joiner)),
      context_(context),
      metrics_(metrics),
      validator_(std::move(validator)) {
    if (!joiner_) {
        throw std::invalid_argument("SideJoinProcessor: value joiner must be set");
    }
}

void SideJoinProcessor::process(const Record& record) {
    ++processed_counter();
    tracker_.advance_stream_time(record.timestamp);

    // A null key can be neither stored nor matched: it is an instant non-match
    if (outer_ && !record.has_key() && record.has_value()) {
        context_.forward(record.with_value(join_values(record.key, record.value, std::nullopt)));
        ++metrics_.outer_results_immediate;
        return;
    }
    if (skip_record(record)) {
        return;
    }

    this_window_store_.put(*record.key, *record.value, record.timestamp);

    // Scans are amortized against stream-time advancement
    if (outer_store_ != nullptr && record.timestamp == tracker_.stream_time) {
        emit_non_joined_outer_records(record);
    }

    perform_inner_join(record);
}

bool SideJoinProcessor::skip_record(const Record& record) {
    std::string reason;
    if (!record.has_key() || !record.has_value()) {
        reason = "null key or value";
    } else if (record.timestamp < 0) {
        reason = "negative timestamp";
    } else if (validator_ && !validator_(record)) {
        reason = "failed validation";
    } else {
        return false;
    }

    ++metrics_.dropped_records;
    std::cerr << "SideJoinProcessor: skipping " << side_to_string(this_side_)
              << " record due to " << reason
              << ", key=" << record.key.value_or("null")
              << " value=" << value_to_string(record.value)
              << " timestamp=" << record.timestamp << std::endl;
    return true;
}

void SideJoinProcessor::perform_inner_join(const Record& record) {
    const std::string& key = *record.key;
    const int64_t timestamp = record.timestamp;
    const int64_t time_from = std::max<int64_t>(0, saturating_add(timestamp, -join_before_ms_));
    const int64_t time_to = std::max<int64_t>(0, saturating_add(timestamp, join_after_ms_));

    bool matched = false;
    {
        auto iter = other_window_store_.fetch(key, time_from, time_to);
        while (iter->has_next()) {
            matched = true;
            emit_inner_join(record, iter->next());
        }
    }

    if (matched || !outer_) {
        return;
    }

    // The window may already have closed when an out-of-order record arrives
    const bool window_closed =
        saturating_add(time_to, join_grace_ms_) < tracker_.stream_time;
    if (outer_store_ == nullptr || window_closed) {
        context_.forward(record.with_value(join_values(key, record.value, std::nullopt)));
        ++metrics_.outer_results_immediate;
    } else {
        tracker_.update_min_time(timestamp);
        outer_store_->put(TimestampedSideKey(timestamp, this_side_, key),
                          BufferedJoinValue::make(this_side_, *record.value));
        ++metrics_.buffered_records;
    }
}

void SideJoinProcessor::emit_inner_join(const Record& record, const WindowStoreEntry& other) {
    if (outer_store_ != nullptr && other_outer_) {
        // The other record is matched now; its pending non-joined candidate
        // must never be emitted
        outer_store_->put(TimestampedSideKey(other.timestamp, other_side_, *record.key),
                          std::nullopt);
    }

    const int64_t result_timestamp =
        windows_.timestamp_policy() == TimestampPolicy::MAX_OF_BOTH
            ? std::max(record.timestamp, other.timestamp)
            : record.timestamp;

    context_.forward(record.with(record.key,
                                 join_values(record.key, record.value, other.value),
                                 result_timestamp));
    ++metrics_.inner_join_results;
}

void SideJoinProcessor::emit_non_joined_outer_records(const Record& record) {
    // Opening a full scan is the expensive part; skip it unless some
    // buffered candidate might have closed
    if (saturating_add(tracker_.min_time, saturating_add(min_outer_lookback_ms_, join_grace_ms_))
            >= tracker_.stream_time) {
        return;
    }
    // Throttle on processing time, independent of event-time density
    const int64_t now = context_.current_system_time_ms();
    if (now < tracker_.next_time_to_emit) {
        return;
    }
    tracker_.advance_next_time_to_emit(now);

    // Recomputed from the candidates that stay buffered
    tracker_.reset_min_time();
    ++metrics_.outer_scans;

    auto iter = outer_store_->all();
    std::optional<TimestampedSideKey> prev_key;
    bool left_window_open = false;
    bool right_window_open = false;

    while (iter->has_next()) {
        if (left_window_open && right_window_open) {
            // Both sides hit an open window: nothing further on can be closed
            break;
        }

        OuterJoinEntry next = iter->next();
        ++metrics_.outer_scan_steps;
        const TimestampedSideKey& key = next.key;
        const int64_t timestamp = key.timestamp();
        const int64_t lookback_ms = windows_.outer_lookback_ms(key.side());

        if (saturating_add(timestamp, lookback_ms + join_grace_ms_) >= tracker_.stream_time) {
            tracker_.update_min_time(timestamp);
            // Later entries of this side are open too; so are later entries
            // of the other side when its look-back is at least as long
            const bool other_side_open_too =
                windows_.outer_lookback_ms(other_side(key.side())) >= lookback_ms;
            if (key.is_left_side() || other_side_open_too) {
                left_window_open = true;
            }
            if (!key.is_left_side() || other_side_open_too) {
                right_window_open = true;
            }
            continue;
        }

        if (prev_key && *prev_key != key) {
            // Blind delete: no read before the write
            outer_store_->put(*prev_key, std::nullopt);
            prev_key.reset();
        }

        try {
            const RecordValue joined =
                joiner_(key.key(), next.value.left_value(), next.value.right_value());
            context_.forward(record.with(key.key(), joined, timestamp));
        } catch (...) {
            // The candidate stays buffered; keep it visible to the fast exit
            tracker_.update_min_time(timestamp);
            throw;
        }
        ++metrics_.outer_results_buffered;
        prev_key = key;
    }

    // The last emitted key is not covered by the loop
    if (prev_key) {
        outer_store_->put(*prev_key, std::nullopt);
    }
}

RecordValue SideJoinProcessor::join_values(const std::optional<std::string>& key,
                                           const std::optional<RecordValue>& this_value,
                                           const std::optional<RecordValue>& other_value) const {
    if (this_side_ == JoinSide::LEFT) {
        return joiner_(key, this_value, other_value);
    }
    return joiner_(key, other_value, this_value);
}

int64_t& SideJoinProcessor::processed_counter() {
    return this_side_ == JoinSide::LEFT ? metrics_.left_records_processed
                                        : metrics_.right_records_processed;
}

} // namespace sage_join
