#pragma once

#include "../core/outer_join_store.h"
#include "../core/window_store.h"
#include "stream_stream_join.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace sage_join {

/**
 * @brief Callback receiving the results of every partition
 * 
 * Invoked from the thread driving the partition; must be thread-safe when
 * partitions are driven from several threads.
 */
using PartitionForwardCallback = std::function<void(int32_t partition, const Record& record)>;

/**
 * @brief Wall clock in milliseconds, used to throttle outer scans
 */
using WallClock = std::function<int64_t()>;

/**
 * @brief Stream-stream join over a partitioned input
 * 
 * Each partition gets its own StreamStreamJoin with its own time tracker,
 * window stores and outer-join store, created on the first record of the
 * partition. No join state is shared across partitions.
 * 
 * Thread safety:
 * - The partition table is protected by a read-write lock
 * - Each partition's state has its own mutex, held while a record is
 *   processed and while its statistics are read or it is closed
 * - Each partition should be driven by one thread; records of one
 *   partition from several threads are serialized in arbitrary order
 */
class PartitionedStreamJoin {
public:
    /**
     * @param windows Window bounds and join options for every partition
     * @param joiner Result builder
     * @param callback Result sink
     * @param clock Wall clock, system clock when empty
     * @throws std::invalid_argument when joiner or callback is empty
     */
    PartitionedStreamJoin(const JoinWindows& windows,
                          ValueJoiner joiner,
                          PartitionForwardCallback callback,
                          WallClock clock = nullptr);
    ~PartitionedStreamJoin();

    /**
     * @brief Process one record of a partition
     * @throws StoreException on store failure; anything the callback throws
     */
    void process(int32_t partition, JoinSide side, const Record& record);

    bool has_partition(int32_t partition) const;

    size_t num_partitions() const;

    /**
     * @brief Drop all state of a partition (e.g. after it moved elsewhere)
     * 
     * Waits for a record of the partition that is being processed.
     * @return true if the partition existed
     */
    bool close_partition(int32_t partition);

    /**
     * @brief Statistics of one partition, empty if unknown
     */
    std::map<std::string, int64_t> get_stats(int32_t partition) const;

    /**
     * @brief Statistics summed over partitions (stream_time is the maximum)
     * 
     * Each partition is read under its own lock, so partitions may be
     * sampled at different points of their processing.
     */
    std::map<std::string, int64_t> get_stats() const;

private:
    struct PartitionState;

    std::shared_ptr<PartitionState> get_or_create(int32_t partition);

    JoinWindows windows_;
    ValueJoiner joiner_;
    PartitionForwardCallback callback_;
    WallClock clock_;

    std::map<int32_t, std::shared_ptr<PartitionState>> partitions_;
    mutable std::shared_mutex mutex_;
};

} // namespace sage_join
