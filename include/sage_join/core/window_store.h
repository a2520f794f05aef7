#pragma once

#include "record.h"
#include "store_exception.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sage_join {

/**
 * @brief One (timestamp, value) pair returned by a window fetch
 */
struct WindowStoreEntry {
    int64_t timestamp;
    RecordValue value;
};

/**
 * @brief Iterator over a window fetch, ascending by timestamp
 * 
 * Resources held by the iterator are released by its destructor;
 * callers hold it in a std::unique_ptr.
 */
class WindowStoreIterator {
public:
    virtual ~WindowStoreIterator() = default;

    virtual bool has_next() const = 0;

    /**
     * @brief Advance and return the next entry
     * @throws StoreException when called past the end
     */
    virtual WindowStoreEntry next() = 0;
};

/**
 * @brief Windowed key-value store of one join side
 * 
 * Maps (key, timestamp) to values, keeping duplicates. Entries older than
 * the retention period relative to the store's observed stream time may be
 * purged at any time.
 */
class WindowStore {
public:
    virtual ~WindowStore() = default;

    /**
     * @brief Append a value under (key, timestamp)
     * @throws StoreException on write failure
     */
    virtual void put(const std::string& key, const RecordValue& value, int64_t timestamp) = 0;

    /**
     * @brief Fetch all values of a key within [time_from, time_to]
     * @return Iterator ascending by timestamp
     * @throws StoreException on read failure
     */
    virtual std::unique_ptr<WindowStoreIterator> fetch(
        const std::string& key, int64_t time_from, int64_t time_to) = 0;

    virtual const std::string& name() const = 0;

    virtual int64_t retention_period() const = 0;
};

/**
 * @brief In-memory WindowStore with retention
 * 
 * Features:
 * - Per-key timestamp-ordered multimap, duplicates retained
 * - Records behind the retention horizon are dropped on put and hidden from fetch
 * - Lazy purge of expired entries once per segment interval
 * - Open iterator accounting for leak checks
 */
class InMemoryWindowStore : public WindowStore {
public:
    /**
     * @param name Store name used in logs and errors
     * @param retention_period_ms Time entries stay visible behind observed stream time
     * @param segment_interval_ms Purge granularity, 0 picks max(retention / 2, 60000)
     */
    InMemoryWindowStore(const std::string& name,
                        int64_t retention_period_ms,
                        int64_t segment_interval_ms = 0);
    ~InMemoryWindowStore() override = default;

    void put(const std::string& key, const RecordValue& value, int64_t timestamp) override;

    std::unique_ptr<WindowStoreIterator> fetch(
        const std::string& key, int64_t time_from, int64_t time_to) override;

    const std::string& name() const override { return name_; }
    int64_t retention_period() const override { return retention_period_ms_; }

    /**
     * @brief Number of live entries across all keys
     */
    size_t size() const { return num_entries_; }

    /**
     * @brief Iterators handed out by fetch() and not yet destroyed
     */
    int64_t open_iterators() const { return *open_iterators_; }

    int64_t observed_stream_time() const { return observed_stream_time_; }

    /**
     * @brief Records dropped on put because they were already expired
     */
    int64_t expired_records_dropped() const { return expired_records_dropped_; }

    void clear();

private:
    /**
     * @brief Smallest timestamp still visible
     */
    int64_t min_live_time() const;

    void purge_expired();

    std::string name_;
    int64_t retention_period_ms_;
    int64_t segment_interval_ms_;

    // key -> {timestamp -> value}
    std::map<std::string, std::multimap<int64_t, RecordValue>> data_;
    size_t num_entries_;

    int64_t observed_stream_time_;
    int64_t last_purge_time_;
    int64_t expired_records_dropped_;
    std::shared_ptr<int64_t> open_iterators_;
};

} // namespace sage_join
