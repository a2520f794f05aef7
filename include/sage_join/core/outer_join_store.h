#pragma once

#include "timestamped_side_key.h"
#include "store_exception.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sage_join {

/**
 * @brief One buffered candidate returned by an outer-join store scan
 */
struct OuterJoinEntry {
    TimestampedSideKey key;
    BufferedJoinValue value;
};

/**
 * @brief Ordered iterator over the outer-join store
 * 
 * Yields entries in TimestampedSideKey order. Released by its destructor.
 */
class OuterJoinStoreIterator {
public:
    virtual ~OuterJoinStoreIterator() = default;

    virtual bool has_next() const = 0;

    /**
     * @brief Advance and return the next entry
     * @throws StoreException when called past the end
     */
    virtual OuterJoinEntry next() = 0;
};

/**
 * @brief Buffer of non-joined records waiting for their window to close
 * 
 * A key may hold several values. put() with a value appends to the key's
 * list; put() with std::nullopt removes every value of the key without
 * reading it first.
 */
class OuterJoinStore {
public:
    virtual ~OuterJoinStore() = default;

    /**
     * @brief Append a value, or blind-delete the key when value is empty
     * @throws StoreException on write failure
     */
    virtual void put(const TimestampedSideKey& key,
                     const std::optional<BufferedJoinValue>& value) = 0;

    /**
     * @brief Full scan in key order
     * @throws StoreException on read failure
     */
    virtual std::unique_ptr<OuterJoinStoreIterator> all() = 0;

    virtual const std::string& name() const = 0;
};

/**
 * @brief In-memory OuterJoinStore backed by an ordered multimap
 * 
 * The scan walks the live container. Deleting keys behind the cursor is
 * safe while an iterator is open; the entry the cursor points at next
 * must stay in place.
 */
class InMemoryOuterJoinStore : public OuterJoinStore {
public:
    explicit InMemoryOuterJoinStore(const std::string& name);
    ~InMemoryOuterJoinStore() override = default;

    void put(const TimestampedSideKey& key,
             const std::optional<BufferedJoinValue>& value) override;

    std::unique_ptr<OuterJoinStoreIterator> all() override;

    const std::string& name() const override { return name_; }

    /**
     * @brief All values stored under a key, in insertion order
     */
    std::vector<BufferedJoinValue> get(const TimestampedSideKey& key) const;

    bool contains(const TimestampedSideKey& key) const;

    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Statistics
    struct Statistics {
        uint64_t total_puts = 0;
        uint64_t total_deletes = 0;
        uint64_t total_scans = 0;
        uint64_t scan_steps = 0;      // entries returned by scan iterators
    };

    Statistics get_statistics() const { return *stats_; }

    int64_t open_iterators() const { return *open_iterators_; }

    void clear();

private:
    std::string name_;
    std::multimap<TimestampedSideKey, BufferedJoinValue> data_;
    std::shared_ptr<Statistics> stats_;
    std::shared_ptr<int64_t> open_iterators_;
};

} // namespace sage_join
