#include "sage_join/core/outer_join_store.h"

namespace sage_join {

namespace {

using BufferMap = std::multimap<TimestampedSideKey, BufferedJoinValue>;

/**
 * @brief Cursor over the live multimap
 */
class LiveOuterJoinStoreIterator : public OuterJoinStoreIterator {
public:
    LiveOuterJoinStoreIterator(const std::string& store_name,
                               const BufferMap& data,
                               std::shared_ptr<InMemoryOuterJoinStore::Statistics> stats,
                               std::shared_ptr<int64_t> open_counter)
        : store_name_(store_name),
          cursor_(data.begin()),
          end_(data.end()),
          stats_(std::move(stats)),
          open_counter_(std::move(open_counter)) {
        ++(*open_counter_);
        ++stats_->total_scans;
    }

    ~LiveOuterJoinStoreIterator() override {
        --(*open_counter_);
    }

    bool has_next() const override {
        return cursor_ != end_;
    }

    OuterJoinEntry next() override {
        if (cursor_ == end_) {
            throw StoreException(store_name_, "outer join iterator exhausted");
        }
        OuterJoinEntry entry{cursor_->first, cursor_->second};
        ++cursor_;
        ++stats_->scan_steps;
        return entry;
    }

private:
    std::string store_name_;
    BufferMap::const_iterator cursor_;
    BufferMap::const_iterator end_;
    std::shared_ptr<InMemoryOuterJoinStore::Statistics> stats_;
    std::shared_ptr<int64_t> open_counter_;
};

} // namespace

InMemoryOuterJoinStore::InMemoryOuterJoinStore(const std::string& name)
    : name_(name),
      stats_(std::make_shared<Statistics>()),
      open_iterators_(std::make_shared<int64_t>(0)) {}

void InMemoryOuterJoinStore::put(const TimestampedSideKey& key,
                                 const std::optional<BufferedJoinValue>& value) {
    if (value) {
        // multimap keeps equal keys in insertion order
        data_.emplace(key, *value);
        ++stats_->total_puts;
    } else {
        data_.erase(key);
        ++stats_->total_deletes;
    }
}

std::unique_ptr<OuterJoinStoreIterator> InMemoryOuterJoinStore::all() {
    return std::make_unique<LiveOuterJoinStoreIterator>(name_, data_, stats_, open_iterators_);
}

std::vector<BufferedJoinValue> InMemoryOuterJoinStore::get(const TimestampedSideKey& key) const {
    std::vector<BufferedJoinValue> values;
    auto range = data_.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(it->second);
    }
    return values;
}

bool InMemoryOuterJoinStore::contains(const TimestampedSideKey& key) const {
    return data_.find(key) != data_.end();
}

void InMemoryOuterJoinStore::clear() {
    data_.clear();
    *stats_ = Statistics();
}

} // namespace sage_join
