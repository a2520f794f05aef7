#include "sage_join/core/window_store.h"
#include "sage_join/utils/common.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sage_join {

namespace {

constexpr int64_t MIN_SEGMENT_INTERVAL_MS = 60000;

/**
 * @brief Iterator over a materialized fetch result
 */
class MaterializedWindowStoreIterator : public WindowStoreIterator {
public:
    MaterializedWindowStoreIterator(const std::string& store_name,
                                    std::vector<WindowStoreEntry> entries,
                                    std::shared_ptr<int64_t> open_counter)
        : store_name_(store_name),
          entries_(std::move(entries)),
          position_(0),
          open_counter_(std::move(open_counter)) {
        ++(*open_counter_);
    }

    ~MaterializedWindowStoreIterator() override {
        --(*open_counter_);
    }

    bool has_next() const override {
        return position_ < entries_.size();
    }

    WindowStoreEntry next() override {
        if (position_ >= entries_.size()) {
            throw StoreException(store_name_, "window iterator exhausted");
        }
        return entries_[position_++];
    }

private:
    std::string store_name_;
    std::vector<WindowStoreEntry> entries_;
    size_t position_;
    std::shared_ptr<int64_t> open_counter_;
};

} // namespace

InMemoryWindowStore::InMemoryWindowStore(const std::string& name,
                                         int64_t retention_period_ms,
                                         int64_t segment_interval_ms)
    : name_(name),
      retention_period_ms_(retention_period_ms),
      segment_interval_ms_(segment_interval_ms),
      num_entries_(0),
      observed_stream_time_(NO_TIMESTAMP),
      last_purge_time_(0),
      expired_records_dropped_(0),
      open_iterators_(std::make_shared<int64_t>(0)) {
    if (retention_period_ms_ < 0) {
        throw std::invalid_argument("Window store '" + name_ +
                                    "': retention period must not be negative");
    }
    if (segment_interval_ms_ < 0) {
        throw std::invalid_argument("Window store '" + name_ +
                                    "': segment interval must not be negative");
    }
    if (segment_interval_ms_ == 0) {
        segment_interval_ms_ = std::max(retention_period_ms_ / 2, MIN_SEGMENT_INTERVAL_MS);
    }
}

void InMemoryWindowStore::put(const std::string& key, const RecordValue& value,
                              int64_t timestamp) {
    observed_stream_time_ = std::max(observed_stream_time_, timestamp);

    if (timestamp < min_live_time()) {
        ++expired_records_dropped_;
        std::cerr << "InMemoryWindowStore: skipping record for expired segment, store="
                  << name_ << " timestamp=" << timestamp
                  << " observed_stream_time=" << observed_stream_time_ << std::endl;
        return;
    }

    data_[key].emplace(timestamp, value);
    ++num_entries_;

    if (saturating_add(last_purge_time_, segment_interval_ms_) <= min_live_time()) {
        purge_expired();
    }
}

std::unique_ptr<WindowStoreIterator> InMemoryWindowStore::fetch(
    const std::string& key, int64_t time_from, int64_t time_to) {
    std::vector<WindowStoreEntry> entries;

    int64_t from = std::max(time_from, min_live_time());
    auto key_it = data_.find(key);
    if (key_it != data_.end() && from <= time_to) {
        const auto& series = key_it->second;
        auto begin = series.lower_bound(from);
        auto end = series.upper_bound(time_to);
        for (auto it = begin; it != end; ++it) {
            entries.push_back({it->first, it->second});
        }
    }

    return std::make_unique<MaterializedWindowStoreIterator>(
        name_, std::move(entries), open_iterators_);
}

void InMemoryWindowStore::clear() {
    data_.clear();
    num_entries_ = 0;
    observed_stream_time_ = NO_TIMESTAMP;
    last_purge_time_ = 0;
}

int64_t InMemoryWindowStore::min_live_time() const {
    return saturating_add(observed_stream_time_, -retention_period_ms_);
}

void InMemoryWindowStore::purge_expired() {
    const int64_t cutoff = min_live_time();

    for (auto it = data_.begin(); it != data_.end();) {
        auto& series = it->second;
        auto live_begin = series.lower_bound(cutoff);
        num_entries_ -= static_cast<size_t>(std::distance(series.begin(), live_begin));
        series.erase(series.begin(), live_begin);

        if (series.empty()) {
            it = data_.erase(it);
        } else {
            ++it;
        }
    }

    last_purge_time_ = cutoff;
}

} // namespace sage_join
