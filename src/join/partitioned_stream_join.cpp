#include "sage_join/join/partitioned_stream_join.h"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace sage_join {

namespace {

/**
 * @brief Context of one partition: tags results with the partition id
 */
class PartitionContext : public ProcessorContext {
public:
    PartitionContext(int32_t partition,
                     const PartitionForwardCallback& callback,
                     const WallClock& clock)
        : partition_(partition), callback_(callback), clock_(clock) {}

    void forward(const Record& record) override {
        callback_(partition_, record);
    }

    int64_t current_system_time_ms() const override {
        return clock_();
    }

private:
    int32_t partition_;
    const PartitionForwardCallback& callback_;
    const WallClock& clock_;
};

} // namespace

struct PartitionedStreamJoin::PartitionState {
    // Serializes the partition's task thread with stats readers and close
    std::mutex mutex;
    std::unique_ptr<InMemoryWindowStore> left_store;
    std::unique_ptr<InMemoryWindowStore> right_store;
    std::unique_ptr<InMemoryOuterJoinStore> outer_store;
    std::unique_ptr<PartitionContext> context;
    std::unique_ptr<StreamStreamJoin> join;
};

PartitionedStreamJoin::PartitionedStreamJoin(const JoinWindows& windows,
                                             ValueJoiner joiner,
                                             PartitionForwardCallback callback,
                                             WallClock clock)
    : windows_(windows),
      joiner_(std::move(joiner)),
      callback_(std::move(callback)),
      clock_(std::move(clock)) {
    if (!joiner_) {
        throw std::invalid_argument("PartitionedStreamJoin: value joiner must be set");
    }
    if (!callback_) {
        throw std::invalid_argument("PartitionedStreamJoin: forward callback must be set");
    }
    if (!clock_) {
        clock_ = []() -> int64_t {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        };
    }
}

PartitionedStreamJoin::~PartitionedStreamJoin() = default;

void PartitionedStreamJoin::process(int32_t partition, JoinSide side, const Record& record) {
    std::shared_ptr<PartitionState> state = get_or_create(partition);
    std::lock_guard<std::mutex> lock(state->mutex);
    state->join->process(side, record);
}

std::shared_ptr<PartitionedStreamJoin::PartitionState>
PartitionedStreamJoin::get_or_create(int32_t partition) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = partitions_.find(partition);
        if (it != partitions_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = partitions_.find(partition);
    if (it != partitions_.end()) {
        return it->second;
    }

    const std::string prefix = "partition-" + std::to_string(partition);
    auto state = std::make_shared<PartitionState>();
    state->left_store = std::make_unique<InMemoryWindowStore>(
        prefix + "-left-window", windows_.retention_ms());
    state->right_store = std::make_unique<InMemoryWindowStore>(
        prefix + "-right-window", windows_.retention_ms());
    if (windows_.uses_outer_buffer()) {
        state->outer_store = std::make_unique<InMemoryOuterJoinStore>(prefix + "-outer-join");
    }
    state->context = std::make_unique<PartitionContext>(partition, callback_, clock_);
    state->join = std::make_unique<StreamStreamJoin>(
        windows_, *state->left_store, *state->right_store, state->outer_store.get(),
        joiner_, *state->context);

    partitions_[partition] = state;
    return state;
}

bool PartitionedStreamJoin::has_partition(int32_t partition) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return partitions_.count(partition) > 0;
}

size_t PartitionedStreamJoin::num_partitions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return partitions_.size();
}

bool PartitionedStreamJoin::close_partition(int32_t partition) {
    std::shared_ptr<PartitionState> state;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = partitions_.find(partition);
        if (it == partitions_.end()) {
            return false;
        }
        state = std::move(it->second);
        partitions_.erase(it);
    }
    // Wait for an in-flight record; the state is freed by its last owner
    std::lock_guard<std::mutex> lock(state->mutex);
    return true;
}

std::map<std::string, int64_t> PartitionedStreamJoin::get_stats(int32_t partition) const {
    std::shared_ptr<PartitionState> state;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = partitions_.find(partition);
        if (it == partitions_.end()) {
            return {};
        }
        state = it->second;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->join->get_stats();
}

std::map<std::string, int64_t> PartitionedStreamJoin::get_stats() const {
    std::vector<std::shared_ptr<PartitionState>> states;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : partitions_) {
            states.push_back(entry.second);
        }
    }

    std::map<std::string, int64_t> totals;
    for (const auto& state : states) {
        std::map<std::string, int64_t> stats;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            stats = state->join->get_stats();
        }
        for (const auto& [name, value] : stats) {
            if (name == "stream_time") {
                auto existing = totals.find(name);
                totals[name] = existing == totals.end() ? value
                                                        : std::max(existing->second, value);
            } else {
                totals[name] += value;
            }
        }
    }
    totals["partitions"] = static_cast<int64_t>(states.size());
    return totals;
}

} // namespace sage_join
