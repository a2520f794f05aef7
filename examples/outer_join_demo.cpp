#include "sage_join/core/outer_join_store.h"
#include "sage_join/core/window_store.h"
#include "sage_join/join/stream_stream_join.h"
#include "sage_join/utils/common.h"
#include <iostream>
#include <vector>

using namespace sage_join;

// Prints every result as it is forwarded
void print_result(const Record& record) {
    std::cout << "  -> key=" << record.key.value_or("null")
              << " value=" << value_to_string(record.value)
              << " ts=" << record.timestamp << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "sageJoin " << SAGE_JOIN_VERSION << " left outer join example" << std::endl;
    std::cout << "========================================\n" << std::endl;

    JoinConfig config = {
        {"before_ms", "5"},
        {"after_ms", "5"},
        {"grace_ms", "2"},
        {"emit_interval_ms", "0"},
        {"join_type", "left"}
    };
    JoinWindows windows = JoinWindows::from_config(config);
    std::cout << "Windows: " << windows.to_string() << "\n" << std::endl;

    InMemoryWindowStore left_store("orders-window", windows.retention_ms());
    InMemoryWindowStore right_store("payments-window", windows.retention_ms());
    InMemoryOuterJoinStore outer_store("orders-outer");
    SystemProcessorContext context(print_result);

    ValueJoiner joiner = [](const std::optional<std::string>&,
                            const std::optional<RecordValue>& order,
                            const std::optional<RecordValue>& payment) -> RecordValue {
        return value_to_string(order) + " paid by " + value_to_string(payment);
    };

    StreamStreamJoin join(windows, left_store, right_store, &outer_store, joiner, context);

    struct Event {
        JoinSide side;
        std::string key;
        std::string value;
        int64_t timestamp;
    };
    std::vector<Event> events = {
        {JoinSide::LEFT, "order-1", "book", 100},
        {JoinSide::LEFT, "order-2", "lamp", 101},
        {JoinSide::RIGHT, "order-1", "card", 103},
        {JoinSide::LEFT, "order-3", "desk", 104},
        {JoinSide::RIGHT, "order-9", "cash", 107},   // order-2 still within grace
        {JoinSide::RIGHT, "order-9", "cash", 120},   // closes order-2 and order-3
        {JoinSide::LEFT, "order-4", "pen", 90},      // late, window already closed
    };

    for (const auto& event : events) {
        std::cout << side_to_string(event.side) << " " << event.key
                  << "=" << event.value << " @" << event.timestamp << std::endl;
        join.process(event.side, Record(event.key, RecordValue(event.value), event.timestamp));
    }

    std::cout << "\nStatistics:" << std::endl;
    for (const auto& [name, value] : join.get_stats()) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
    std::cout << "  outer buffer size: " << outer_store.size() << std::endl;

    return 0;
}
