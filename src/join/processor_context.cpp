#include "sage_join/join/processor_context.h"
#include <chrono>

namespace sage_join {

void SystemProcessorContext::forward(const Record& record) {
    if (callback_) {
        callback_(record);
    }
}

int64_t SystemProcessorContext::current_system_time_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace sage_join
