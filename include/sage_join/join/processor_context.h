#pragma once

#include "../core/record.h"
#include <cstdint>
#include <functional>

namespace sage_join {

/**
 * @brief Runtime services the join needs from its host pipeline
 * 
 * - forward(): hand one result downstream; failures propagate as exceptions
 * - current_system_time_ms(): wall clock used to throttle outer scans
 */
class ProcessorContext {
public:
    virtual ~ProcessorContext() = default;

    virtual void forward(const Record& record) = 0;

    virtual int64_t current_system_time_ms() const = 0;
};

/**
 * @brief Callback invoked for every result record
 */
using ForwardCallback = std::function<void(const Record&)>;

/**
 * @brief ProcessorContext over a callback and the system clock
 */
class SystemProcessorContext : public ProcessorContext {
public:
    explicit SystemProcessorContext(ForwardCallback callback)
        : callback_(std::move(callback)) {}

    void forward(const Record& record) override;

    int64_t current_system_time_ms() const override;

private:
    ForwardCallback callback_;
};

} // namespace sage_join
