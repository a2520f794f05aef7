#pragma once

#include <stdexcept>
#include <string>

namespace sage_join {

/**
 * @brief Failure of a state store read, write or scan
 *
 * Not recovered by the join; it aborts the current record and
 * propagates to the caller.
 */
class StoreException : public std::runtime_error {
public:
    StoreException(const std::string& store_name, const std::string& message)
        : std::runtime_error("Store '" + store_name + "': " + message),
          store_name_(store_name) {}

    const std::string& store_name() const { return store_name_; }

private:
    std::string store_name_;
};

} // namespace sage_join
