#include "sage_join/core/timestamped_side_key.h"
#include <sstream>
#include <stdexcept>

namespace sage_join {

std::string TimestampedSideKey::to_string() const {
    std::ostringstream out;
    out << "<" << timestamp_ << "," << side_to_string(side_) << "," << key_ << ">";
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const TimestampedSideKey& key) {
    return out << key.to_string();
}

BufferedJoinValue::BufferedJoinValue(JoinSide side, RecordValue value)
    : side_(side) {
    if (side == JoinSide::LEFT) {
        left_ = std::move(value);
    } else {
        right_ = std::move(value);
    }
}

const RecordValue& BufferedJoinValue::value() const {
    const auto& populated = side_ == JoinSide::LEFT ? left_ : right_;
    if (!populated) {
        throw std::out_of_range("BufferedJoinValue has no " + side_to_string(side_) + " value");
    }
    return *populated;
}

} // namespace sage_join
