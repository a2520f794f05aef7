#include "sage_join/core/record.h"
#include <sstream>

namespace sage_join {

Record Record::with_value(std::optional<RecordValue> v) const {
    Record copy(*this);
    copy.value = std::move(v);
    return copy;
}

Record Record::with(std::optional<std::string> k, std::optional<RecordValue> v,
                    int64_t ts) const {
    Record copy(*this);
    copy.key = std::move(k);
    copy.value = std::move(v);
    copy.timestamp = ts;
    return copy;
}

std::string value_to_string(const RecordValue& value) {
    std::ostringstream out;
    if (std::holds_alternative<double>(value)) {
        out << std::get<double>(value);
    } else if (std::holds_alternative<std::vector<double>>(value)) {
        const auto& vec = std::get<std::vector<double>>(value);
        out << "[";
        for (size_t i = 0; i < vec.size(); ++i) {
            if (i > 0) {
                out << ",";
            }
            out << vec[i];
        }
        out << "]";
    } else {
        out << std::get<std::string>(value);
    }
    return out.str();
}

std::string value_to_string(const std::optional<RecordValue>& value) {
    return value ? value_to_string(*value) : "null";
}

} // namespace sage_join
