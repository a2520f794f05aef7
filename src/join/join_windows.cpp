#include "sage_join/join/join_windows.h"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace sage_join {

namespace {

void require_non_negative(const std::string& name, int64_t value) {
    if (value < 0) {
        throw std::invalid_argument(name + " must not be negative, got " +
                                    std::to_string(value));
    }
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

int64_t parse_int(const JoinConfig& config, const std::string& key, int64_t default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }
    size_t consumed = 0;
    int64_t value;
    try {
        value = std::stoll(it->second, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for '" + key + "': " + it->second);
    }
    if (consumed != it->second.size()) {
        throw std::invalid_argument("Invalid integer for '" + key + "': " + it->second);
    }
    return value;
}

bool parse_bool(const JoinConfig& config, const std::string& key, bool default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }
    std::string lower = to_lower(it->second);
    if (lower == "true" || lower == "1") return true;
    if (lower == "false" || lower == "0") return false;
    throw std::invalid_argument("Invalid boolean for '" + key + "': " + it->second);
}

} // namespace

std::string join_type_to_string(JoinType type) {
    switch (type) {
        case JoinType::INNER: return "inner";
        case JoinType::LEFT: return "left";
        case JoinType::RIGHT: return "right";
        case JoinType::OUTER: return "outer";
        default: return "unknown";
    }
}

JoinType string_to_join_type(const std::string& str) {
    std::string lower = to_lower(str);

    if (lower == "inner") return JoinType::INNER;
    if (lower == "left") return JoinType::LEFT;
    if (lower == "right") return JoinType::RIGHT;
    if (lower == "outer") return JoinType::OUTER;

    throw std::invalid_argument("Unknown join type: " + str);
}

JoinWindows::JoinWindows(int64_t before_ms, int64_t after_ms, int64_t grace_ms)
    : before_ms_(before_ms),
      after_ms_(after_ms),
      grace_ms_(grace_ms),
      emit_interval_ms_(DEFAULT_EMIT_INTERVAL_MS),
      join_type_(JoinType::INNER),
      timestamp_policy_(TimestampPolicy::TRIGGERING_RECORD),
      outer_buffer_(true) {
    require_non_negative("before_ms", before_ms_);
    require_non_negative("after_ms", after_ms_);
    require_non_negative("grace_ms", grace_ms_);
}

JoinWindows JoinWindows::of_time_difference_and_grace(int64_t time_difference_ms,
                                                      int64_t grace_ms) {
    return JoinWindows(time_difference_ms, time_difference_ms, grace_ms);
}

JoinWindows JoinWindows::of_time_difference_no_grace(int64_t time_difference_ms) {
    return JoinWindows(time_difference_ms, time_difference_ms, 0);
}

JoinWindows JoinWindows::from_config(const JoinConfig& config) {
    int64_t difference = parse_int(config, "time_difference_ms", -1);
    bool has_difference = config.count("time_difference_ms") > 0;
    if (!has_difference && (config.count("before_ms") == 0 || config.count("after_ms") == 0)) {
        throw std::invalid_argument(
            "Join config needs time_difference_ms or both before_ms and after_ms");
    }

    int64_t before_ms = parse_int(config, "before_ms", difference);
    int64_t after_ms = parse_int(config, "after_ms", difference);
    int64_t grace_ms = parse_int(config, "grace_ms", 0);

    JoinWindows windows(before_ms, after_ms, grace_ms);
    windows = windows.with_emit_interval(
        parse_int(config, "emit_interval_ms", DEFAULT_EMIT_INTERVAL_MS));
    windows = windows.with_outer_buffer(parse_bool(config, "outer_buffer", true));

    auto type_it = config.find("join_type");
    if (type_it != config.end()) {
        windows = windows.with_join_type(string_to_join_type(type_it->second));
    }

    auto policy_it = config.find("timestamp_policy");
    if (policy_it != config.end()) {
        std::string policy = to_lower(policy_it->second);
        if (policy == "triggering") {
            windows = windows.with_timestamp_policy(TimestampPolicy::TRIGGERING_RECORD);
        } else if (policy == "max") {
            windows = windows.with_timestamp_policy(TimestampPolicy::MAX_OF_BOTH);
        } else {
            throw std::invalid_argument("Unknown timestamp policy: " + policy_it->second);
        }
    }

    return windows;
}

JoinWindows JoinWindows::before(int64_t before_ms) const {
    require_non_negative("before_ms", before_ms);
    JoinWindows copy(*this);
    copy.before_ms_ = before_ms;
    return copy;
}

JoinWindows JoinWindows::after(int64_t after_ms) const {
    require_non_negative("after_ms", after_ms);
    JoinWindows copy(*this);
    copy.after_ms_ = after_ms;
    return copy;
}

JoinWindows JoinWindows::grace(int64_t grace_ms) const {
    require_non_negative("grace_ms", grace_ms);
    JoinWindows copy(*this);
    copy.grace_ms_ = grace_ms;
    return copy;
}

JoinWindows JoinWindows::with_join_type(JoinType type) const {
    JoinWindows copy(*this);
    copy.join_type_ = type;
    return copy;
}

JoinWindows JoinWindows::with_timestamp_policy(TimestampPolicy policy) const {
    JoinWindows copy(*this);
    copy.timestamp_policy_ = policy;
    return copy;
}

JoinWindows JoinWindows::with_emit_interval(int64_t emit_interval_ms) const {
    require_non_negative("emit_interval_ms", emit_interval_ms);
    JoinWindows copy(*this);
    copy.emit_interval_ms_ = emit_interval_ms;
    return copy;
}

JoinWindows JoinWindows::with_outer_buffer(bool enabled) const {
    JoinWindows copy(*this);
    copy.outer_buffer_ = enabled;
    return copy;
}

bool JoinWindows::is_outer(JoinSide side) const {
    switch (join_type_) {
        case JoinType::LEFT: return side == JoinSide::LEFT;
        case JoinType::RIGHT: return side == JoinSide::RIGHT;
        case JoinType::OUTER: return true;
        default: return false;
    }
}

std::string JoinWindows::to_string() const {
    std::ostringstream out;
    out << "JoinWindows{before=" << before_ms_
        << ", after=" << after_ms_
        << ", grace=" << grace_ms_
        << ", emit_interval=" << emit_interval_ms_
        << ", type=" << join_type_to_string(join_type_)
        << ", outer_buffer=" << (outer_buffer_ ? "true" : "false") << "}";
    return out.str();
}

} // namespace sage_join
