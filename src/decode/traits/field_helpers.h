#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/wrappers.pb.h>

#include <traitstream/decode/trait_record.h>

namespace traitstream::decode::detail {

// Wire quirk normalization shared by the trait decoders.

inline TraitValue enum_code(int code) {
    return static_cast<int64_t>(code);
}

inline TraitValue non_empty(const std::string& s) {
    if (s.empty()) {
        return std::monostate{};
    }
    return std::string(s);
}

// Indirect strings must be presence-checked: an absent wrapper is absent, not "".
inline TraitValue indirect_string(bool present, const google::protobuf::StringValue& wrapper) {
    if (!present) {
        return std::monostate{};
    }
    return std::string(wrapper.value());
}

inline TraitValue wrapped_float(bool present, const google::protobuf::FloatValue& wrapper) {
    if (!present) {
        return std::monostate{};
    }
    return static_cast<double>(wrapper.value());
}

inline TraitValue wrapped_bool(bool present, const google::protobuf::BoolValue& wrapper) {
    if (!present) {
        return std::monostate{};
    }
    return wrapper.value();
}

// Seconds + nanos collapsed into floating point seconds; an unset or zero value is absent.
template <typename SecondsNanos> inline TraitValue seconds_value(bool present, const SecondsNanos& v) {
    if (!present || (v.seconds() == 0 && v.nanos() == 0)) {
        return std::monostate{};
    }
    return static_cast<double>(v.seconds()) + static_cast<double>(v.nanos()) / 1e9;
}

inline TraitValue duration_seconds(bool present, const google::protobuf::Duration& d) {
    return seconds_value(present, d);
}

inline TraitValue timestamp_seconds(bool present, const google::protobuf::Timestamp& ts) {
    return seconds_value(present, ts);
}

} // namespace traitstream::decode::detail
