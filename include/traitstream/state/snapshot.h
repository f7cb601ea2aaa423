#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <traitstream/decode/trait_record.h>

namespace traitstream::state {

enum class DeviceKind { Lock, Thermostat, Detector, Sensor, Other };

constexpr std::string_view to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Lock:
            return "lock";
        case DeviceKind::Thermostat:
            return "thermostat";
        case DeviceKind::Detector:
            return "detector";
        case DeviceKind::Sensor:
            return "sensor";
        case DeviceKind::Other:
            return "other";
    }
    return "other";
}

// Lock view of a device carrying the primary lock trait.
struct DeviceSummary {
    bool locked = false;
    bool moving = false;
    std::optional<int64_t> actuatorState;
};

struct DeviceInfo {
    DeviceKind kind = DeviceKind::Other;
    std::optional<std::string> model;
    std::optional<std::string> serial;
};

// What the consumer receives on every emission. Re-derived from the aggregated state each time.
struct StateSnapshot {
    std::map<std::string, DeviceSummary> deviceSummaries;
    std::map<std::string, DeviceInfo> devices;
    std::optional<std::string> userId;
    std::optional<std::string> structureId;
    std::map<std::string, decode::TraitRecord> allTraits; // keyed "<objectId>:<typeTag>"
    bool disconnected = false;

    // Empty snapshot emitted when the transport fails.
    static StateSnapshot sentinel() {
        StateSnapshot s;
        s.disconnected = true;
        return s;
    }

    [[nodiscard]] bool empty() const noexcept {
        return deviceSummaries.empty() && devices.empty() && !userId && !structureId &&
               allTraits.empty();
    }
};

[[nodiscard]] std::string trait_key(std::string_view objectId, std::string_view typeTag);

[[nodiscard]] nlohmann::json toJson(const decode::TraitRecord& record);
[[nodiscard]] nlohmann::json toJson(const StateSnapshot& snapshot);

} // namespace traitstream::state
