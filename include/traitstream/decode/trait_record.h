#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace traitstream::decode {

// A decoded field. monostate marks a field that is known to the schema but absent on the wire.
using TraitValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using TraitFields = std::map<std::string, TraitValue>;

enum class TraitKind {
    Unknown = 0,
    DeviceIdentity,
    BatteryPowerSource,
    BoltLock,
    BoltLockSettings,
    BoltLockCapabilities,
    PincodeInput,
    Tamper,
    TargetTemperatureSettings,
    HvacControl,
    EcoModeState,
    EcoModeSettings,
    FanControlSettings,
    FanControl,
    StructureInfo,
    UserInfo,
    OpenClose,
    AmbientMotion,
    AmbientMotionSettings,
    AmbientMotionTimingSettings,
    Temperature,
    Humidity
};

constexpr std::string_view to_string(TraitKind kind) {
    switch (kind) {
        case TraitKind::Unknown:
            return "unknown";
        case TraitKind::DeviceIdentity:
            return "device_identity";
        case TraitKind::BatteryPowerSource:
            return "battery_power_source";
        case TraitKind::BoltLock:
            return "bolt_lock";
        case TraitKind::BoltLockSettings:
            return "bolt_lock_settings";
        case TraitKind::BoltLockCapabilities:
            return "bolt_lock_capabilities";
        case TraitKind::PincodeInput:
            return "pincode_input";
        case TraitKind::Tamper:
            return "tamper";
        case TraitKind::TargetTemperatureSettings:
            return "target_temperature_settings";
        case TraitKind::HvacControl:
            return "hvac_control";
        case TraitKind::EcoModeState:
            return "eco_mode_state";
        case TraitKind::EcoModeSettings:
            return "eco_mode_settings";
        case TraitKind::FanControlSettings:
            return "fan_control_settings";
        case TraitKind::FanControl:
            return "fan_control";
        case TraitKind::StructureInfo:
            return "structure_info";
        case TraitKind::UserInfo:
            return "user_info";
        case TraitKind::OpenClose:
            return "open_close";
        case TraitKind::AmbientMotion:
            return "ambient_motion";
        case TraitKind::AmbientMotionSettings:
            return "ambient_motion_settings";
        case TraitKind::AmbientMotionTimingSettings:
            return "ambient_motion_timing_settings";
        case TraitKind::Temperature:
            return "temperature";
        case TraitKind::Humidity:
            return "humidity";
    }
    return "unknown";
}

// Latest known state of one trait on one object. Keyed by (objectId, typeTag).
struct TraitRecord {
    std::string objectId;
    std::string typeTag;
    TraitKind kind = TraitKind::Unknown;
    bool decoded = false;
    TraitFields data;
    std::optional<std::string> error;

    // Typed accessors; nullopt when the field is missing, absent or of another type.
    [[nodiscard]] std::optional<int64_t> get_int(const std::string& field) const {
        return get<int64_t>(field);
    }
    [[nodiscard]] std::optional<double> get_double(const std::string& field) const {
        return get<double>(field);
    }
    [[nodiscard]] std::optional<bool> get_bool(const std::string& field) const {
        return get<bool>(field);
    }
    [[nodiscard]] std::optional<std::string> get_string(const std::string& field) const {
        return get<std::string>(field);
    }

private:
    template <typename T> std::optional<T> get(const std::string& field) const {
        auto it = data.find(field);
        if (it == data.end()) {
            return std::nullopt;
        }
        if (const auto* v = std::get_if<T>(&it->second)) {
            return *v;
        }
        return std::nullopt;
    }
};

} // namespace traitstream::decode
