#include <traitstream/decode/trait_dispatcher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

#include "traits/trait_decoders.h"

namespace traitstream::decode {

bool TraitRule::matches(std::string_view typeTag) const noexcept {
    if (contains.empty() || typeTag.find(contains) == std::string_view::npos) {
        return false;
    }
    return std::none_of(excludes.begin(), excludes.end(), [typeTag](std::string_view ex) {
        return typeTag.find(ex) != std::string_view::npos;
    });
}

const std::vector<TraitRule>& TraitDispatcher::default_rules() {
    using namespace traits;
    // Order matters: variants whose name embeds a shorter family name come before that family.
    static const std::vector<TraitRule> rules = {
        {TraitKind::BoltLockSettings, "BoltLockSettingsTrait", {}, &decode_bolt_lock_settings},
        {TraitKind::BoltLockCapabilities,
         "BoltLockCapabilitiesTrait",
         {},
         &decode_bolt_lock_capabilities},
        {TraitKind::BoltLock,
         "BoltLockTrait",
         {"BoltLockSettings", "BoltLockCapabilities"},
         &decode_bolt_lock},
        {TraitKind::PincodeInput, "PincodeInputTrait", {}, &decode_pincode_input},
        {TraitKind::Tamper, "TamperTrait", {}, &decode_tamper},
        {TraitKind::DeviceIdentity, "DeviceIdentityTrait", {}, &decode_device_identity},
        {TraitKind::BatteryPowerSource,
         "BatteryPowerSourceTrait",
         {},
         &decode_battery_power_source},
        {TraitKind::TargetTemperatureSettings,
         "TargetTemperatureSettingsTrait",
         {},
         &decode_target_temperature_settings},
        {TraitKind::HvacControl, "HvacControlTrait", {}, &decode_hvac_control},
        {TraitKind::EcoModeSettings, "EcoModeSettingsTrait", {}, &decode_eco_mode_settings},
        {TraitKind::EcoModeState, "EcoModeStateTrait", {}, &decode_eco_mode_state},
        {TraitKind::FanControlSettings,
         "FanControlSettingsTrait",
         {},
         &decode_fan_control_settings},
        {TraitKind::FanControl, "FanControlTrait", {"FanControlSettings"}, &decode_fan_control},
        {TraitKind::StructureInfo, "StructureInfoTrait", {}, &decode_structure_info},
        {TraitKind::UserInfo, "UserInfoTrait", {}, &decode_user_info},
        {TraitKind::OpenClose, "OpenCloseTrait", {}, &decode_open_close},
        {TraitKind::AmbientMotionTimingSettings,
         "AmbientMotionTimingSettingsTrait",
         {},
         &decode_ambient_motion_timing_settings},
        {TraitKind::AmbientMotionSettings,
         "AmbientMotionSettingsTrait",
         {"AmbientMotionTimingSettings"},
         &decode_ambient_motion_settings},
        {TraitKind::AmbientMotion,
         "AmbientMotionTrait",
         {"AmbientMotionSettings", "AmbientMotionTimingSettings"},
         &decode_ambient_motion},
        {TraitKind::Temperature, "TemperatureTrait", {"TargetTemperature"}, &decode_temperature},
        {TraitKind::Humidity, "HumidityTrait", {}, &decode_humidity},
    };
    return rules;
}

TraitDispatcher::TraitDispatcher() : rules_(default_rules()) {}

TraitDispatcher::TraitDispatcher(std::vector<TraitRule> rules) : rules_(std::move(rules)) {}

const TraitRule* TraitDispatcher::match(std::string_view typeTag) const noexcept {
    for (const auto& rule : rules_) {
        if (rule.matches(typeTag)) {
            return &rule;
        }
    }
    return nullptr;
}

TraitKind TraitDispatcher::classify(std::string_view typeTag) const noexcept {
    const auto* rule = match(typeTag);
    return rule ? rule->kind : TraitKind::Unknown;
}

TraitRecord TraitDispatcher::decode(std::string_view objectId, std::string_view typeTag,
                                    ByteSpan raw) const {
    TraitRecord record;
    record.objectId = std::string(objectId);
    record.typeTag = std::string(typeTag);

    const auto* rule = match(typeTag);
    if (!rule || !rule->decode) {
        spdlog::trace("No decoder for trait {} on {}", typeTag, objectId);
        return record;
    }
    record.kind = rule->kind;

    try {
        auto fields = rule->decode(TraitContext{objectId, typeTag}, raw);
        if (!fields) {
            record.error = fields.error().message;
            spdlog::debug("Trait {} on {} failed to decode: {}", typeTag, objectId,
                          fields.error().message);
            return record;
        }
        record.data = std::move(fields).value();
        record.decoded = true;
    } catch (const std::exception& e) {
        record.error = e.what();
        spdlog::warn("Trait decoder for {} threw: {}", typeTag, e.what());
    }
    return record;
}

} // namespace traitstream::decode
