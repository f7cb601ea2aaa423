#include "trait_decoders.h"

#include <nest/trait/hvac.pb.h>

#include <traitstream/schema/schema_registry.h>

#include "field_helpers.h"

namespace traitstream::decode::traits {

using namespace detail;
namespace hvac = nest::trait::hvac;

Result<TraitFields> decode_target_temperature_settings(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<hvac::TargetTemperatureSettingsTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["enabled"] = wrapped_bool(t.has_enabled(), t.enabled());
    if (t.has_targettemperature()) {
        const auto& target = t.targettemperature();
        f["setpoint_type"] = enum_code(target.setpointtype());
        f["heating_target"] = wrapped_float(target.has_heatingtarget(), target.heatingtarget());
        f["cooling_target"] = wrapped_float(target.has_coolingtarget(), target.coolingtarget());
    } else {
        f["setpoint_type"] = std::monostate{};
        f["heating_target"] = std::monostate{};
        f["cooling_target"] = std::monostate{};
    }
    return f;
}

Result<TraitFields> decode_hvac_control(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<hvac::HvacControlTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& state = parsed.value().hvacstate();

    TraitFields f;
    f["cool_stage1_active"] = state.coolstage1active();
    f["heat_stage1_active"] = state.heatstage1active();
    f["heat_stage2_active"] = state.heatstage2active();
    f["fan_active"] = state.fanactive();
    return f;
}

Result<TraitFields> decode_eco_mode_state(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<hvac::EcoModeStateTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }

    TraitFields f;
    f["eco_mode"] = enum_code(parsed.value().ecomode());
    f["eco_mode_change_reason"] = enum_code(parsed.value().ecomodechangereason());
    return f;
}

namespace {

void put_eco_temperature(TraitFields& f, const std::string& prefix, bool present,
                         const hvac::EcoModeSettingsTrait::EcoTemperature& eco) {
    if (!present) {
        f[prefix + "_enabled"] = std::monostate{};
        f[prefix + "_value"] = std::monostate{};
        return;
    }
    f[prefix + "_enabled"] = eco.enabled();
    f[prefix + "_value"] = wrapped_float(eco.has_value(), eco.value());
}

} // namespace

Result<TraitFields> decode_eco_mode_settings(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<hvac::EcoModeSettingsTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    put_eco_temperature(f, "eco_heat", t.has_ecotemperatureheat(), t.ecotemperatureheat());
    put_eco_temperature(f, "eco_cool", t.has_ecotemperaturecool(), t.ecotemperaturecool());
    return f;
}

Result<TraitFields> decode_fan_control_settings(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<hvac::FanControlSettingsTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["mode"] = enum_code(t.mode());
    f["timer_duration"] = duration_seconds(t.has_timerduration(), t.timerduration());
    f["timer_speed"] = static_cast<int64_t>(t.timerspeed());
    return f;
}

Result<TraitFields> decode_fan_control(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<hvac::FanControlTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["current_speed"] = static_cast<int64_t>(t.currentspeed());
    f["timer_end"] = timestamp_seconds(t.has_timerend(), t.timerend());
    return f;
}

} // namespace traitstream::decode::traits
