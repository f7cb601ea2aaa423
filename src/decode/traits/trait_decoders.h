#pragma once

#include <traitstream/core/types.h>
#include <traitstream/decode/trait_dispatcher.h>
#include <traitstream/decode/trait_record.h>

namespace traitstream::decode::traits {

// weave.trait.description / weave.trait.power
Result<TraitFields> decode_device_identity(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_battery_power_source(const TraitContext& ctx, ByteSpan raw);

// weave.trait.security
Result<TraitFields> decode_bolt_lock(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_bolt_lock_settings(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_bolt_lock_capabilities(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_pincode_input(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_tamper(const TraitContext& ctx, ByteSpan raw);

// nest.trait.hvac
Result<TraitFields> decode_target_temperature_settings(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_hvac_control(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_eco_mode_state(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_eco_mode_settings(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_fan_control_settings(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_fan_control(const TraitContext& ctx, ByteSpan raw);

// nest.trait.structure / nest.trait.user
Result<TraitFields> decode_structure_info(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_user_info(const TraitContext& ctx, ByteSpan raw);

// nest.trait.detector / nest.trait.sensor
Result<TraitFields> decode_open_close(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_ambient_motion(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_ambient_motion_settings(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_ambient_motion_timing_settings(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_temperature(const TraitContext& ctx, ByteSpan raw);
Result<TraitFields> decode_humidity(const TraitContext& ctx, ByteSpan raw);

} // namespace traitstream::decode::traits
