#include "trait_decoders.h"

#include <nest/trait/detector.pb.h>
#include <nest/trait/sensor.pb.h>

#include <traitstream/schema/schema_registry.h>

#include "field_helpers.h"

namespace traitstream::decode::traits {

using namespace detail;
namespace det = nest::trait::detector;
namespace sensor = nest::trait::sensor;

Result<TraitFields> decode_open_close(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<det::OpenCloseTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["open_close_state"] = enum_code(t.openclosestate());
    f["first_observed_at"] = timestamp_seconds(t.has_firstobservedat(), t.firstobservedat());
    return f;
}

Result<TraitFields> decode_ambient_motion(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<det::AmbientMotionTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["motion_detected"] = t.motiondetected();
    f["last_motion_at"] = timestamp_seconds(t.has_lastmotionat(), t.lastmotionat());
    return f;
}

Result<TraitFields> decode_ambient_motion_settings(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<det::AmbientMotionSettingsTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["enabled"] = wrapped_bool(t.has_enabled(), t.enabled());
    f["sensitivity"] = enum_code(t.sensitivity());
    return f;
}

Result<TraitFields> decode_ambient_motion_timing_settings(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<det::AmbientMotionTimingSettingsTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["detection_timeout"] = duration_seconds(t.has_detectiontimeout(), t.detectiontimeout());
    f["cooldown"] = duration_seconds(t.has_cooldown(), t.cooldown());
    return f;
}

// Sensor readings sit inside a presence-checked sub-message.
Result<TraitFields> decode_temperature(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sensor::TemperatureTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["temperature"] = t.has_temperaturevalue()
                           ? wrapped_float(t.temperaturevalue().has_temperature(),
                                           t.temperaturevalue().temperature())
                           : TraitValue{};
    f["observed_at"] = timestamp_seconds(t.has_observedat(), t.observedat());
    return f;
}

Result<TraitFields> decode_humidity(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sensor::HumidityTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["humidity"] = t.has_humidityvalue() ? wrapped_float(t.humidityvalue().has_humidity(),
                                                          t.humidityvalue().humidity())
                                          : TraitValue{};
    f["observed_at"] = timestamp_seconds(t.has_observedat(), t.observedat());
    return f;
}

} // namespace traitstream::decode::traits
