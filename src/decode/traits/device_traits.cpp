#include "trait_decoders.h"

#include <weave/trait/description.pb.h>
#include <weave/trait/power.pb.h>

#include <traitstream/schema/schema_registry.h>

#include "field_helpers.h"

namespace traitstream::decode::traits {

using namespace detail;

Result<TraitFields> decode_device_identity(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<weave::trait::description::DeviceIdentityTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["vendor_id"] = static_cast<int64_t>(t.vendor_id());
    f["product_id"] = static_cast<int64_t>(t.product_id());
    f["vendor_description"] = indirect_string(t.has_vendor_description(), t.vendor_description());
    f["manufacturer"] = indirect_string(t.has_manufacturer(), t.manufacturer());
    f["model_name"] = indirect_string(t.has_model_name(), t.model_name());
    f["serial_number"] = non_empty(t.serial_number());
    f["fw_version"] = non_empty(t.fw_version());
    return f;
}

Result<TraitFields> decode_battery_power_source(const TraitContext&, ByteSpan raw) {
    using weave::trait::power::BatteryPowerSourceTrait;
    auto parsed = schema::unpack_trait<BatteryPowerSourceTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["condition"] = enum_code(t.condition());
    f["status"] = enum_code(t.status());
    f["replacement_indicator"] = enum_code(t.replacementindicator());
    f["assessed_voltage"] = wrapped_float(t.has_assessedvoltage(), t.assessedvoltage());
    if (t.has_remaining()) {
        const auto& rem = t.remaining();
        f["remaining_percent"] = wrapped_float(rem.has_remainingpercent(), rem.remainingpercent());
        f["remaining_time"] = duration_seconds(rem.has_remainingtime(), rem.remainingtime());
    } else {
        f["remaining_percent"] = std::monostate{};
        f["remaining_time"] = std::monostate{};
    }
    return f;
}

} // namespace traitstream::decode::traits
