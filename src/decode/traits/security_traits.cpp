#include "trait_decoders.h"

#include <weave/trait/security.pb.h>

#include <traitstream/schema/schema_registry.h>

#include "field_helpers.h"

namespace traitstream::decode::traits {

using namespace detail;
namespace sec = weave::trait::security;

Result<TraitFields> decode_bolt_lock(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sec::BoltLockTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["state"] = enum_code(t.state());
    f["actuator_state"] = enum_code(t.actuatorstate());
    f["locked_state"] = enum_code(t.lockedstate());

    // The acting-user reference only exists when the lock reports who moved the bolt.
    if (t.has_boltlockactor()) {
        const auto& actor = t.boltlockactor();
        f["actor_method"] = enum_code(actor.method());
        f["actor_originator"] = actor.has_originator()
                                    ? non_empty(actor.originator().resourceid())
                                    : TraitValue{};
        f["actor_agent"] =
            actor.has_agent() ? non_empty(actor.agent().resourceid()) : TraitValue{};
    } else {
        f["actor_method"] = std::monostate{};
        f["actor_originator"] = std::monostate{};
        f["actor_agent"] = std::monostate{};
    }
    f["locked_state_last_changed_at"] =
        timestamp_seconds(t.has_lockedstatelastchangedat(), t.lockedstatelastchangedat());
    return f;
}

Result<TraitFields> decode_bolt_lock_settings(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sec::BoltLockSettingsTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["auto_relock_on"] = wrapped_bool(t.has_autorelockon(), t.autorelockon());
    f["auto_relock_duration"] =
        duration_seconds(t.has_autorelockduration(), t.autorelockduration());
    return f;
}

Result<TraitFields> decode_bolt_lock_capabilities(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sec::BoltLockCapabilitiesTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["handedness"] = enum_code(t.handedness());
    f["max_auto_relock_duration"] =
        duration_seconds(t.has_maxautorelockduration(), t.maxautorelockduration());
    return f;
}

Result<TraitFields> decode_pincode_input(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sec::PincodeInputTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }

    TraitFields f;
    f["pincode_input_state"] = enum_code(parsed.value().pincodeinputstate());
    return f;
}

Result<TraitFields> decode_tamper(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<sec::TamperTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["tamper_state"] = enum_code(t.tamperstate());
    f["first_observed_at"] = timestamp_seconds(t.has_firstobservedat(), t.firstobservedat());
    f["first_observed_at_ms"] =
        timestamp_seconds(t.has_firstobservedatms(), t.firstobservedatms());
    return f;
}

} // namespace traitstream::decode::traits
