#include <gtest/gtest.h>

#include <string>
#include <variant>

#include <nest/trait/detector.pb.h>
#include <nest/trait/sensor.pb.h>
#include <weave/trait/description.pb.h>
#include <weave/trait/power.pb.h>

#include <traitstream/decode/trait_dispatcher.h>

#include "common/stream_fixtures.h"

namespace traitstream::tests::decode {

using traitstream::decode::TraitDispatcher;
using traitstream::decode::TraitKind;
using traitstream::decode::TraitRecord;

namespace {

TraitRecord decode_message(const google::protobuf::Message& trait,
                           const std::string& objectId = "DEVICE_00AA") {
    static const TraitDispatcher dispatcher;
    return dispatcher.decode(objectId, type_url(trait), serialize(trait));
}

bool is_absent(const TraitRecord& record, const std::string& field) {
    auto it = record.data.find(field);
    return it != record.data.end() && std::holds_alternative<std::monostate>(it->second);
}

} // namespace

TEST(TraitDecodersTest, BoltLockReportsStateAndActor) {
    auto lock = make_lock(weave::trait::security::BoltLockTrait::BOLT_LOCKED_STATE_LOCKED,
                          weave::trait::security::BoltLockTrait::BOLT_ACTUATOR_STATE_OK,
                          "USER_015");
    lock.mutable_lockedstatelastchangedat()->set_seconds(1700000000);
    auto record = decode_message(lock);

    ASSERT_TRUE(record.decoded) << record.error.value_or("");
    EXPECT_EQ(record.kind, TraitKind::BoltLock);
    EXPECT_EQ(record.get_int("locked_state"), 2);
    EXPECT_EQ(record.get_int("actuator_state"), 1);
    EXPECT_EQ(record.get_int("state"), 2);
    EXPECT_EQ(record.get_int("actor_method"), 5);
    EXPECT_EQ(record.get_string("actor_originator"), "USER_015");
    EXPECT_TRUE(is_absent(record, "actor_agent"));
    EXPECT_EQ(record.get_double("locked_state_last_changed_at"), 1700000000.0);
}

TEST(TraitDecodersTest, BoltLockWithoutActorHasAbsentActorFields) {
    auto record = decode_message(make_lock(1, 4));
    ASSERT_TRUE(record.decoded);
    EXPECT_TRUE(is_absent(record, "actor_method"));
    EXPECT_TRUE(is_absent(record, "actor_originator"));
    EXPECT_TRUE(is_absent(record, "locked_state_last_changed_at"));
}

TEST(TraitDecodersTest, IndirectStringsArePresenceChecked) {
    weave::trait::description::DeviceIdentityTrait identity;
    identity.mutable_model_name()->set_value("");
    identity.mutable_manufacturer()->set_value("Yale");
    identity.set_serial_number("AHNJ2005298");
    identity.set_vendor_id(9050);

    auto record = decode_message(identity);
    ASSERT_TRUE(record.decoded);
    EXPECT_EQ(record.kind, TraitKind::DeviceIdentity);
    // Present but empty stays an empty string; an unset wrapper is absent.
    EXPECT_EQ(record.get_string("model_name"), "");
    EXPECT_EQ(record.get_string("manufacturer"), "Yale");
    EXPECT_TRUE(is_absent(record, "vendor_description"));
    EXPECT_EQ(record.get_string("serial_number"), "AHNJ2005298");
    EXPECT_TRUE(is_absent(record, "fw_version"));
    EXPECT_EQ(record.get_int("vendor_id"), 9050);
}

TEST(TraitDecodersTest, DurationsCollapseToSecondsAndZeroIsAbsent) {
    weave::trait::security::BoltLockSettingsTrait settings;
    settings.mutable_autorelockon()->set_value(true);
    settings.mutable_autorelockduration()->set_seconds(30);
    settings.mutable_autorelockduration()->set_nanos(500000000);

    auto record = decode_message(settings);
    ASSERT_TRUE(record.decoded);
    EXPECT_EQ(record.kind, TraitKind::BoltLockSettings);
    EXPECT_EQ(record.get_bool("auto_relock_on"), true);
    EXPECT_DOUBLE_EQ(record.get_double("auto_relock_duration").value_or(0), 30.5);

    weave::trait::security::BoltLockSettingsTrait zero;
    zero.mutable_autorelockduration();
    auto zeroRecord = decode_message(zero);
    ASSERT_TRUE(zeroRecord.decoded);
    EXPECT_TRUE(is_absent(zeroRecord, "auto_relock_duration"));
    EXPECT_TRUE(is_absent(zeroRecord, "auto_relock_on"));
}

TEST(TraitDecodersTest, BatteryRemainingIsFlattened) {
    weave::trait::power::BatteryPowerSourceTrait battery;
    battery.set_replacementindicator(
        weave::trait::power::BatteryPowerSourceTrait::BATTERY_REPLACEMENT_INDICATOR_SOON);
    battery.mutable_remaining()->mutable_remainingpercent()->set_value(0.25f);

    auto record = decode_message(battery);
    ASSERT_TRUE(record.decoded);
    EXPECT_EQ(record.get_int("replacement_indicator"), 2);
    EXPECT_DOUBLE_EQ(record.get_double("remaining_percent").value_or(0), 0.25);
    EXPECT_TRUE(is_absent(record, "remaining_time"));
    EXPECT_TRUE(is_absent(record, "assessed_voltage"));
}

TEST(TraitDecodersTest, SensorValuesAreUnwrapped) {
    nest::trait::sensor::TemperatureTrait temperature;
    temperature.mutable_temperaturevalue()->mutable_temperature()->set_value(21.5f);
    auto record = decode_message(temperature);
    ASSERT_TRUE(record.decoded);
    EXPECT_EQ(record.kind, TraitKind::Temperature);
    EXPECT_DOUBLE_EQ(record.get_double("temperature").value_or(0), 21.5);

    nest::trait::detector::AmbientMotionTrait motion;
    motion.set_motiondetected(true);
    auto motionRecord = decode_message(motion);
    ASSERT_TRUE(motionRecord.decoded);
    EXPECT_EQ(motionRecord.get_bool("motion_detected"), true);
    EXPECT_TRUE(is_absent(motionRecord, "last_motion_at"));
}

TEST(TraitDecodersTest, StructureIdIsSecondSegmentOfLegacyId) {
    nest::trait::structure::StructureInfoTrait info;
    info.set_legacy_id("structure.018C86E39308F29F");
    auto record = decode_message(info, "STRUCTURE_1");
    ASSERT_TRUE(record.decoded);
    EXPECT_EQ(record.kind, TraitKind::StructureInfo);
    EXPECT_EQ(record.get_string("legacy_id"), "structure.018C86E39308F29F");
    EXPECT_EQ(record.get_string("structure_id"), "018C86E39308F29F");

    nest::trait::structure::StructureInfoTrait flat;
    flat.set_legacy_id("018C86E39308F29F");
    auto flatRecord = decode_message(flat, "STRUCTURE_1");
    ASSERT_TRUE(flatRecord.decoded);
    EXPECT_TRUE(is_absent(flatRecord, "structure_id"));
}

TEST(TraitDecodersTest, UserInfoTakesUserIdFromObject) {
    auto record = decode_message(nest::trait::user::UserInfoTrait{}, "USER_015");
    ASSERT_TRUE(record.decoded);
    EXPECT_EQ(record.kind, TraitKind::UserInfo);
    EXPECT_EQ(record.get_string("user_id"), "USER_015");
}

TEST(TraitDecodersTest, GarbagePayloadYieldsRecordWithError) {
    static const TraitDispatcher dispatcher;
    // Field 1, wire type 2, declared length far past the end of the buffer
    const ByteVector garbage = {0x0A, 0x7F, 0x01};
    auto record = dispatcher.decode(
        "DEVICE_00AA", std::string(kCanonicalTypePrefix) + "weave.trait.security.BoltLockTrait",
        garbage);

    EXPECT_EQ(record.kind, TraitKind::BoltLock);
    EXPECT_FALSE(record.decoded);
    ASSERT_TRUE(record.error);
    EXPECT_NE(record.error->find("BoltLockTrait"), std::string::npos);
    EXPECT_TRUE(record.data.empty());
}

} // namespace traitstream::tests::decode
