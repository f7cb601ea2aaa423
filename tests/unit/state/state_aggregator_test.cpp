#include <gtest/gtest.h>

#include <string>

#include <weave/trait/description.pb.h>

#include <traitstream/decode/envelope_decoder.h>
#include <traitstream/state/state_aggregator.h>

#include "common/stream_fixtures.h"

namespace traitstream::tests::state {

using traitstream::decode::Envelope;
using traitstream::decode::EnvelopeDecoder;
using traitstream::decode::TraitKind;
using traitstream::state::DeviceKind;
using traitstream::state::StateAggregator;

namespace {

const std::string kLockTag =
    std::string(kCanonicalTypePrefix) + std::string(kPrimaryLockTraitType);

Envelope envelope_of(const nest::rpc::StreamBody& body) {
    auto decoded = EnvelopeDecoder{}.decode(serialize(body));
    EXPECT_TRUE(decoded) << decoded.error().message;
    return std::move(decoded).value();
}

Envelope lock_envelope(const std::string& objectId, int lockedState, int actuatorState,
                       const std::string& originator = {}) {
    nest::rpc::StreamBody body;
    add_get(body, objectId, make_lock(lockedState, actuatorState, originator));
    return envelope_of(body);
}

Envelope user_envelope(const std::string& userObjectId) {
    nest::rpc::StreamBody body;
    add_get(body, userObjectId, nest::trait::user::UserInfoTrait{});
    return envelope_of(body);
}

Envelope structure_envelope(const std::string& objectId, const std::string& legacyId) {
    nest::trait::structure::StructureInfoTrait info;
    info.set_legacy_id(legacyId);
    nest::rpc::StreamBody body;
    add_get(body, objectId, info);
    return envelope_of(body);
}

} // namespace

TEST(StateAggregatorTest, LastWriteWinsPerObjectAndTrait) {
    StateAggregator aggregator;
    aggregator.apply(lock_envelope("DEVICE_1", 2, 1));
    auto result = aggregator.apply(lock_envelope("DEVICE_1", 1, 1));

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.upserted, 1u);
    EXPECT_EQ(aggregator.state().record_count(), 1u);

    const auto* record = aggregator.state().find("DEVICE_1", kLockTag);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->get_int("locked_state"), 1);
    ASSERT_EQ(result.snapshot.deviceSummaries.count("DEVICE_1"), 1u);
    EXPECT_FALSE(result.snapshot.deviceSummaries.at("DEVICE_1").locked);
}

TEST(StateAggregatorTest, LockSummaryDerivesLockedAndMoving) {
    StateAggregator aggregator;
    aggregator.apply(lock_envelope("DEVICE_1", 2, 1));
    auto result = aggregator.apply(lock_envelope("DEVICE_2", 1, 3));

    const auto& summaries = result.snapshot.deviceSummaries;
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_TRUE(summaries.at("DEVICE_1").locked);
    EXPECT_FALSE(summaries.at("DEVICE_1").moving);
    EXPECT_FALSE(summaries.at("DEVICE_2").locked);
    EXPECT_TRUE(summaries.at("DEVICE_2").moving);
    EXPECT_EQ(summaries.at("DEVICE_2").actuatorState, 3);
}

TEST(StateAggregatorTest, UserIdLatchesFromFirstUserInfo) {
    StateAggregator aggregator;
    aggregator.apply(user_envelope("USER_A"));
    auto result = aggregator.apply(user_envelope("USER_B"));

    EXPECT_EQ(result.snapshot.userId, "USER_A");
    EXPECT_TRUE(result.snapshot.devices.empty());
    EXPECT_EQ(result.snapshot.allTraits.size(), 2u);
}

TEST(StateAggregatorTest, LockActorOverwritesUserId) {
    StateAggregator aggregator;
    aggregator.apply(user_envelope("USER_A"));
    auto result = aggregator.apply(lock_envelope("DEVICE_1", 2, 1, "USER_Z"));
    EXPECT_EQ(result.snapshot.userId, "USER_Z");

    // A later user-info trait does not displace it.
    result = aggregator.apply(user_envelope("USER_C"));
    EXPECT_EQ(result.snapshot.userId, "USER_Z");
}

TEST(StateAggregatorTest, StructureIdPrefersParsedLegacyId) {
    StateAggregator aggregator;
    auto result = aggregator.apply(structure_envelope("STRUCTURE_OBJ", "no-dots"));
    EXPECT_EQ(result.snapshot.structureId, "STRUCTURE_OBJ");

    result = aggregator.apply(structure_envelope("STRUCTURE_OBJ", "structure.ABC123"));
    EXPECT_EQ(result.snapshot.structureId, "ABC123");

    // An unparseable id never replaces a known one.
    result = aggregator.apply(structure_envelope("OTHER_OBJ", "plain"));
    EXPECT_EQ(result.snapshot.structureId, "ABC123");
}

TEST(StateAggregatorTest, DeviceKindAndIdentityAreDerived) {
    weave::trait::description::DeviceIdentityTrait identity;
    identity.mutable_model_name()->set_value("Nest x Yale Lock");
    identity.set_serial_number("SN-1");

    nest::rpc::StreamBody body;
    add_get(body, "DEVICE_1", identity);
    add_get(body, "DEVICE_1", make_lock(2, 1));
    StateAggregator aggregator;
    auto result = aggregator.apply(envelope_of(body));

    ASSERT_EQ(result.upserted, 2u);
    ASSERT_EQ(result.snapshot.devices.count("DEVICE_1"), 1u);
    const auto& info = result.snapshot.devices.at("DEVICE_1");
    EXPECT_EQ(info.kind, DeviceKind::Lock);
    EXPECT_EQ(info.model, "Nest x Yale Lock");
    EXPECT_EQ(info.serial, "SN-1");
}

TEST(StateAggregatorTest, OperationsWithoutObjectIdAreSkipped) {
    nest::rpc::StreamBody body;
    auto* get = body.add_message()->add_get();
    auto* any = get->mutable_data()->mutable_property();
    any->set_type_url(kLockTag);
    any->set_value(make_lock(2, 1).SerializeAsString());

    StateAggregator aggregator;
    auto result = aggregator.apply(envelope_of(body));
    EXPECT_FALSE(result.changed);
    EXPECT_EQ(aggregator.state().record_count(), 0u);
}

TEST(StateAggregatorTest, UnpackFailureIsStoredAndCounted) {
    nest::rpc::StreamBody body;
    auto* get = body.add_message()->add_get();
    get->mutable_object()->set_id("DEVICE_1");
    auto* any = get->mutable_data()->mutable_property();
    any->set_type_url(kLockTag);
    any->set_value(std::string("\x0A\x7F\x01", 3));

    DecodeMetrics metrics;
    StateAggregator aggregator;
    aggregator.set_metrics(&metrics);
    auto result = aggregator.apply(envelope_of(body));

    EXPECT_TRUE(result.changed);
    const auto* record = aggregator.state().find("DEVICE_1", kLockTag);
    ASSERT_NE(record, nullptr);
    EXPECT_FALSE(record->decoded);
    EXPECT_TRUE(record->error);
    EXPECT_EQ(metrics.snapshot().trait_unpack_failures, 1u);
    EXPECT_TRUE(result.snapshot.deviceSummaries.empty());
    EXPECT_EQ(result.snapshot.devices.at("DEVICE_1").kind, DeviceKind::Lock);
}

TEST(StateAggregatorTest, KeepaliveLeavesStateUnchanged) {
    nest::rpc::StreamBody body;
    body.add_noop("keepalive");

    StateAggregator aggregator;
    auto result = aggregator.apply(envelope_of(body));
    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(result.snapshot.empty());
}

TEST(StateAggregatorTest, ClearForgetsEverything) {
    StateAggregator aggregator;
    aggregator.apply(lock_envelope("DEVICE_1", 2, 1, "USER_Z"));
    aggregator.clear();
    EXPECT_EQ(aggregator.state().record_count(), 0u);
    EXPECT_TRUE(aggregator.snapshot().empty());
}

TEST(StateAggregatorTest, UnknownTraitIsStoredUndecoded) {
    nest::rpc::StreamBody body;
    auto* get = body.add_message()->add_get();
    get->mutable_object()->set_id("DEVICE_5");
    get->mutable_data()->mutable_property()->set_type_url(
        std::string(kCanonicalTypePrefix) + "example.trait.MysteryTrait");

    StateAggregator aggregator;
    auto result = aggregator.apply(envelope_of(body));
    ASSERT_TRUE(result.changed);
    ASSERT_EQ(result.snapshot.allTraits.size(), 1u);
    const auto& record = result.snapshot.allTraits.begin()->second;
    EXPECT_EQ(record.kind, TraitKind::Unknown);
    EXPECT_FALSE(record.decoded);
    EXPECT_FALSE(record.error);
    EXPECT_EQ(result.snapshot.devices.at("DEVICE_5").kind, DeviceKind::Other);
}

} // namespace traitstream::tests::state
