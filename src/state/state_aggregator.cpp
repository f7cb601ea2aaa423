#include <traitstream/state/state_aggregator.h>

#include <spdlog/spdlog.h>

namespace traitstream::state {

using decode::TraitKind;
using decode::TraitRecord;

namespace {

constexpr int64_t kLockedStateLocked = 2; // BOLT_LOCKED_STATE_LOCKED
constexpr int64_t kActuatorStateOk = 1;   // BOLT_ACTUATOR_STATE_OK

// Higher value wins when an object carries traits of several families.
int kind_rank(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Lock:
            return 4;
        case DeviceKind::Thermostat:
            return 3;
        case DeviceKind::Detector:
            return 2;
        case DeviceKind::Sensor:
            return 1;
        case DeviceKind::Other:
            return 0;
    }
    return 0;
}

std::optional<DeviceKind> device_kind_of(TraitKind kind) {
    switch (kind) {
        case TraitKind::BoltLock:
        case TraitKind::BoltLockSettings:
        case TraitKind::BoltLockCapabilities:
        case TraitKind::PincodeInput:
            return DeviceKind::Lock;
        case TraitKind::HvacControl:
        case TraitKind::TargetTemperatureSettings:
        case TraitKind::EcoModeState:
        case TraitKind::EcoModeSettings:
        case TraitKind::FanControl:
        case TraitKind::FanControlSettings:
            return DeviceKind::Thermostat;
        case TraitKind::OpenClose:
        case TraitKind::AmbientMotion:
        case TraitKind::AmbientMotionSettings:
        case TraitKind::AmbientMotionTimingSettings:
            return DeviceKind::Detector;
        case TraitKind::Temperature:
        case TraitKind::Humidity:
            return DeviceKind::Sensor;
        default:
            return std::nullopt;
    }
}

// Structure and user objects are accounts, not devices.
bool is_account_trait(TraitKind kind) {
    return kind == TraitKind::StructureInfo || kind == TraitKind::UserInfo;
}

} // namespace

const TraitRecord* AggregatedState::find(const std::string& objectId,
                                         const std::string& typeTag) const {
    auto dev = devices.find(objectId);
    if (dev == devices.end()) {
        return nullptr;
    }
    auto rec = dev->second.find(typeTag);
    return rec == dev->second.end() ? nullptr : &rec->second;
}

std::size_t AggregatedState::record_count() const noexcept {
    std::size_t n = 0;
    for (const auto& [_, traits] : devices) {
        n += traits.size();
    }
    return n;
}

StateAggregator::ApplyResult StateAggregator::apply(const decode::Envelope& envelope) {
    ApplyResult result;
    for (const auto& message : envelope.messages) {
        for (const auto& op : message.gets) {
            if (!op.traitPayload) {
                continue;
            }
            if (!op.objectId) {
                spdlog::debug("Skipping {} without object id", op.traitPayload->typeTag);
                continue;
            }

            auto record =
                dispatcher_.decode(*op.objectId, op.traitPayload->typeTag, op.traitPayload->rawBytes);
            if (record.error && metrics_) {
                metrics_->record_trait_unpack_failure();
            }
            if (record.decoded) {
                spdlog::debug("Decoded {} for {}", decode::to_string(record.kind), record.objectId);
                update_latches(record);
            }

            auto& slot = state_.devices[record.objectId][record.typeTag];
            slot = std::move(record);
            ++result.upserted;
        }
    }

    result.changed = result.upserted > 0;
    if (result.changed) {
        result.snapshot = snapshot();
    }
    return result;
}

void StateAggregator::update_latches(const TraitRecord& record) {
    switch (record.kind) {
        case TraitKind::UserInfo:
            if (!state_.discoveredUserId) {
                state_.discoveredUserId = record.get_string("user_id");
                if (state_.discoveredUserId) {
                    spdlog::info("Discovered user id {}", *state_.discoveredUserId);
                }
            }
            break;
        case TraitKind::BoltLock:
            if (auto originator = record.get_string("actor_originator")) {
                if (state_.discoveredUserId != originator) {
                    spdlog::info("User id updated from lock actor: {}", *originator);
                }
                state_.discoveredUserId = std::move(originator);
            }
            break;
        case TraitKind::StructureInfo:
            if (auto structureId = record.get_string("structure_id")) {
                if (state_.discoveredStructureId != structureId) {
                    spdlog::info("Discovered structure id {}", *structureId);
                }
                state_.discoveredStructureId = std::move(structureId);
            } else if (!state_.discoveredStructureId && !record.objectId.empty()) {
                state_.discoveredStructureId = record.objectId;
            }
            break;
        default:
            break;
    }
}

StateSnapshot StateAggregator::snapshot() const {
    StateSnapshot snap;
    snap.userId = state_.discoveredUserId;
    snap.structureId = state_.discoveredStructureId;

    for (const auto& [objectId, traits] : state_.devices) {
        DeviceInfo info;
        bool isDevice = false;
        for (const auto& [typeTag, record] : traits) {
            snap.allTraits.emplace(trait_key(objectId, typeTag), record);
            if (is_account_trait(record.kind)) {
                continue;
            }
            isDevice = true;
            if (auto kind = device_kind_of(record.kind);
                kind && kind_rank(*kind) > kind_rank(info.kind)) {
                info.kind = *kind;
            }
            if (!record.decoded) {
                continue;
            }
            if (record.kind == TraitKind::DeviceIdentity) {
                info.model = record.get_string("model_name");
                info.serial = record.get_string("serial_number");
            } else if (record.kind == TraitKind::BoltLock) {
                DeviceSummary summary;
                summary.actuatorState = record.get_int("actuator_state");
                summary.locked = record.get_int("locked_state") == kLockedStateLocked;
                summary.moving =
                    summary.actuatorState && *summary.actuatorState != kActuatorStateOk;
                snap.deviceSummaries[objectId] = summary;
            }
        }
        if (isDevice) {
            snap.devices.emplace(objectId, std::move(info));
        }
    }
    return snap;
}

void StateAggregator::clear() {
    state_ = AggregatedState{};
}

} // namespace traitstream::state
