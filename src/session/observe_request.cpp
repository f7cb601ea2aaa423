#include <traitstream/session/observe_request.h>

#include <nestlabs/gateway/v2.pb.h>

#include <traitstream/core/protocol_constants.h>

namespace traitstream::session {

const std::vector<std::string>& default_observe_traits() {
    static const std::vector<std::string> traits = {
        "nest.trait.user.UserInfoTrait",
        "nest.trait.structure.StructureInfoTrait",
        "weave.trait.security.BoltLockTrait",
        "weave.trait.security.BoltLockSettingsTrait",
        "weave.trait.security.BoltLockCapabilitiesTrait",
        "weave.trait.security.PincodeInputTrait",
        "weave.trait.security.TamperTrait",
        "weave.trait.description.DeviceIdentityTrait",
        "weave.trait.power.BatteryPowerSourceTrait",
        "nest.trait.hvac.TargetTemperatureSettingsTrait",
        "nest.trait.hvac.HvacControlTrait",
        "nest.trait.hvac.EcoModeStateTrait",
        "nest.trait.hvac.EcoModeSettingsTrait",
        "nest.trait.hvac.FanControlSettingsTrait",
        "nest.trait.hvac.FanControlTrait",
        "nest.trait.detector.OpenCloseTrait",
        "nest.trait.detector.AmbientMotionTrait",
        "nest.trait.detector.AmbientMotionSettingsTrait",
        "nest.trait.detector.AmbientMotionTimingSettingsTrait",
        "nest.trait.sensor.TemperatureTrait",
        "nest.trait.sensor.HumidityTrait",
    };
    return traits;
}

ByteVector build_observe_body(const std::vector<std::string>& traitTypes) {
    nestlabs::gateway::v2::ObserveRequest request;
    request.set_version(kObserveProtocolVersion);
    request.set_subscribe(true);
    for (const auto& type : traitTypes) {
        request.add_filter()->set_trait_type(type);
    }

    ByteVector body(request.ByteSizeLong());
    request.SerializeToArray(body.data(), static_cast<int>(body.size()));
    return body;
}

StreamRequest build_observe_request(const config::EndpointConfig& endpoint) {
    StreamRequest req;
    req.url = endpoint.url;
    req.body = build_observe_body(endpoint.trait_filter.empty() ? default_observe_traits()
                                                                : endpoint.trait_filter);
    req.headers = {
        {"Content-Type", "application/x-protobuf"},
        {"Accept", "application/x-protobuf"},
        {"X-Accept-Response-Streaming", "true"},
        {"X-Accept-Content-Transfer-Encoding", "binary"},
        {"User-Agent", endpoint.user_agent},
    };
    if (!endpoint.auth_token.empty()) {
        req.headers.emplace_back("Authorization", "Basic " + endpoint.auth_token);
    }
    for (const auto& header : endpoint.extra_headers) {
        req.headers.push_back(header);
    }
    return req;
}

} // namespace traitstream::session
