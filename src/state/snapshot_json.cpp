#include <traitstream/state/snapshot.h>

#include <nlohmann/json.hpp>

#include <type_traits>

namespace traitstream::state {

using json = nlohmann::json;

std::string trait_key(std::string_view objectId, std::string_view typeTag) {
    std::string key;
    key.reserve(objectId.size() + typeTag.size() + 1);
    key.append(objectId);
    key.push_back(':');
    key.append(typeTag);
    return key;
}

namespace {

json value_to_json(const decode::TraitValue& value) {
    return std::visit(
        [](const auto& v) -> json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else {
                return v;
            }
        },
        value);
}

template <typename T> json optional_to_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

json toJson(const decode::TraitRecord& record) {
    json data = json::object();
    for (const auto& [name, value] : record.data) {
        data[name] = value_to_json(value);
    }
    json j = {{"object_id", record.objectId},
              {"type_url", record.typeTag},
              {"kind", std::string(decode::to_string(record.kind))},
              {"decoded", record.decoded},
              {"data", std::move(data)}};
    if (record.error) {
        j["error"] = *record.error;
    }
    return j;
}

json toJson(const StateSnapshot& snapshot) {
    json summaries = json::object();
    for (const auto& [id, s] : snapshot.deviceSummaries) {
        summaries[id] = {{"bolt_locked", s.locked},
                         {"bolt_moving", s.moving},
                         {"actuator_state", optional_to_json(s.actuatorState)}};
    }

    json devices = json::object();
    for (const auto& [id, d] : snapshot.devices) {
        devices[id] = {{"kind", std::string(to_string(d.kind))},
                       {"model", optional_to_json(d.model)},
                       {"serial_number", optional_to_json(d.serial)}};
    }

    json traits = json::object();
    for (const auto& [key, record] : snapshot.allTraits) {
        traits[key] = toJson(record);
    }

    return {{"locks", std::move(summaries)},
            {"devices", std::move(devices)},
            {"user_id", optional_to_json(snapshot.userId)},
            {"structure_id", optional_to_json(snapshot.structureId)},
            {"all_traits", std::move(traits)},
            {"disconnected", snapshot.disconnected}};
}

} // namespace traitstream::state
