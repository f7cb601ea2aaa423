#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <traitstream/config/config.h>
#include <traitstream/core/types.h>
#include <traitstream/session/stream_transport.h>

namespace traitstream::session {

// Trait types subscribed to when no filter is configured: every family the dispatcher decodes
// plus user and structure info.
const std::vector<std::string>& default_observe_traits();

// Serialized ObserveRequest{version 2, subscribe, one filter per trait type}.
ByteVector build_observe_body(const std::vector<std::string>& traitTypes);

// Full request for the configured endpoint. An empty filter means default_observe_traits().
StreamRequest build_observe_request(const config::EndpointConfig& endpoint);

} // namespace traitstream::session
