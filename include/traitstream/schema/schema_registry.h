#pragma once

#include <string>

#include <traitstream/core/types.h>

namespace nest::rpc {
class StreamBody;
}

namespace traitstream::schema {

// Parse one frame into the top-level envelope message.
[[nodiscard]] Result<nest::rpc::StreamBody> parse_stream_body(ByteSpan frame);

// Unpack a trait payload into its generated message type.
template <typename Message> [[nodiscard]] Result<Message> unpack_trait(ByteSpan raw) {
    Message message;
    if (!message.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        return Error{ErrorCode::InvalidData,
                     "Failed to unpack " + message.GetTypeName() + " from " +
                         std::to_string(raw.size()) + " bytes"};
    }
    return message;
}

} // namespace traitstream::schema
