#include <traitstream/schema/schema_registry.h>

#include <nest/rpc/rpc.pb.h>

namespace traitstream::schema {

Result<nest::rpc::StreamBody> parse_stream_body(ByteSpan frame) {
    nest::rpc::StreamBody body;
    if (!body.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
        return Error{ErrorCode::CorruptedData,
                     "StreamBody parse failed for " + std::to_string(frame.size()) + " byte frame"};
    }
    return body;
}

} // namespace traitstream::schema
