#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <traitstream/core/types.h>

namespace traitstream::decode {

// Polymorphic trait payload of a get operation. typeTag is already normalized.
struct TraitPayload {
    std::string typeTag;
    ByteVector rawBytes;
    bool inferred = false; // true when the tag came from the untyped lock slot
};

struct GetOperation {
    std::optional<std::string> objectId;
    std::string objectKey = "unknown";
    std::optional<TraitPayload> traitPayload;
};

struct SubMessage {
    std::vector<GetOperation> gets;
};

// One decoded frame.
struct Envelope {
    std::vector<SubMessage> messages;
    std::size_t keepalives = 0; // noop entries carried by the frame
    std::size_t dropped = 0;    // get operations that could not be classified

    [[nodiscard]] bool is_keepalive() const noexcept {
        return messages.empty() && keepalives > 0;
    }

    [[nodiscard]] std::size_t operation_count() const noexcept {
        std::size_t n = 0;
        for (const auto& m : messages) {
            n += m.gets.size();
        }
        return n;
    }
};

} // namespace traitstream::decode
