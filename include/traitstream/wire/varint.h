#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <traitstream/core/types.h>

namespace traitstream::wire {

struct VarintDecode {
    std::optional<uint64_t> value; // nullopt when truncated or wider than 64 bits
    std::size_t next = 0;          // position after the varint, or the start position on failure
};

// Decode a base-128 varint starting at pos. Reads at most kMaxVarintBytes bytes.
[[nodiscard]] VarintDecode decode_varint(ByteSpan buf, std::size_t pos = 0) noexcept;

// Append the base-128 encoding of value to out.
void encode_varint(uint64_t value, ByteVector& out);

} // namespace traitstream::wire
