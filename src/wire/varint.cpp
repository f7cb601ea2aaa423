#include <traitstream/core/protocol_constants.h>
#include <traitstream/wire/varint.h>

namespace traitstream::wire {

VarintDecode decode_varint(ByteSpan buf, std::size_t pos) noexcept {
    uint64_t value = 0;
    const std::size_t start = pos;
    for (std::size_t i = 0; i < kMaxVarintBytes; ++i, ++pos) {
        if (pos >= buf.size()) {
            return {std::nullopt, start};
        }
        const uint8_t byte = buf[pos];
        const uint64_t bits = byte & 0x7F;
        // The tenth byte only has room for the top bit of a uint64_t.
        if (i == kMaxVarintBytes - 1 && bits > 1) {
            return {std::nullopt, start};
        }
        value |= bits << (7 * i);
        if ((byte & 0x80) == 0) {
            return {value, pos + 1};
        }
    }
    return {std::nullopt, start};
}

void encode_varint(uint64_t value, ByteVector& out) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

} // namespace traitstream::wire
