#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include <traitstream/wire/varint.h>

namespace traitstream::tests::wire {

using traitstream::wire::decode_varint;
using traitstream::wire::encode_varint;

TEST(VarintTest, BoundaryValuesRoundTrip) {
    const std::vector<std::pair<uint64_t, size_t>> cases = {
        {0, 1}, {127, 1}, {128, 2}, {uint64_t{std::numeric_limits<int64_t>::max()}, 9}};
    for (const auto& [value, size] : cases) {
        ByteVector buf;
        encode_varint(value, buf);
        ASSERT_EQ(buf.size(), size) << value;

        auto decoded = decode_varint(buf);
        ASSERT_TRUE(decoded.value.has_value()) << value;
        EXPECT_EQ(*decoded.value, value);
        EXPECT_EQ(decoded.next, buf.size());
    }
}

TEST(VarintTest, DecodesTwoByteLength) {
    const ByteVector buf = {0x96, 0x01, 0xAA};
    auto decoded = decode_varint(buf);
    ASSERT_TRUE(decoded.value);
    EXPECT_EQ(*decoded.value, 150u);
    EXPECT_EQ(decoded.next, 2u);
}

TEST(VarintTest, DecodesFromOffset) {
    const ByteVector buf = {0xFF, 0xFF, 0x05, 0x7F};
    auto decoded = decode_varint(buf, 3);
    ASSERT_TRUE(decoded.value);
    EXPECT_EQ(*decoded.value, 127u);
    EXPECT_EQ(decoded.next, 4u);
}

TEST(VarintTest, TruncatedPrefixReturnsStartPosition) {
    const ByteVector buf = {0x00, 0x96};
    auto decoded = decode_varint(buf, 1);
    EXPECT_FALSE(decoded.value);
    EXPECT_EQ(decoded.next, 1u);
}

TEST(VarintTest, EmptyBufferIsTruncated) {
    auto decoded = decode_varint(ByteSpan{});
    EXPECT_FALSE(decoded.value);
    EXPECT_EQ(decoded.next, 0u);
}

TEST(VarintTest, RejectsMoreThanTenBytes) {
    const ByteVector buf(11, 0x80);
    auto decoded = decode_varint(buf);
    EXPECT_FALSE(decoded.value);
    EXPECT_EQ(decoded.next, 0u);
}

TEST(VarintTest, RejectsValuesWiderThan64Bits) {
    // Nine continuation bytes followed by a tenth byte carrying more than the top bit
    ByteVector buf(9, 0xFF);
    buf.push_back(0x02);
    EXPECT_FALSE(decode_varint(buf).value);
}

TEST(VarintTest, AcceptsMaximumUint64) {
    ByteVector buf;
    encode_varint(std::numeric_limits<uint64_t>::max(), buf);
    ASSERT_EQ(buf.size(), 10u);
    auto decoded = decode_varint(buf);
    ASSERT_TRUE(decoded.value);
    EXPECT_EQ(*decoded.value, std::numeric_limits<uint64_t>::max());
}

} // namespace traitstream::tests::wire
