#include <gtest/gtest.h>
#include <limits>
#include "vault/errors.hpp"
#include "vault/wire.hpp"

using namespace vault;

TEST(WireTest, Integers_ShouldBeLittleEndian) {
    ByteWriter out;
    out.u32(0x01020304).u64(0x0a0b0c0d0e0f1011ull);

    EXPECT_EQ(out.bytes(), std::string("\x04\x03\x02\x01\x11\x10\x0f\x0e\x0d\x0c\x0b\x0a", 12));
}

TEST(WireTest, NegativeTimestamp_ShouldSurviveRoundTrip) {
    ByteWriter out;
    out.i64(-1).i64(std::numeric_limits<int64_t>::min());
    std::string bytes = out.take();

    ByteReader in(bytes);
    EXPECT_EQ(in.i64(), -1);
    EXPECT_EQ(in.i64(), std::numeric_limits<int64_t>::min());
    EXPECT_NO_THROW(in.expect_end());
}

TEST(WireTest, String_ShouldCarryLe32Length) {
    ByteWriter out;
    out.string("hi");

    EXPECT_EQ(out.bytes(), std::string("\x02\x00\x00\x00hi", 6));
}

TEST(WireTest, Reader_Truncated_ShouldThrowMalformed) {
    std::string bytes("\x01\x02\x03", 3);
    ByteReader in(bytes);

    try {
        in.u32();
        FAIL() << "expected SettlementError";
    } catch (const SettlementError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MalformedInstruction);
    }
}

TEST(WireTest, Reader_StringLengthBeyondPayload_ShouldThrowMalformed) {
    std::string bytes("\x10\x00\x00\x00" "abc", 7);
    ByteReader in(bytes);

    EXPECT_THROW(in.string(100), SettlementError);
}

TEST(WireTest, Reader_StringOverCap_ShouldThrowInputTooLong) {
    ByteWriter out;
    out.string(std::string(20, 'x'));
    std::string bytes = out.take();
    ByteReader in(bytes);

    try {
        in.string(10);
        FAIL() << "expected SettlementError";
    } catch (const SettlementError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InputTooLong);
    }
}

TEST(WireTest, Reader_BoolOutsideZeroOne_ShouldThrowMalformed) {
    std::string bytes("\x02", 1);
    ByteReader in(bytes);

    EXPECT_THROW(in.boolean(), SettlementError);
}

TEST(WireTest, Reader_TrailingBytes_ShouldFailExpectEnd) {
    std::string bytes("\x01\x00", 2);
    ByteReader in(bytes);
    in.u8();

    EXPECT_EQ(in.remaining(), 1u);
    EXPECT_THROW(in.expect_end(), SettlementError);
}

TEST(WireTest, FixedArrays_ShouldBeCopiedVerbatim) {
    std::array<uint8_t, 4> value{{9, 8, 7, 6}};
    ByteWriter out;
    out.fixed(value);
    std::string bytes = out.take();

    ByteReader in(bytes);
    EXPECT_EQ((in.fixed<4>()), value);
}
