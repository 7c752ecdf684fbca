/**
 * @file can_slcan_test.cpp
 * @brief Google Test suite for SLCAN frame encoding, hex helpers and bit timing
 */

#include <gtest/gtest.h>
#include "can_slcan.hpp"

using namespace CANProtocol;
using namespace CANProtocol::SLCAN;

// ============================================================================
// Frame encoding
// ============================================================================

TEST(FrameCodecTest, EncodesStandardFrameFromInteger) {
  auto frame = FrameCodec::build(FrameKind::Standard, 0x7ff, 2, uint64_t{0xbeef});
  ASSERT_TRUE(frame.ok);
  EXPECT_EQ(frame.value.data[0], 0xbe);
  EXPECT_EQ(frame.value.data[1], 0xef);

  auto wire = FrameCodec::encode(frame.value);
  ASSERT_TRUE(wire.ok);
  EXPECT_EQ(wire.value, "t7ff2beef");
}

TEST(FrameCodecTest, EncodesExtendedFrame) {
  auto frame = FrameCodec::build(FrameKind::Extended, 0x18db33f1, 3,
                                 std::vector<uint8_t>{0x02, 0x10, 0x03});
  ASSERT_TRUE(frame.ok);

  auto wire = FrameCodec::encode(frame.value);
  ASSERT_TRUE(wire.ok);
  EXPECT_EQ(wire.value, "T18db33f13021003");
}

TEST(FrameCodecTest, PadsIdentifierWithZeros) {
  auto std_frame = FrameCodec::build(FrameKind::Standard, 0x1, 0, uint64_t{0});
  auto ext_frame = FrameCodec::build(FrameKind::Extended, 0x1, 0, uint64_t{0});
  ASSERT_TRUE(std_frame.ok);
  ASSERT_TRUE(ext_frame.ok);

  EXPECT_EQ(FrameCodec::encode(std_frame.value).value, "t0010");
  EXPECT_EQ(FrameCodec::encode(ext_frame.value).value, "T000000010");
}

TEST(FrameCodecTest, MasksStandardIdentifierToElevenBits) {
  auto masked = FrameCodec::build(FrameKind::Standard, 0x1FFF, 2, uint64_t{0xbeef});
  auto exact = FrameCodec::build(FrameKind::Standard, 0x7FF, 2, uint64_t{0xbeef});
  ASSERT_TRUE(masked.ok);
  ASSERT_TRUE(exact.ok);

  EXPECT_EQ(FrameCodec::encode(masked.value).value, FrameCodec::encode(exact.value).value);
}

TEST(FrameCodecTest, MasksExtendedIdentifierToTwentyNineBits) {
  auto frame = FrameCodec::build(FrameKind::Extended, 0xFFFFFFFF, 0, uint64_t{0});
  ASSERT_TRUE(frame.ok);
  EXPECT_EQ(FrameCodec::encode(frame.value).value, "T1fffffff0");
}

TEST(FrameCodecTest, RejectsLengthAboveEight) {
  auto frame = FrameCodec::build(FrameKind::Standard, 0x100, 9, uint64_t{0});
  EXPECT_FALSE(frame.ok);
  EXPECT_EQ(frame.error.code, slcan::ErrorCode::Length);

  CANFrame raw;
  raw.dlc = 9;
  auto wire = FrameCodec::encode(raw);
  EXPECT_FALSE(wire.ok);
  EXPECT_EQ(wire.error.code, slcan::ErrorCode::Length);
}

TEST(FrameCodecTest, RejectsDataWiderThanLength) {
  auto frame = FrameCodec::build(FrameKind::Standard, 0x100, 1, uint64_t{0xbeef});
  EXPECT_FALSE(frame.ok);
  EXPECT_EQ(frame.error.code, slcan::ErrorCode::Validation);
}

TEST(FrameCodecTest, RejectsByteCountMismatch) {
  auto frame = FrameCodec::build(FrameKind::Standard, 0x100, 3, std::vector<uint8_t>{1, 2});
  EXPECT_FALSE(frame.ok);
  EXPECT_EQ(frame.error.code, slcan::ErrorCode::Validation);
}

TEST(FrameCodecTest, FullEightByteInteger) {
  auto frame = FrameCodec::build(FrameKind::Standard, 0x123, 8, uint64_t{0x0102030405060708});
  ASSERT_TRUE(frame.ok);
  EXPECT_EQ(FrameCodec::encode(frame.value).value, "t12380102030405060708");
}

// ============================================================================
// Frame decoding
// ============================================================================

TEST(FrameCodecTest, DecodesStandardFrame) {
  auto frame = FrameCodec::decode("t7ff2beef");
  ASSERT_TRUE(frame.ok);
  EXPECT_EQ(frame.value.kind, FrameKind::Standard);
  EXPECT_EQ(frame.value.id, 0x7ffu);
  EXPECT_EQ(frame.value.dlc, 2);
  EXPECT_EQ(frame.value.payload(), (std::vector<uint8_t>{0xbe, 0xef}));
}

TEST(FrameCodecTest, DecodesUppercaseHex) {
  auto frame = FrameCodec::decode("T1ABCDEF01FF");
  ASSERT_TRUE(frame.ok);
  EXPECT_EQ(frame.value.kind, FrameKind::Extended);
  EXPECT_EQ(frame.value.id, 0x1ABCDEF0u);
  EXPECT_EQ(frame.value.payload(), (std::vector<uint8_t>{0xFF}));
}

TEST(FrameCodecTest, DecodeRejectsShortInput) {
  auto frame = FrameCodec::decode("t7f");
  EXPECT_FALSE(frame.ok);
  EXPECT_EQ(frame.error.code, slcan::ErrorCode::Decode);

  auto truncated = FrameCodec::decode("t7ff2be");
  EXPECT_FALSE(truncated.ok);
  EXPECT_EQ(truncated.error.code, slcan::ErrorCode::Decode);
}

TEST(FrameCodecTest, DecodeRejectsNonHexDigits) {
  EXPECT_EQ(FrameCodec::decode("t7fg0").error.code, slcan::ErrorCode::Decode);
  EXPECT_EQ(FrameCodec::decode("t7ff1zz").error.code, slcan::ErrorCode::Decode);
}

TEST(FrameCodecTest, DecodeRejectsLengthAboveEight) {
  auto frame = FrameCodec::decode("t7ff9000000000000000000");
  EXPECT_FALSE(frame.ok);
  EXPECT_EQ(frame.error.code, slcan::ErrorCode::Length);
}

TEST(FrameCodecTest, RoundTripsEveryLength) {
  for (uint8_t len = 0; len <= CAN_MAX_DLEN; ++len) {
    std::vector<uint8_t> data;
    for (uint8_t i = 0; i < len; ++i) data.push_back(static_cast<uint8_t>(0xA0 + i));

    for (FrameKind kind : {FrameKind::Standard, FrameKind::Extended}) {
      const uint32_t id = kind == FrameKind::Standard ? 0x5A5 : 0x15A5A5A5;
      auto frame = FrameCodec::build(kind, id, len, data);
      ASSERT_TRUE(frame.ok);

      auto wire = FrameCodec::encode(frame.value);
      ASSERT_TRUE(wire.ok);
      EXPECT_EQ(wire.value.size(), FrameCodec::headerWidth(kind) + len * 2u);

      auto decoded = FrameCodec::decode(wire.value);
      ASSERT_TRUE(decoded.ok) << wire.value;
      EXPECT_EQ(decoded.value, frame.value) << wire.value;
    }
  }
}

// ============================================================================
// Hex helpers
// ============================================================================

TEST(HexTest, ToHexPadsAndSelectsCase) {
  EXPECT_EQ(toHex(0xab, 4, HexCase::Upper), "00AB");
  EXPECT_EQ(toHex(0xab, 4, HexCase::Lower), "00ab");
  EXPECT_EQ(toHex(0xFFFFFFFF, 8), "FFFFFFFF");
}

TEST(HexTest, ToHexDropsHighDigits) {
  EXPECT_EQ(toHex(0x1FFF, 3, HexCase::Lower), "fff");
}

TEST(HexTest, ParseHex) {
  uint64_t value = 0;
  EXPECT_TRUE(parseHex("7fF", value));
  EXPECT_EQ(value, 0x7FFu);
  EXPECT_FALSE(parseHex("", value));
  EXPECT_FALSE(parseHex("12x", value));
}

// ============================================================================
// Status classification and bit rates
// ============================================================================

TEST(ResponseStatusTest, ClassifiesReturnCodes) {
  EXPECT_EQ(classifyStatus(0x07), ResponseStatus::Error);
  EXPECT_EQ(classifyStatus('Z'), ResponseStatus::Ok);
  EXPECT_EQ(classifyStatus('z'), ResponseStatus::Ok);
  EXPECT_EQ(classifyStatus('\r'), ResponseStatus::Unknown);
  EXPECT_EQ(classifyStatus(0x00), ResponseStatus::Unknown);
}

TEST(BitrateTest, PredefinedCodes) {
  EXPECT_EQ(bitrateToCode(10000), '0');
  EXPECT_EQ(bitrateToCode(125000), '4');
  EXPECT_EQ(bitrateToCode(1000000), '8');
  EXPECT_FALSE(bitrateToCode(83333).has_value());
}

TEST(BitrateTest, BtrTableMatchesSja1000Formula) {
  const uint32_t rates[] = {10000, 20000, 50000, 100000, 125000, 250000, 500000, 800000, 1000000};
  for (uint32_t rate : rates) {
    auto btr = bitrateToBtr(rate);
    ASSERT_TRUE(btr.has_value()) << rate;
    EXPECT_EQ(CANBitTiming::fromBtr(*btr).getBitrate(), rate) << std::hex << *btr;
  }
  EXPECT_EQ(bitrateToBtr(125000), 0x431C);
  EXPECT_FALSE(bitrateToBtr(33333).has_value());
}

TEST(BitTimingTest, DecodesRegisters) {
  CANBitTiming timing = CANBitTiming::fromBtr(0x431C);
  EXPECT_EQ(timing.sjw, 1);
  EXPECT_EQ(timing.prescaler, 3);
  EXPECT_EQ(timing.tseg1, 12);
  EXPECT_EQ(timing.tseg2, 1);
  EXPECT_FALSE(timing.triple_sampling);
  EXPECT_EQ(timing.getTotalTQ(), 16);
  EXPECT_FLOAT_EQ(timing.getSamplingPoint(), 87.5f);
  EXPECT_EQ(timing.toBtr(), 0x431C);
}
