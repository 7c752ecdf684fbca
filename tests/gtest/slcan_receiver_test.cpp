/**
 * @file slcan_receiver_test.cpp
 * @brief Google Test suite for the SLCAN receive loop
 */

#include <gtest/gtest.h>
#include "mock_serial_port.hpp"
#include "slcan_receiver.hpp"

using namespace slcan;
using CANProtocol::CANFrame;
using CANProtocol::FrameKind;

class FrameReceiverTest : public ::testing::Test {
protected:
  MockSerialPort port;
  FrameReceiver receiver{port};
  std::vector<CANFrame> frames;

  FrameReceiver::FrameHandler collect() {
    return [this](const CANFrame& frame) { frames.push_back(frame); };
  }
};

TEST_F(FrameReceiverTest, PollsStandardFrame) {
  port.feed("t7ff2beef\r");
  auto r = receiver.poll(collect());
  ASSERT_TRUE(r.ok) << r.error.message;
  EXPECT_TRUE(r.value);

  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].kind, FrameKind::Standard);
  EXPECT_EQ(frames[0].id, 0x7ffu);
  EXPECT_EQ(frames[0].payload(), (std::vector<uint8_t>{0xbe, 0xef}));
  EXPECT_EQ(receiver.state(), FrameReceiver::State::ExpectTag);
  EXPECT_EQ(port.remaining(), 0u);
}

TEST_F(FrameReceiverTest, PollsExtendedFrame) {
  port.feed("T18db33f13021003\r");
  auto r = receiver.poll(collect());
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].kind, FrameKind::Extended);
  EXPECT_EQ(frames[0].id, 0x18db33f1u);
  EXPECT_EQ(frames[0].dlc, 3);
}

TEST_F(FrameReceiverTest, ZeroLengthFrame) {
  port.feed("t1230\r");
  auto r = receiver.poll(collect());
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_TRUE(frames[0].payload().empty());
}

TEST_F(FrameReceiverTest, SkipsStrayTerminators) {
  port.feed("\r\rt1230\r");
  auto r = receiver.run(collect(), 1);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.value, 1u);
  EXPECT_EQ(frames.size(), 1u);
  EXPECT_EQ(receiver.stats().stray_terminators, 2u);
  EXPECT_EQ(receiver.state(), FrameReceiver::State::Done);
}

TEST_F(FrameReceiverTest, RejectsUnknownTag) {
  port.feed("x7ff2beef\r");
  auto r = receiver.poll(collect());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::Protocol);
  EXPECT_EQ(r.error.message, "invalid frame kind: 0x78");
  EXPECT_TRUE(frames.empty());
  EXPECT_EQ(receiver.state(), FrameReceiver::State::Failed);
}

TEST_F(FrameReceiverTest, FrameEmittedBeforeMissingTerminator) {
  port.feed("t7ff2beefX");
  auto r = receiver.poll(collect());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::Protocol);
  EXPECT_NE(r.error.message.find("expected CR"), std::string::npos);
  EXPECT_EQ(frames.size(), 1u);
  EXPECT_EQ(receiver.state(), FrameReceiver::State::Failed);
}

TEST_F(FrameReceiverTest, RejectsLengthAboveEight) {
  port.feed("t1239");
  auto r = receiver.poll(collect());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::Protocol);
  EXPECT_TRUE(frames.empty());
}

TEST_F(FrameReceiverTest, RejectsNonHexIdentifier) {
  port.feed("t12g0\r");
  auto r = receiver.poll(collect());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::Protocol);
  EXPECT_EQ(receiver.stats().protocol_errors, 1u);
}

TEST_F(FrameReceiverTest, FailedReceiverRefusesToPoll) {
  port.feed("?t1230\r");
  ASSERT_FALSE(receiver.poll(collect()).ok);

  auto again = receiver.poll(collect());
  EXPECT_FALSE(again.ok);
  EXPECT_EQ(again.error.code, ErrorCode::Protocol);
  EXPECT_EQ(port.reads().size(), 1u);

  receiver.reset();
  EXPECT_TRUE(receiver.poll(collect()).ok);
  EXPECT_EQ(frames.size(), 1u);
}

TEST_F(FrameReceiverTest, RunStopsAtCount) {
  port.feed("t1001aa\rt2001bb\rt3001cc\r");
  auto r = receiver.run(collect(), 2);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.value, 2u);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].id, 0x200u);
  EXPECT_EQ(port.remaining(), 8u);
}

TEST_F(FrameReceiverTest, RunWithZeroCountReadsNothing) {
  port.feed("t1230\r");
  auto r = receiver.run(collect(), 0);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.value, 0u);
  EXPECT_TRUE(port.reads().empty());
  EXPECT_EQ(receiver.state(), FrameReceiver::State::Done);
}

TEST_F(FrameReceiverTest, UnboundedRunEndsOnTransportError) {
  port.feed("t1230\rt4561ff\r");
  auto r = receiver.run(collect());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::Transport);
  EXPECT_EQ(frames.size(), 2u);
  EXPECT_EQ(receiver.state(), FrameReceiver::State::Failed);
}
