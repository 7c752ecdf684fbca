#include "slcan_receiver.hpp"
#include <iostream>

namespace slcan {

using CANProtocol::CANFrame;
using CANProtocol::FrameKind;
using CANProtocol::SLCAN::FrameCodec;

const char* to_string(FrameReceiver::State state) {
  switch (state) {
    case FrameReceiver::State::ExpectTag: return "expect_tag";
    case FrameReceiver::State::Done:      return "done";
    case FrameReceiver::State::Failed:    return "failed";
  }
  return "unknown";
}

Error FrameReceiver::fail(ErrorCode code, const std::string& message) {
  state_ = State::Failed;
  if (code == ErrorCode::Protocol) {
    stats_.protocol_errors++;
    std::cerr << "slcan receive: " << message << "\n";
  }
  return Error{code, message};
}

Result<CANFrame> FrameReceiver::read_frame(char tag) {
  using R = Result<CANFrame>;

  const FrameKind kind = tag == CANProtocol::SLCAN::FRAME_EXT ? FrameKind::Extended
                                                              : FrameKind::Standard;

  // identifier digits followed by the length digit
  auto header = port_.read(FrameCodec::identifierWidth(kind) + 1);
  if (!header.ok) return R::failure(fail(header.error.code, header.error.message));

  uint64_t length = 0;
  const std::string length_digit = header.value.substr(header.value.size() - 1);
  if (!CANProtocol::SLCAN::parseHex(length_digit, length) || length > CANProtocol::CAN_MAX_DLEN) {
    return R::failure(fail(ErrorCode::Protocol, "invalid length: " + length_digit));
  }

  std::string wire(1, tag);
  wire += header.value;
  if (length > 0) {
    auto data = port_.read(length * 2);
    if (!data.ok) return R::failure(fail(data.error.code, data.error.message));
    wire += data.value;
  }

  auto frame = FrameCodec::decode(wire);
  if (!frame.ok) {
    return R::failure(fail(ErrorCode::Protocol, "invalid frame " + wire + ": " + frame.error.message));
  }
  return frame;
}

Result<void> FrameReceiver::expect_terminator() {
  auto byte = port_.read(1);
  if (!byte.ok) return Result<void>::failure(fail(byte.error.code, byte.error.message));

  if (byte.value[0] != CANProtocol::SLCAN::RESP_OK) {
    return Result<void>::failure(
        fail(ErrorCode::Protocol, "invalid data (expected CR, got 0x" +
                                  CANProtocol::SLCAN::toHex(static_cast<uint8_t>(byte.value[0]), 2) +
                                  ") aborting"));
  }
  return Result<void>::success();
}

Result<bool> FrameReceiver::poll(const FrameHandler& handler) {
  using R = Result<bool>;

  if (state_ != State::ExpectTag) {
    return R::failure(ErrorCode::Protocol,
                      std::string("receiver not ready (state ") + to_string(state_) + ")");
  }

  auto tag = port_.read(1);
  if (!tag.ok) return R::failure(fail(tag.error.code, tag.error.message));

  const char kind = tag.value[0];
  if (kind == CANProtocol::SLCAN::RESP_OK) {
    stats_.stray_terminators++;
    return R::success(false);
  }
  if (kind != CANProtocol::SLCAN::FRAME_STD && kind != CANProtocol::SLCAN::FRAME_EXT) {
    return R::failure(fail(ErrorCode::Protocol,
                           "invalid frame kind: 0x" +
                           CANProtocol::SLCAN::toHex(static_cast<uint8_t>(kind), 2)));
  }

  auto frame = read_frame(kind);
  if (!frame.ok) return R::failure(frame.error);

  stats_.frames_received++;
  if (handler) handler(frame.value);

  auto terminator = expect_terminator();
  if (!terminator.ok) return R::failure(terminator.error);

  return R::success(true);
}

Result<size_t> FrameReceiver::run(const FrameHandler& handler, std::optional<size_t> count) {
  state_ = State::ExpectTag;
  size_t emitted = 0;

  while (!count || emitted < *count) {
    auto polled = poll(handler);
    if (!polled.ok) return Result<size_t>::failure(polled.error);
    if (polled.value) emitted++;
  }

  state_ = State::Done;
  return Result<size_t>::success(emitted);
}

} // namespace slcan
