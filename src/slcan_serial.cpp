#include "slcan_serial.hpp"
#include <iostream>

namespace slcan {

using CANProtocol::FrameKind;
using CANProtocol::SLCAN::FrameCodec;
using CANProtocol::SLCAN::ResponseStatus;

const char* to_string(InitState state) {
  switch (state) {
    case InitState::Uninitialized:     return "uninitialized";
    case InitState::CloseChannel:      return "close_channel";
    case InitState::SetBitrate:        return "set_bitrate";
    case InitState::SetAcceptanceMask: return "set_acceptance_mask";
    case InitState::SetAcceptanceCode: return "set_acceptance_code";
    case InitState::OpenChannel:       return "open_channel";
    case InitState::Ready:             return "ready";
    case InitState::Failed:            return "failed";
  }
  return "unknown";
}

namespace {

int step_number(InitState step) {
  switch (step) {
    case InitState::SetBitrate:        return 1;
    case InitState::SetAcceptanceMask: return 2;
    case InitState::SetAcceptanceCode: return 3;
    case InitState::OpenChannel:       return 4;
    default:                           return 0;
  }
}

} // namespace

Result<std::string> SerialCanBus::exchange(const CommandDescriptor& desc, const std::string& request) {
  stats_.commands_issued++;

  auto written = port_.write(request + CANProtocol::SLCAN::RESP_OK);
  if (!written.ok) return Result<std::string>::failure(written.error);

  return port_.read(desc.response_size());
}

Result<RawResponse> SerialCanBus::issue_command(const std::string& name,
                                                const std::vector<uint64_t>& params) {
  using R = Result<RawResponse>;

  auto command = command_from_name(name);
  if (!command) {
    return R::failure(ErrorCode::UnknownCommand, "invalid command: " + name);
  }
  if (*command == Command::Transmit) {
    return R::failure(ErrorCode::Validation, "transmit needs a frame, use transmit_frame()");
  }

  const CommandDescriptor& desc = descriptor(*command);
  auto wire = encode(desc, params);
  if (!wire.ok) return R::failure(wire.error);

  auto reply = exchange(desc, wire.value);
  if (!reply.ok) return R::failure(reply.error);

  auto fields = decode(desc, reply.value);
  if (!fields.ok) return R::failure(fields.error);

  RawResponse response;
  response.command = *command;
  response.fields = fields.value;
  if (auto index = desc.return_code_field()) {
    response.return_code = static_cast<uint8_t>(response.fields[*index][0]);
  }
  return R::success(response);
}

Result<ResponseStatus> SerialCanBus::transmit(const CANProtocol::CANFrame& frame) {
  using R = Result<ResponseStatus>;

  TransmitRequest request;
  request.frame = frame;

  auto response = issue(request);
  if (!response.ok) {
    stats_.frames_failed++;
    return R::failure(response.error);
  }

  const ResponseStatus status = response.value.status();
  if (status != ResponseStatus::Ok) {
    stats_.frames_failed++;
    return R::success(status);
  }

  // The adapter follows 'z' / 'Z' with a CR; drain it so the next reply lines up
  auto trailer = port_.read(1);
  if (!trailer.ok) return R::failure(trailer.error);

  stats_.frames_sent++;
  return R::success(status);
}

Result<ResponseStatus> SerialCanBus::transmit_frame(FrameKind kind, uint32_t identifier,
                                                    uint8_t length,
                                                    const std::vector<uint8_t>& data) {
  auto frame = FrameCodec::build(kind, identifier, length, data);
  if (!frame.ok) return Result<ResponseStatus>::failure(frame.error);
  return transmit(frame.value);
}

Result<ResponseStatus> SerialCanBus::transmit_frame(FrameKind kind, uint32_t identifier,
                                                    uint8_t length, uint64_t data) {
  auto frame = FrameCodec::build(kind, identifier, length, data);
  if (!frame.ok) return Result<ResponseStatus>::failure(frame.error);
  return transmit(frame.value);
}

Result<void> SerialCanBus::check_setup_step(InitState step, const Result<StatusResponse>& response) {
  if (!response.ok) {
    init_state_ = InitState::Failed;
    return Result<void>::failure(response.error);
  }

  if (!response.value.is_terminator()) {
    init_state_ = InitState::Failed;
    std::string msg = "initialization failed at step " + std::to_string(step_number(step)) +
                      " (" + to_string(step) + ") returned 0x" +
                      CANProtocol::SLCAN::toHex(response.value.return_code, 2) +
                      ", please reset adapter";
    std::cerr << msg << "\n";
    return Result<void>::failure(ErrorCode::Initialization, msg);
  }
  return Result<void>::success();
}

Result<void> SerialCanBus::initialize(const BusConfig& config) {
  // Validate everything before the first byte goes out
  auto standard = StandardSetupRequest::from_bitrate(config.bitrate);
  auto btr = BtrSetupRequest::from_bitrate(config.bitrate);
  if (!standard.ok) return Result<void>::failure(standard.error);
  if (!btr.ok) return Result<void>::failure(btr.error);

  AcceptanceMaskRequest mask;
  mask.mask = config.mask;
  AcceptanceCodeRequest code;
  code.code = config.code;

  // 1) Close channel (in case it was open); an already closed channel answers BEL
  init_state_ = InitState::CloseChannel;
  auto closed = issue(CloseChannelRequest{});
  if (!closed.ok) {
    init_state_ = InitState::Failed;
    return Result<void>::failure(closed.error);
  }

  // 2) Set bitrate
  init_state_ = InitState::SetBitrate;
  auto bitrate = config.mode == BitrateMode::Btr ? issue(btr.value) : issue(standard.value);
  auto step = check_setup_step(InitState::SetBitrate, bitrate);
  if (!step.ok) return step;

  // 3) Acceptance filter
  init_state_ = InitState::SetAcceptanceMask;
  step = check_setup_step(InitState::SetAcceptanceMask, issue(mask));
  if (!step.ok) return step;

  init_state_ = InitState::SetAcceptanceCode;
  step = check_setup_step(InitState::SetAcceptanceCode, issue(code));
  if (!step.ok) return step;

  // 4) Open channel
  init_state_ = InitState::OpenChannel;
  step = check_setup_step(InitState::OpenChannel, issue(OpenChannelRequest{}));
  if (!step.ok) return step;

  init_state_ = InitState::Ready;
  return Result<void>::success();
}

} // namespace slcan
