#ifndef SLCAN_SERIAL_HPP
#define SLCAN_SERIAL_HPP

#include "can_slcan.hpp"
#include "slcan_command.hpp"
#include "slcan_error.hpp"
#include "slcan_transport.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace slcan {

enum class BitrateMode : uint8_t {
  Standard,  // 'S' predefined code
  Btr        // 's' BTR0/BTR1 register pair
};

struct BusConfig {
  uint32_t bitrate{CANProtocol::CAN_BITRATE_125K};
  uint32_t mask{0xFFFFFFFFU};   // receive everything
  uint32_t code{0x00000000U};
  BitrateMode mode{BitrateMode::Standard};
};

// Initialization progress. Checked steps are numbered 1 (SetBitrate) to 4 (OpenChannel).
enum class InitState : uint8_t {
  Uninitialized,
  CloseChannel,
  SetBitrate,
  SetAcceptanceMask,
  SetAcceptanceCode,
  OpenChannel,
  Ready,
  Failed
};

const char* to_string(InitState state);

/// LAWICEL command/response engine over a serial byte channel.
///
/// Exactly one request is in flight at a time: each call writes one command
/// plus CR and reads the fixed-size reply before returning. The port is shared
/// with FrameReceiver; the caller must not run both at once.
class SerialCanBus {
public:
  explicit SerialCanBus(ISerialPort& port) : port_(port) {}

  // Non-copyable
  SerialCanBus(const SerialCanBus&) = delete;
  SerialCanBus& operator=(const SerialCanBus&) = delete;

  /// Bring the adapter to an open channel:
  /// close, set bitrate, set acceptance mask, set acceptance code, open.
  /// Stops at the first setup reply that is not CR; nothing is rolled back.
  Result<void> initialize(const BusConfig& config = {});

  InitState init_state() const { return init_state_; }

  /// Typed request, e.g. issue(StatusFlagRequest{})
  template <typename Request>
  Result<typename Request::Response> issue(const Request& request);

  /// Request by catalog name ("status_flag", "acceptance_mask", ...).
  /// `params` fill the request fields in order; missing ones take defaults.
  Result<RawResponse> issue_command(const std::string& name,
                                    const std::vector<uint64_t>& params = {});

  /// Transmit a data frame. On an Ok status the extra byte the adapter
  /// sends after 'z'/'Z' is consumed before returning.
  Result<CANProtocol::SLCAN::ResponseStatus> transmit(const CANProtocol::CANFrame& frame);

  Result<CANProtocol::SLCAN::ResponseStatus> transmit_frame(CANProtocol::FrameKind kind,
                                                            uint32_t identifier, uint8_t length,
                                                            const std::vector<uint8_t>& data);

  // transmit_frame(Standard, 0x7ff, 2, 0xbeef) sends "t7ff2beef\r"
  Result<CANProtocol::SLCAN::ResponseStatus> transmit_frame(CANProtocol::FrameKind kind,
                                                            uint32_t identifier, uint8_t length,
                                                            uint64_t data);

  struct Statistics {
    uint64_t commands_issued = 0;
    uint64_t frames_sent = 0;
    uint64_t frames_failed = 0;
  };

  const Statistics& stats() const { return stats_; }
  void reset_stats() { stats_ = Statistics{}; }

private:
  // One write (request + CR) then one read of desc.response_size() bytes
  Result<std::string> exchange(const CommandDescriptor& desc, const std::string& request);

  Result<void> check_setup_step(InitState step, const Result<StatusResponse>& response);

  ISerialPort& port_;
  InitState init_state_{InitState::Uninitialized};
  Statistics stats_{};
};

template <typename Request>
Result<typename Request::Response> SerialCanBus::issue(const Request& request) {
  using R = Result<typename Request::Response>;

  auto wire = request.encode();
  if (!wire.ok) return R::failure(wire.error);

  const CommandDescriptor& desc = descriptor(Request::kCommand);
  auto reply = exchange(desc, wire.value);
  if (!reply.ok) return R::failure(reply.error);

  auto fields = decode(desc, reply.value);
  if (!fields.ok) return R::failure(fields.error);

  return Request::Response::from_fields(fields.value);
}

} // namespace slcan

#endif // SLCAN_SERIAL_HPP
