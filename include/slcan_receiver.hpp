#ifndef SLCAN_RECEIVER_HPP
#define SLCAN_RECEIVER_HPP

#include "can_slcan.hpp"
#include "slcan_error.hpp"
#include "slcan_transport.hpp"
#include <cstdint>
#include <functional>
#include <optional>

namespace slcan {

/// Pulls frames off an open channel: `tiiil<data>\r` and `Tiiiiiiiil<data>\r`.
///
/// Stray CRs between frames are skipped. Any other leading byte, or a frame not
/// followed by CR, is a ProtocolError and ends the session. The receiver never
/// closes the port or the CAN channel.
class FrameReceiver {
public:
  enum class State : uint8_t {
    ExpectTag,  // waiting for 't', 'T' or CR
    Done,       // frame bound reached
    Failed      // protocol or transport error
  };

  using FrameHandler = std::function<void(const CANProtocol::CANFrame&)>;

  explicit FrameReceiver(ISerialPort& port) : port_(port) {}

  /// Consume one token (a frame or a stray CR). The handler sees a frame
  /// before its terminator is checked. Returns true if a frame was emitted.
  Result<bool> poll(const FrameHandler& handler);

  /// Loop over poll() until `count` frames were emitted (forever if unset).
  /// Returns the number of frames emitted.
  Result<size_t> run(const FrameHandler& handler, std::optional<size_t> count = std::nullopt);

  State state() const { return state_; }
  void reset() { state_ = State::ExpectTag; }

  struct Statistics {
    uint64_t frames_received = 0;
    uint64_t stray_terminators = 0;
    uint64_t protocol_errors = 0;
  };

  const Statistics& stats() const { return stats_; }
  void reset_stats() { stats_ = Statistics{}; }

private:
  Result<CANProtocol::CANFrame> read_frame(char tag);
  Result<void> expect_terminator();
  Error fail(ErrorCode code, const std::string& message);

  ISerialPort& port_;
  State state_{State::ExpectTag};
  Statistics stats_{};
};

const char* to_string(FrameReceiver::State state);

} // namespace slcan

#endif // SLCAN_RECEIVER_HPP
