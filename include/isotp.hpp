#ifndef ISOTP_HPP
#define ISOTP_HPP

/**
 * @file isotp.hpp
 * @brief ISO-TP (ISO 15765-2) segment construction for the SLCAN bus
 *
 * Frame Types (ISO 15765-2 Table 11, Section 8.2):
 * - Single Frame (0x0):       [0x0N] [data...] where N = length (0-7)
 * - First Frame (0x1):        [0x1L LL] [data...] where LLL = total length (8-4095)
 * - Consecutive Frame (0x2):  [0x2N] [data...] where N = sequence number (wraps at 16)
 * - Flow Control (0x3):       [0x3S] [BS] [STmin] where S = 0 CTS, 1 WT, 2 OVFL
 *
 * Only the transmit direction is covered: split() produces the segments for a
 * payload and transmit() sends them. Flow Control segments can be built but
 * are never parsed, and Consecutive segments are never reassembled.
 */

#include "can_slcan.hpp"
#include "slcan_error.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace slcan {
class SerialCanBus;
}

namespace isotp {

constexpr size_t SF_MAX_DATA = 7;        // Single Frame payload
constexpr size_t FF_MAX_DATA = 6;        // First Frame payload
constexpr size_t CF_MAX_DATA = 7;        // Consecutive Frame payload
constexpr size_t FF_MIN_LENGTH = 8;      // smallest multi-frame message
constexpr size_t MAX_PAYLOAD = 0xFFF;    // 12-bit First Frame length
constexpr uint8_t SN_MODULO = 16;

enum class SegmentType : uint8_t {
  Single = 0,
  First = 1,
  Consecutive = 2,
  Flow = 3
};

enum class FlowStatus : uint8_t {
  ContinueToSend = 0,
  Wait = 1,
  Overflow = 2
};

struct Single {
  static constexpr SegmentType kType = SegmentType::Single;
  uint8_t dlength{0};
  std::vector<uint8_t> data;

  std::vector<std::string> errors() const;
  std::vector<uint8_t> to_bytes() const;
};

struct First {
  static constexpr SegmentType kType = SegmentType::First;
  uint16_t dlength{0};          // total payload length, not this segment's
  std::vector<uint8_t> data;    // first chunk

  std::vector<std::string> errors() const;
  std::vector<uint8_t> to_bytes() const;
};

struct Consecutive {
  static constexpr SegmentType kType = SegmentType::Consecutive;
  uint8_t dindex{0};
  std::vector<uint8_t> data;

  std::vector<std::string> errors() const;
  std::vector<uint8_t> to_bytes() const;
};

struct Flow {
  static constexpr SegmentType kType = SegmentType::Flow;
  uint8_t fc{0};
  uint8_t block_size{0};
  uint8_t separation_time{0};

  std::vector<std::string> errors() const;
  std::vector<uint8_t> to_bytes() const;
};

using Segment = std::variant<Single, First, Consecutive, Flow>;

SegmentType type_of(const Segment& segment);
std::vector<std::string> errors(const Segment& segment);
std::vector<uint8_t> to_bytes(const Segment& segment);

/// Split a payload into Single, or First followed by Consecutive segments.
/// Fails with a LengthError above 4095 bytes.
slcan::Result<std::vector<Segment>> split(const std::vector<uint8_t>& payload);

struct TransmitReport {
  size_t segments_total = 0;
  size_t segments_sent = 0;
  CANProtocol::SLCAN::ResponseStatus last_status{CANProtocol::SLCAN::ResponseStatus::Unknown};

  bool complete() const { return segments_total > 0 && segments_sent == segments_total; }
};

/// Send every segment of `payload` as one CAN frame with the given identifier.
/// Stops at the first frame the adapter does not acknowledge. No flow control
/// is awaited between the First and Consecutive segments.
slcan::Result<TransmitReport> transmit(slcan::SerialCanBus& bus, CANProtocol::FrameKind kind,
                                       uint32_t identifier, const std::vector<uint8_t>& payload);

} // namespace isotp

#endif // ISOTP_HPP
