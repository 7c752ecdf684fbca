#include "isotp.hpp"
#include "slcan_serial.hpp"
#include <algorithm>
#include <type_traits>

namespace isotp {

// PCI types
static constexpr uint8_t PCI_SF = 0x0 << 4; // Single Frame
static constexpr uint8_t PCI_FF = 0x1 << 4; // First Frame
static constexpr uint8_t PCI_CF = 0x2 << 4; // Consecutive Frame
static constexpr uint8_t PCI_FC = 0x3 << 4; // Flow Control

static std::string excessive_data(size_t size, size_t limit) {
  return "excessive data length (" + std::to_string(size) + " > " + std::to_string(limit) + ")";
}

// ============================================================================
// Segment checks
// ============================================================================

std::vector<std::string> Single::errors() const {
  std::vector<std::string> errors;
  if (dlength > SF_MAX_DATA) {
    errors.push_back("invalid length (" + std::to_string(dlength) + " != 0-7)");
  }
  if (data.size() > SF_MAX_DATA) {
    errors.push_back(excessive_data(data.size(), SF_MAX_DATA));
  }
  if (static_cast<size_t>(dlength) != data.size()) {
    errors.push_back("length mismatch (" + std::to_string(dlength) + " != " +
                     std::to_string(data.size()) + ")");
  }
  return errors;
}

std::vector<std::string> First::errors() const {
  std::vector<std::string> errors;
  if (dlength < FF_MIN_LENGTH || dlength > MAX_PAYLOAD) {
    errors.push_back("invalid length (" + std::to_string(dlength) + " != 8-4095)");
  }
  if (data.size() > FF_MAX_DATA) {
    errors.push_back(excessive_data(data.size(), FF_MAX_DATA));
  }
  return errors;
}

std::vector<std::string> Consecutive::errors() const {
  std::vector<std::string> errors;
  if (dindex >= SN_MODULO) {
    errors.push_back("invalid index (" + std::to_string(dindex) + " > 15)");
  }
  if (data.size() > CF_MAX_DATA) {
    errors.push_back(excessive_data(data.size(), CF_MAX_DATA));
  }
  return errors;
}

std::vector<std::string> Flow::errors() const {
  std::vector<std::string> errors;
  if (fc > static_cast<uint8_t>(FlowStatus::Overflow)) {
    errors.push_back("invalid FC flag (" + std::to_string(fc) + " > 2)");
  }
  return errors;
}

// ============================================================================
// PCI packing
// ============================================================================

std::vector<uint8_t> Single::to_bytes() const {
  std::vector<uint8_t> out;
  out.reserve(1 + data.size());
  out.push_back(uint8_t(PCI_SF | (dlength & 0x0F)));
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

std::vector<uint8_t> First::to_bytes() const {
  std::vector<uint8_t> out;
  out.reserve(2 + data.size());
  out.push_back(uint8_t(PCI_FF | ((dlength >> 8) & 0x0F)));
  out.push_back(uint8_t(dlength & 0xFF));
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

std::vector<uint8_t> Consecutive::to_bytes() const {
  std::vector<uint8_t> out;
  out.reserve(1 + data.size());
  out.push_back(uint8_t(PCI_CF | (dindex & 0x0F)));
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

std::vector<uint8_t> Flow::to_bytes() const {
  return {uint8_t(PCI_FC | (fc & 0x0F)), block_size, separation_time};
}

SegmentType type_of(const Segment& segment) {
  return std::visit([](const auto& s) { return std::decay_t<decltype(s)>::kType; }, segment);
}

std::vector<std::string> errors(const Segment& segment) {
  return std::visit([](const auto& s) { return s.errors(); }, segment);
}

std::vector<uint8_t> to_bytes(const Segment& segment) {
  return std::visit([](const auto& s) { return s.to_bytes(); }, segment);
}

// ============================================================================
// Segmentation
// ============================================================================

slcan::Result<std::vector<Segment>> split(const std::vector<uint8_t>& payload) {
  using R = slcan::Result<std::vector<Segment>>;

  const size_t len = payload.size();
  std::vector<Segment> segments;

  if (len <= SF_MAX_DATA) {
    Single sf;
    sf.dlength = static_cast<uint8_t>(len);
    sf.data = payload;
    segments.push_back(sf);
    return R::success(segments);
  }

  if (len > MAX_PAYLOAD) {
    return R::failure(slcan::ErrorCode::Length,
                      "invalid length (" + std::to_string(len) + " != 0-4095)");
  }

  First ff;
  ff.dlength = static_cast<uint16_t>(len);
  ff.data.assign(payload.begin(), payload.begin() + FF_MAX_DATA);
  segments.push_back(ff);

  size_t idx = FF_MAX_DATA;
  size_t sn = 1;
  while (idx < len) {
    const size_t chunk = std::min(CF_MAX_DATA, len - idx);
    Consecutive cf;
    cf.dindex = static_cast<uint8_t>(sn % SN_MODULO);
    cf.data.assign(payload.begin() + idx, payload.begin() + idx + chunk);
    segments.push_back(cf);
    idx += chunk;
    ++sn;
  }

  return R::success(segments);
}

slcan::Result<TransmitReport> transmit(slcan::SerialCanBus& bus, CANProtocol::FrameKind kind,
                                       uint32_t identifier, const std::vector<uint8_t>& payload) {
  using R = slcan::Result<TransmitReport>;

  auto segments = split(payload);
  if (!segments.ok) return R::failure(segments.error);

  TransmitReport report;
  report.segments_total = segments.value.size();

  for (const auto& segment : segments.value) {
    const std::vector<uint8_t> bytes = to_bytes(segment);
    auto status = bus.transmit_frame(kind, identifier, static_cast<uint8_t>(bytes.size()), bytes);
    if (!status.ok) return R::failure(status.error);

    report.last_status = status.value;
    if (status.value != CANProtocol::SLCAN::ResponseStatus::Ok) break;
    report.segments_sent++;
  }

  return R::success(report);
}

} // namespace isotp
