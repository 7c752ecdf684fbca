#include "can_slcan.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <algorithm>

namespace CANProtocol {

namespace SLCAN {

// ============================================================================
// Bit rate tables
// ============================================================================

std::optional<char> bitrateToCode(uint32_t bitrate) {
    switch (bitrate) {
        case CAN_BITRATE_10K:  return BITRATE_10K;
        case CAN_BITRATE_20K:  return BITRATE_20K;
        case CAN_BITRATE_50K:  return BITRATE_50K;
        case CAN_BITRATE_100K: return BITRATE_100K;
        case CAN_BITRATE_125K: return BITRATE_125K;
        case CAN_BITRATE_250K: return BITRATE_250K;
        case CAN_BITRATE_500K: return BITRATE_500K;
        case CAN_BITRATE_800K: return BITRATE_800K;
        case CAN_BITRATE_1M:   return BITRATE_1M;
        default:               return std::nullopt;
    }
}

std::optional<uint16_t> bitrateToBtr(uint32_t bitrate) {
    switch (bitrate) {
        case CAN_BITRATE_10K:  return BTR_10K;
        case CAN_BITRATE_20K:  return BTR_20K;
        case CAN_BITRATE_50K:  return BTR_50K;
        case CAN_BITRATE_100K: return BTR_100K;
        case CAN_BITRATE_125K: return BTR_125K;
        case CAN_BITRATE_250K: return BTR_250K;
        case CAN_BITRATE_500K: return BTR_500K;
        case CAN_BITRATE_800K: return BTR_800K;
        case CAN_BITRATE_1M:   return BTR_1M;
        default:               return std::nullopt;
    }
}

// ============================================================================
// Response status
// ============================================================================

ResponseStatus classifyStatus(uint8_t byte) {
    switch (byte) {
        case 0x07: return ResponseStatus::Error;
        case 0x5A:
        case 0x7A: return ResponseStatus::Ok;
        default:   return ResponseStatus::Unknown;
    }
}

const char* toString(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::Ok:      return "ok";
        case ResponseStatus::Error:   return "error";
        case ResponseStatus::Unknown: return "unknown";
    }
    return "unknown";
}

// ============================================================================
// Hex helpers
// ============================================================================

namespace {

uint8_t hexCharToByte(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return 0;
}

} // namespace

std::string toHex(uint64_t value, size_t width, HexCase hexCase) {
    if (width < 16) {
        value &= (uint64_t{1} << (4 * width)) - 1;
    }
    std::ostringstream oss;
    if (hexCase == HexCase::Upper) {
        oss << std::uppercase;
    }
    oss << std::hex << std::setw(static_cast<int>(width)) << std::setfill('0') << value;
    return oss.str();
}

bool parseHex(const std::string& hex, uint64_t& value) {
    if (hex.empty() || hex.size() > 16) return false;

    value = 0;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        value = (value << 4) | hexCharToByte(c);
    }
    return true;
}

std::string dataToHex(const uint8_t* data, size_t len, HexCase hexCase) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result += toHex(data[i], 2, hexCase);
    }
    return result;
}

// ============================================================================
// FrameCodec Implementation
// ============================================================================

slcan::Result<CANFrame> FrameCodec::build(FrameKind kind, uint32_t id, uint8_t length,
                                          const std::vector<uint8_t>& data) {
    using R = slcan::Result<CANFrame>;

    if (length > CAN_MAX_DLEN) {
        return R::failure(slcan::ErrorCode::Length,
                          "invalid length (" + std::to_string(length) + " != 0-8)");
    }
    if (data.size() != length) {
        return R::failure(slcan::ErrorCode::Validation,
                          "data size " + std::to_string(data.size()) +
                          " does not match length " + std::to_string(length));
    }

    CANFrame frame;
    frame.kind = kind;
    frame.id = id;
    frame.dlc = length;
    std::copy(data.begin(), data.end(), frame.data.begin());
    return R::success(frame);
}

slcan::Result<CANFrame> FrameCodec::build(FrameKind kind, uint32_t id, uint8_t length,
                                          uint64_t value) {
    using R = slcan::Result<CANFrame>;

    if (length > CAN_MAX_DLEN) {
        return R::failure(slcan::ErrorCode::Length,
                          "invalid length (" + std::to_string(length) + " != 0-8)");
    }
    if (length < CAN_MAX_DLEN && (value >> (8 * length)) != 0) {
        return R::failure(slcan::ErrorCode::Validation,
                          "data 0x" + toHex(value, 16, HexCase::Lower) +
                          " does not fit in " + std::to_string(length) + " bytes");
    }

    std::vector<uint8_t> bytes(length);
    for (uint8_t i = 0; i < length; ++i) {
        bytes[length - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return build(kind, id, length, bytes);
}

slcan::Result<std::string> FrameCodec::encode(const CANFrame& frame) {
    using R = slcan::Result<std::string>;

    if (frame.dlc > CAN_MAX_DLEN) {
        return R::failure(slcan::ErrorCode::Length,
                          "invalid length (" + std::to_string(frame.dlc) + " != 0-8)");
    }

    // Out of range identifiers are masked, never rejected
    std::string wire;
    wire += tag(frame.kind);
    wire += toHex(frame.getIdentifier(), identifierWidth(frame.kind), HexCase::Lower);
    wire += toHex(frame.dlc, 1, HexCase::Lower);
    wire += dataToHex(frame.data.data(), frame.dlc, HexCase::Lower);
    return R::success(wire);
}

slcan::Result<CANFrame> FrameCodec::decode(const std::string& wire) {
    using R = slcan::Result<CANFrame>;

    if (wire.empty()) {
        return R::failure(slcan::ErrorCode::Decode, "empty frame");
    }

    FrameKind kind;
    if (wire[0] == FRAME_STD) {
        kind = FrameKind::Standard;
    } else if (wire[0] == FRAME_EXT) {
        kind = FrameKind::Extended;
    } else {
        return R::failure(slcan::ErrorCode::Decode,
                          "invalid frame kind: 0x" + toHex(static_cast<uint8_t>(wire[0]), 2));
    }

    const size_t idWidth = identifierWidth(kind);
    if (wire.size() < headerWidth(kind)) {
        return R::failure(slcan::ErrorCode::Decode,
                          "frame too short (" + std::to_string(wire.size()) + " < " +
                          std::to_string(headerWidth(kind)) + ")");
    }

    uint64_t id = 0;
    if (!parseHex(wire.substr(1, idWidth), id)) {
        return R::failure(slcan::ErrorCode::Decode, "invalid identifier: " + wire.substr(1, idWidth));
    }

    uint64_t len = 0;
    if (!parseHex(wire.substr(1 + idWidth, 1), len)) {
        return R::failure(slcan::ErrorCode::Decode, "invalid length digit: " + wire.substr(1 + idWidth, 1));
    }
    if (len > CAN_MAX_DLEN) {
        return R::failure(slcan::ErrorCode::Length,
                          "invalid length (" + std::to_string(len) + " != 0-8)");
    }

    const size_t expected = headerWidth(kind) + len * 2;
    if (wire.size() != expected) {
        return R::failure(slcan::ErrorCode::Decode,
                          "frame size " + std::to_string(wire.size()) + " != " +
                          std::to_string(expected));
    }

    CANFrame frame;
    frame.kind = kind;
    frame.id = static_cast<uint32_t>(id);
    frame.dlc = static_cast<uint8_t>(len);
    for (size_t i = 0; i < len; ++i) {
        uint64_t byte = 0;
        const std::string pair = wire.substr(headerWidth(kind) + i * 2, 2);
        if (!parseHex(pair, byte)) {
            return R::failure(slcan::ErrorCode::Decode, "invalid data byte: " + pair);
        }
        frame.data[i] = static_cast<uint8_t>(byte);
    }

    return R::success(frame);
}

} // namespace SLCAN

// ============================================================================
// CANBitTiming Implementation
// ============================================================================

CANBitTiming CANBitTiming::fromBtr(uint16_t btr) {
    const uint8_t btr0 = static_cast<uint8_t>(btr >> 8);
    const uint8_t btr1 = static_cast<uint8_t>(btr & 0xFF);

    CANBitTiming timing;
    timing.sjw = (btr0 >> 6) & 0x03;
    timing.prescaler = btr0 & 0x3F;
    timing.triple_sampling = (btr1 & 0x80) != 0;
    timing.tseg2 = (btr1 >> 4) & 0x07;
    timing.tseg1 = btr1 & 0x0F;
    return timing;
}

uint16_t CANBitTiming::toBtr() const {
    const uint8_t btr0 = static_cast<uint8_t>(((sjw & 0x03) << 6) | (prescaler & 0x3F));
    const uint8_t btr1 = static_cast<uint8_t>((triple_sampling ? 0x80 : 0x00) |
                                              ((tseg2 & 0x07) << 4) | (tseg1 & 0x0F));
    return static_cast<uint16_t>((btr0 << 8) | btr1);
}

uint32_t CANBitTiming::getBitrate(uint32_t clock_hz) const {
    const uint32_t divisor = 2u * (prescaler + 1u) * getTotalTQ();
    return clock_hz / divisor;
}

} // namespace CANProtocol
