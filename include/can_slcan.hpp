#ifndef CAN_SLCAN_HPP
#define CAN_SLCAN_HPP

#include "slcan_error.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <optional>

namespace CANProtocol {

// ============================================================================
// CAN Protocol Constants (ISO 11898)
// ============================================================================

constexpr uint32_t CAN_MAX_DLEN = 8;           // Maximum data length for classical CAN
constexpr uint32_t CAN_SFF_ID_BITS = 11;       // Standard Frame Format ID bits
constexpr uint32_t CAN_EFF_ID_BITS = 29;       // Extended Frame Format ID bits
constexpr uint32_t CAN_SFF_MASK = 0x000007FFU; // Standard ID mask (11 bits)
constexpr uint32_t CAN_EFF_MASK = 0x1FFFFFFFU; // Extended ID mask (29 bits)

// CAN Bit Rates supported by the LAWICEL adapters
constexpr uint32_t CAN_BITRATE_1M = 1000000;
constexpr uint32_t CAN_BITRATE_800K = 800000;
constexpr uint32_t CAN_BITRATE_500K = 500000;
constexpr uint32_t CAN_BITRATE_250K = 250000;
constexpr uint32_t CAN_BITRATE_125K = 125000;
constexpr uint32_t CAN_BITRATE_100K = 100000;
constexpr uint32_t CAN_BITRATE_50K = 50000;
constexpr uint32_t CAN_BITRATE_20K = 20000;
constexpr uint32_t CAN_BITRATE_10K = 10000;

// SJA1000 oscillator on CANUSB / CAN232 boards
constexpr uint32_t SJA1000_CLOCK_HZ = 16000000;

// ============================================================================
// CAN Frame Structure (classical CAN data frames)
// ============================================================================

enum class FrameKind : uint8_t {
    Standard = 0,   // 11-bit identifier
    Extended = 1    // 29-bit identifier
};

struct CANFrame {
    FrameKind kind;
    uint32_t id;                               // CAN identifier (11 or 29 bit)
    uint8_t dlc;                               // Data Length Code (0-8)
    std::array<uint8_t, CAN_MAX_DLEN> data;    // Data payload, dlc bytes valid

    CANFrame() : kind(FrameKind::Standard), id(0), dlc(0), data{} {}

    bool isExtended() const { return kind == FrameKind::Extended; }
    uint32_t idMask() const { return isExtended() ? CAN_EFF_MASK : CAN_SFF_MASK; }
    uint32_t getIdentifier() const { return id & idMask(); }

    std::vector<uint8_t> payload() const {
        return std::vector<uint8_t>(data.begin(), data.begin() + (dlc <= CAN_MAX_DLEN ? dlc : CAN_MAX_DLEN));
    }

    // Only the first dlc bytes take part in the comparison
    bool operator==(const CANFrame& other) const {
        return kind == other.kind && id == other.id && dlc == other.dlc &&
               payload() == other.payload();
    }
    bool operator!=(const CANFrame& other) const { return !(*this == other); }
};

// ============================================================================
// SLCAN Protocol (Serial Line CAN - Lawicel Protocol)
// ============================================================================

namespace SLCAN {

// SLCAN Commands
constexpr char CMD_SETUP_STD_BITRATE = 'S';    // Setup standard bit rate
constexpr char CMD_SETUP_BTR = 's';             // Setup bit timing register
constexpr char CMD_OPEN = 'O';                  // Open CAN channel
constexpr char CMD_CLOSE = 'C';                 // Close CAN channel
constexpr char CMD_TRANSMIT_STD = 't';          // Transmit standard frame
constexpr char CMD_TRANSMIT_EXT = 'T';          // Transmit extended frame
constexpr char CMD_READ_STATUS = 'F';           // Read status flags
constexpr char CMD_SET_ACR = 'M';               // Set acceptance code register
constexpr char CMD_SET_AMR = 'm';               // Set acceptance mask register
constexpr char CMD_GET_VERSION = 'V';           // Get hardware/software version
constexpr char CMD_GET_SERIAL = 'N';            // Get serial number

// Response characters
constexpr char RESP_OK = '\r';                  // Command success / terminator
constexpr char RESP_ERROR = '\x07';             // Command error (bell)
constexpr char RESP_TX_STD_OK = 'z';            // Standard frame queued
constexpr char RESP_TX_EXT_OK = 'Z';            // Extended frame queued

// Frame type prefixes (for RX)
constexpr char FRAME_STD = 't';                 // Standard data frame
constexpr char FRAME_EXT = 'T';                 // Extended data frame

// Standard bit rate codes (for 'S' command)
constexpr char BITRATE_10K = '0';
constexpr char BITRATE_20K = '1';
constexpr char BITRATE_50K = '2';
constexpr char BITRATE_100K = '3';
constexpr char BITRATE_125K = '4';
constexpr char BITRATE_250K = '5';
constexpr char BITRATE_500K = '6';
constexpr char BITRATE_800K = '7';
constexpr char BITRATE_1M = '8';

// BTR0/BTR1 register pairs (for 's' command), SJA1000 clocked at 16 MHz
constexpr uint16_t BTR_10K = 0x711C;
constexpr uint16_t BTR_20K = 0x581C;
constexpr uint16_t BTR_50K = 0x491C;
constexpr uint16_t BTR_100K = 0x441C;
constexpr uint16_t BTR_125K = 0x431C;
constexpr uint16_t BTR_250K = 0x411C;
constexpr uint16_t BTR_500K = 0x401C;
constexpr uint16_t BTR_800K = 0x4016;
constexpr uint16_t BTR_1M = 0x4014;

// Predefined code for the 'S' command, nullopt for unsupported rates
std::optional<char> bitrateToCode(uint32_t bitrate);

// BTR0/BTR1 value for the 's' command, nullopt for unsupported rates
std::optional<uint16_t> bitrateToBtr(uint32_t bitrate);

// ============================================================================
// Response status classification
// ============================================================================

enum class ResponseStatus : uint8_t {
    Ok,        // 'Z' / 'z'
    Error,     // BEL
    Unknown    // anything else, including CR
};

ResponseStatus classifyStatus(uint8_t byte);
const char* toString(ResponseStatus status);

// ============================================================================
// Hex helpers
// ============================================================================

enum class HexCase : uint8_t { Lower, Upper };

// Zero-padded on the left to exactly `width` digits; higher digits are dropped
std::string toHex(uint64_t value, size_t width, HexCase hexCase = HexCase::Upper);

// Parses every character of `hex`; false on empty input or a non-hex digit
bool parseHex(const std::string& hex, uint64_t& value);

std::string dataToHex(const uint8_t* data, size_t len, HexCase hexCase = HexCase::Lower);

// ============================================================================
// SLCAN Frame Codec
// ============================================================================

class FrameCodec {
public:
    // Builds a frame from an explicit byte list (data.size() must equal length)
    static slcan::Result<CANFrame> build(FrameKind kind, uint32_t id, uint8_t length,
                                         const std::vector<uint8_t>& data);

    // Builds a frame from an integer, most significant byte first
    // (build(Standard, 0x7ff, 2, 0xbeef) -> data {0xbe, 0xef})
    static slcan::Result<CANFrame> build(FrameKind kind, uint32_t id, uint8_t length,
                                         uint64_t value);

    // Format: tiiildd..  or  Tiiiiiiiildd..  (no terminator)
    static slcan::Result<std::string> encode(const CANFrame& frame);

    // Exact inverse of encode(); trailing characters beyond the frame are rejected
    static slcan::Result<CANFrame> decode(const std::string& wire);

    static char tag(FrameKind kind) { return kind == FrameKind::Extended ? FRAME_EXT : FRAME_STD; }
    static size_t identifierWidth(FrameKind kind) { return kind == FrameKind::Extended ? 8 : 3; }

    // Wire size of a frame header: tag + identifier + length digit
    static size_t headerWidth(FrameKind kind) { return 1 + identifierWidth(kind) + 1; }
};

} // namespace SLCAN

// ============================================================================
// CAN Bit Timing Configuration (SJA1000 BTR0/BTR1)
// ============================================================================

struct CANBitTiming {
    uint8_t prescaler;          // Baud Rate Prescaler (BRP, 6 bits)
    uint8_t sjw;                // Synchronization Jump Width (2 bits)
    uint8_t tseg1;              // Time segment 1 (4 bits)
    uint8_t tseg2;              // Time segment 2 (3 bits)
    bool triple_sampling;       // SAM bit

    CANBitTiming()
        : prescaler(0), sjw(0), tseg1(0), tseg2(0), triple_sampling(false) {}

    static CANBitTiming fromBtr(uint16_t btr);
    uint16_t toBtr() const;

    // Total time quanta per bit: sync (1) + (TSEG1 + 1) + (TSEG2 + 1)
    uint16_t getTotalTQ() const {
        return static_cast<uint16_t>(3 + tseg1 + tseg2);
    }

    // bitrate = clock / (2 * (BRP + 1) * (3 + TSEG1 + TSEG2))
    uint32_t getBitrate(uint32_t clock_hz = SJA1000_CLOCK_HZ) const;

    float getSamplingPoint() const {
        return 100.0f * (2 + tseg1) / getTotalTQ();
    }
};

} // namespace CANProtocol

#endif // CAN_SLCAN_HPP
