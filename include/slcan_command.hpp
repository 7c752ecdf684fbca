#ifndef SLCAN_COMMAND_HPP
#define SLCAN_COMMAND_HPP

/**
 * @file slcan_command.hpp
 * @brief LAWICEL ASCII command catalog (CANUSB / CAN232 manual)
 *
 * Every request is `tag || field1 || field2 ...` followed by CR, each field
 * zero-padded hex text of a fixed number of characters. Every response has a
 * fixed wire size known before the read, so a transaction is always one
 * write followed by one read of exactly response_size() bytes.
 *
 *   Command          Tag  Request            Response
 *   open_channel     O    -                  status
 *   close_channel    C    -                  status
 *   get_serial       N    -                  'N' serial(4) status
 *   get_version      V    -                  'V' hw(2) sw(2) status
 *   status_flag      F    -                  'F' flags(2) status
 *   standard_setup   S    code(1)            status
 *   btr_setup        s    btr(4)             status
 *   acceptance_mask  m    mask(8)            status
 *   acceptance_code  M    code(8)            status
 *   transmit         t/T  frame              status (+1 byte on success)
 */

#include "can_slcan.hpp"
#include "slcan_error.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slcan {

enum class Command : uint8_t {
  OpenChannel,
  CloseChannel,
  GetSerial,
  GetVersion,
  StatusFlag,
  StandardSetup,
  BtrSetup,
  AcceptanceMask,
  AcceptanceCode,
  Transmit
};

constexpr size_t kCommandCount = 10;
static_assert(static_cast<size_t>(Command::Transmit) + 1 == kCommandCount,
              "kCommandCount out of sync with Command");

enum class FieldFormat : uint8_t {
  Hex,   // zero-padded hexadecimal text
  Text,  // printable characters taken as-is (command echo, serial number)
  Byte   // one raw byte (return code)
};

struct FieldSpec {
  const char* name;
  uint8_t width;           // characters on the wire
  FieldFormat format;
  uint32_t default_value;
};

constexpr size_t kMaxFields = 4;

struct CommandDescriptor {
  Command command;
  const char* name;
  char tag;  // Transmit takes 't' or 'T' from the frame kind
  CANProtocol::SLCAN::HexCase hex_case;
  uint8_t request_field_count;
  std::array<FieldSpec, kMaxFields> request_fields;
  uint8_t response_field_count;
  std::array<FieldSpec, kMaxFields> response_fields;

  size_t request_size() const;
  size_t response_size() const;

  // Index of the trailing return code field, if the response has one
  std::optional<size_t> return_code_field() const;
};

const CommandDescriptor& descriptor(Command command);
const char* to_string(Command command);
std::optional<Command> command_from_name(const std::string& name);

/// Encodes `tag || hex(values...)`. Missing trailing values take the field
/// defaults; extra values or values wider than their field are rejected.
Result<std::string> encode(const CommandDescriptor& desc, const std::vector<uint64_t>& values);

/// Splits a response into its fields. Fails if `wire` is shorter than
/// desc.response_size(); bytes past that size are ignored.
Result<std::vector<std::string>> decode(const CommandDescriptor& desc, const std::string& wire);

// ============================================================================
// Responses
// ============================================================================

struct StatusResponse {
  uint8_t return_code{0};

  CANProtocol::SLCAN::ResponseStatus status() const {
    return CANProtocol::SLCAN::classifyStatus(return_code);
  }
  bool is_terminator() const { return return_code == CANProtocol::SLCAN::RESP_OK; }

  static Result<StatusResponse> from_fields(const std::vector<std::string>& fields);
};

struct SerialResponse {
  char cmd{0};
  std::string serial;
  uint8_t return_code{0};

  static Result<SerialResponse> from_fields(const std::vector<std::string>& fields);
};

struct VersionResponse {
  char cmd{0};
  uint8_t hardware_version{0};
  uint8_t software_version{0};
  uint8_t return_code{0};

  std::string describe() const;

  static Result<VersionResponse> from_fields(const std::vector<std::string>& fields);
};

// SJA1000 status as reported by the 'F' command
struct StatusFlagResponse {
  char cmd{0};
  uint8_t flags{0};
  uint8_t return_code{0};

  bool rx_queue_full() const    { return (flags >> 7) & 1; }
  bool tx_queue_full() const    { return (flags >> 6) & 1; }
  bool error_warning() const    { return (flags >> 5) & 1; }
  bool data_overrun() const     { return (flags >> 4) & 1; }
  bool error_passive() const    { return (flags >> 2) & 1; }
  bool arbitration_lost() const { return (flags >> 1) & 1; }
  bool bus_error() const        { return (flags >> 0) & 1; }

  std::string describe() const;

  static Result<StatusFlagResponse> from_fields(const std::vector<std::string>& fields);
};

// Untyped response for commands issued by name
struct RawResponse {
  Command command{Command::OpenChannel};
  std::vector<std::string> fields;
  std::optional<uint8_t> return_code;

  CANProtocol::SLCAN::ResponseStatus status() const {
    return return_code ? CANProtocol::SLCAN::classifyStatus(*return_code)
                       : CANProtocol::SLCAN::ResponseStatus::Unknown;
  }

  // Value of a response field by name, empty if absent
  std::string field(const std::string& name) const;
};

// ============================================================================
// Requests
// ============================================================================

struct OpenChannelRequest {
  static constexpr Command kCommand = Command::OpenChannel;
  using Response = StatusResponse;
  Result<std::string> encode() const;
};

struct CloseChannelRequest {
  static constexpr Command kCommand = Command::CloseChannel;
  using Response = StatusResponse;
  Result<std::string> encode() const;
};

struct GetSerialRequest {
  static constexpr Command kCommand = Command::GetSerial;
  using Response = SerialResponse;
  Result<std::string> encode() const;
};

struct GetVersionRequest {
  static constexpr Command kCommand = Command::GetVersion;
  using Response = VersionResponse;
  Result<std::string> encode() const;
};

struct StatusFlagRequest {
  static constexpr Command kCommand = Command::StatusFlag;
  using Response = StatusFlagResponse;
  Result<std::string> encode() const;
};

// Predefined bit rates ('S0' .. 'S8')
struct StandardSetupRequest {
  static constexpr Command kCommand = Command::StandardSetup;
  using Response = StatusResponse;

  uint8_t code{4};  // 125 kbit/s

  static Result<StandardSetupRequest> from_bitrate(uint32_t bitrate);
  Result<std::string> encode() const;
};

// Arbitrary bit timing through the SJA1000 BTR0/BTR1 registers
struct BtrSetupRequest {
  static constexpr Command kCommand = Command::BtrSetup;
  using Response = StatusResponse;

  uint16_t btr{CANProtocol::SLCAN::BTR_125K};

  static Result<BtrSetupRequest> from_bitrate(uint32_t bitrate);
  Result<std::string> encode() const;
};

// AMn registers; all ones receives every frame
struct AcceptanceMaskRequest {
  static constexpr Command kCommand = Command::AcceptanceMask;
  using Response = StatusResponse;

  uint32_t mask{0xFFFFFFFFU};

  Result<std::string> encode() const;
};

// ACn registers
struct AcceptanceCodeRequest {
  static constexpr Command kCommand = Command::AcceptanceCode;
  using Response = StatusResponse;

  uint32_t code{0};

  Result<std::string> encode() const;
};

struct TransmitRequest {
  static constexpr Command kCommand = Command::Transmit;
  using Response = StatusResponse;

  CANProtocol::CANFrame frame;

  Result<std::string> encode() const;
};

} // namespace slcan

#endif // SLCAN_COMMAND_HPP
