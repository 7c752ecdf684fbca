#include "slcan_command.hpp"
#include <sstream>

namespace slcan {

using CANProtocol::SLCAN::HexCase;

namespace {

constexpr FieldSpec kNone{"", 0, FieldFormat::Hex, 0};
constexpr FieldSpec kReturnCode{"return_code", 1, FieldFormat::Byte, 0x0D};

// Indexed by Command, same order as the enum
const std::array<CommandDescriptor, kCommandCount> kCatalog = {{
  {Command::OpenChannel, "open_channel", CANProtocol::SLCAN::CMD_OPEN, HexCase::Upper,
   0, {{kNone, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},

  {Command::CloseChannel, "close_channel", CANProtocol::SLCAN::CMD_CLOSE, HexCase::Upper,
   0, {{kNone, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},

  {Command::GetSerial, "get_serial", CANProtocol::SLCAN::CMD_GET_SERIAL, HexCase::Upper,
   0, {{kNone, kNone, kNone, kNone}},
   3, {{{"cmd", 1, FieldFormat::Text, 'N'},
        {"serial", 4, FieldFormat::Text, 0},
        kReturnCode, kNone}}},

  {Command::GetVersion, "get_version", CANProtocol::SLCAN::CMD_GET_VERSION, HexCase::Upper,
   0, {{kNone, kNone, kNone, kNone}},
   4, {{{"cmd", 1, FieldFormat::Text, 'V'},
        {"hardware_version", 2, FieldFormat::Hex, 0},
        {"software_version", 2, FieldFormat::Hex, 0},
        kReturnCode}}},

  {Command::StatusFlag, "status_flag", CANProtocol::SLCAN::CMD_READ_STATUS, HexCase::Upper,
   0, {{kNone, kNone, kNone, kNone}},
   3, {{{"cmd", 1, FieldFormat::Text, 'F'},
        {"status_flag", 2, FieldFormat::Hex, 0},
        kReturnCode, kNone}}},

  {Command::StandardSetup, "standard_setup", CANProtocol::SLCAN::CMD_SETUP_STD_BITRATE, HexCase::Upper,
   1, {{{"code", 1, FieldFormat::Hex, 4}, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},

  {Command::BtrSetup, "btr_setup", CANProtocol::SLCAN::CMD_SETUP_BTR, HexCase::Upper,
   1, {{{"btr", 4, FieldFormat::Hex, CANProtocol::SLCAN::BTR_125K}, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},

  {Command::AcceptanceMask, "acceptance_mask", CANProtocol::SLCAN::CMD_SET_AMR, HexCase::Upper,
   1, {{{"mask", 8, FieldFormat::Hex, 0xFFFFFFFFU}, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},

  {Command::AcceptanceCode, "acceptance_code", CANProtocol::SLCAN::CMD_SET_ACR, HexCase::Upper,
   1, {{{"code", 8, FieldFormat::Hex, 0x00000000U}, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},

  {Command::Transmit, "transmit", CANProtocol::SLCAN::CMD_TRANSMIT_STD, HexCase::Lower,
   0, {{kNone, kNone, kNone, kNone}},
   1, {{kReturnCode, kNone, kNone, kNone}}},
}};

Result<uint64_t> hex_field(const std::vector<std::string>& fields, size_t index, const char* name) {
  uint64_t value = 0;
  if (index >= fields.size() || !CANProtocol::SLCAN::parseHex(fields[index], value)) {
    return Result<uint64_t>::failure(ErrorCode::Decode,
                                     std::string("invalid ") + name + " field");
  }
  return Result<uint64_t>::success(value);
}

Result<std::vector<std::string>> expect_fields(const std::vector<std::string>& fields, size_t count) {
  if (fields.size() != count) {
    return Result<std::vector<std::string>>::failure(
        ErrorCode::Decode, "expected " + std::to_string(count) + " response fields, got " +
                           std::to_string(fields.size()));
  }
  return Result<std::vector<std::string>>::success(fields);
}

} // namespace

// ============================================================================
// Catalog
// ============================================================================

size_t CommandDescriptor::request_size() const {
  size_t size = 1;
  for (uint8_t i = 0; i < request_field_count; ++i) size += request_fields[i].width;
  return size;
}

size_t CommandDescriptor::response_size() const {
  size_t size = 0;
  for (uint8_t i = 0; i < response_field_count; ++i) size += response_fields[i].width;
  return size;
}

std::optional<size_t> CommandDescriptor::return_code_field() const {
  if (response_field_count == 0) return std::nullopt;
  const size_t last = response_field_count - 1;
  if (response_fields[last].format != FieldFormat::Byte) return std::nullopt;
  return last;
}

const CommandDescriptor& descriptor(Command command) {
  return kCatalog[static_cast<size_t>(command)];
}

const char* to_string(Command command) {
  return descriptor(command).name;
}

std::optional<Command> command_from_name(const std::string& name) {
  for (const auto& desc : kCatalog) {
    if (name == desc.name) return desc.command;
  }
  return std::nullopt;
}

Result<std::string> encode(const CommandDescriptor& desc, const std::vector<uint64_t>& values) {
  using R = Result<std::string>;

  if (values.size() > desc.request_field_count) {
    return R::failure(ErrorCode::Validation,
                      std::string(desc.name) + " takes " + std::to_string(desc.request_field_count) +
                      " field(s), " + std::to_string(values.size()) + " given");
  }

  std::string wire(1, desc.tag);
  for (uint8_t i = 0; i < desc.request_field_count; ++i) {
    const FieldSpec& field = desc.request_fields[i];
    const uint64_t value = i < values.size() ? values[i] : field.default_value;

    if (field.width < 16 && (value >> (4 * field.width)) != 0) {
      return R::failure(ErrorCode::Validation,
                        std::string(desc.name) + "." + field.name + " value 0x" +
                        CANProtocol::SLCAN::toHex(value, 16) + " exceeds " +
                        std::to_string(field.width) + " hex digits");
    }
    wire += CANProtocol::SLCAN::toHex(value, field.width, desc.hex_case);
  }
  return R::success(wire);
}

Result<std::vector<std::string>> decode(const CommandDescriptor& desc, const std::string& wire) {
  using R = Result<std::vector<std::string>>;

  if (wire.size() < desc.response_size()) {
    return R::failure(ErrorCode::Decode,
                      std::string(desc.name) + " response too short (" +
                      std::to_string(wire.size()) + " < " +
                      std::to_string(desc.response_size()) + ")");
  }

  std::vector<std::string> fields;
  size_t offset = 0;
  for (uint8_t i = 0; i < desc.response_field_count; ++i) {
    const FieldSpec& field = desc.response_fields[i];
    fields.push_back(wire.substr(offset, field.width));
    offset += field.width;
  }
  return R::success(fields);
}

// ============================================================================
// Responses
// ============================================================================

Result<StatusResponse> StatusResponse::from_fields(const std::vector<std::string>& fields) {
  auto checked = expect_fields(fields, 1);
  if (!checked.ok) return Result<StatusResponse>::failure(checked.error);

  StatusResponse r;
  r.return_code = static_cast<uint8_t>(fields[0][0]);
  return Result<StatusResponse>::success(r);
}

Result<SerialResponse> SerialResponse::from_fields(const std::vector<std::string>& fields) {
  auto checked = expect_fields(fields, 3);
  if (!checked.ok) return Result<SerialResponse>::failure(checked.error);

  SerialResponse r;
  r.cmd = fields[0][0];
  r.serial = fields[1];
  r.return_code = static_cast<uint8_t>(fields[2][0]);
  return Result<SerialResponse>::success(r);
}

Result<VersionResponse> VersionResponse::from_fields(const std::vector<std::string>& fields) {
  auto checked = expect_fields(fields, 4);
  if (!checked.ok) return Result<VersionResponse>::failure(checked.error);

  auto hw = hex_field(fields, 1, "hardware_version");
  if (!hw.ok) return Result<VersionResponse>::failure(hw.error);
  auto sw = hex_field(fields, 2, "software_version");
  if (!sw.ok) return Result<VersionResponse>::failure(sw.error);

  VersionResponse r;
  r.cmd = fields[0][0];
  r.hardware_version = static_cast<uint8_t>(hw.value);
  r.software_version = static_cast<uint8_t>(sw.value);
  r.return_code = static_cast<uint8_t>(fields[3][0]);
  return Result<VersionResponse>::success(r);
}

std::string VersionResponse::describe() const {
  std::ostringstream oss;
  oss << "hardware " << CANProtocol::SLCAN::toHex(hardware_version, 2)
      << " software " << CANProtocol::SLCAN::toHex(software_version, 2);
  return oss.str();
}

Result<StatusFlagResponse> StatusFlagResponse::from_fields(const std::vector<std::string>& fields) {
  auto checked = expect_fields(fields, 3);
  if (!checked.ok) return Result<StatusFlagResponse>::failure(checked.error);

  auto flags = hex_field(fields, 1, "status_flag");
  if (!flags.ok) return Result<StatusFlagResponse>::failure(flags.error);

  StatusFlagResponse r;
  r.cmd = fields[0][0];
  r.flags = static_cast<uint8_t>(flags.value);
  r.return_code = static_cast<uint8_t>(fields[2][0]);
  return Result<StatusFlagResponse>::success(r);
}

std::string StatusFlagResponse::describe() const {
  std::ostringstream oss;
  oss << std::boolalpha
      << "status_flag=" << CANProtocol::SLCAN::toHex(flags, 2)
      << " rx_queue_full=" << rx_queue_full()
      << " tx_queue_full=" << tx_queue_full()
      << " error_warning=" << error_warning()
      << " data_overrun=" << data_overrun()
      << " error_passive=" << error_passive()
      << " arbitration_lost=" << arbitration_lost()
      << " bus_error=" << bus_error();
  return oss.str();
}

std::string RawResponse::field(const std::string& name) const {
  const CommandDescriptor& desc = descriptor(command);
  for (size_t i = 0; i < desc.response_field_count && i < fields.size(); ++i) {
    if (name == desc.response_fields[i].name) return fields[i];
  }
  return {};
}

// ============================================================================
// Requests
// ============================================================================

Result<std::string> OpenChannelRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {});
}

Result<std::string> CloseChannelRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {});
}

Result<std::string> GetSerialRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {});
}

Result<std::string> GetVersionRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {});
}

Result<std::string> StatusFlagRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {});
}

Result<StandardSetupRequest> StandardSetupRequest::from_bitrate(uint32_t bitrate) {
  auto code = CANProtocol::SLCAN::bitrateToCode(bitrate);
  if (!code) {
    return Result<StandardSetupRequest>::failure(
        ErrorCode::Validation, "unsupported bitrate " + std::to_string(bitrate));
  }
  StandardSetupRequest req;
  req.code = static_cast<uint8_t>(*code - '0');
  return Result<StandardSetupRequest>::success(req);
}

Result<std::string> StandardSetupRequest::encode() const {
  if (code > 8) {
    return Result<std::string>::failure(
        ErrorCode::Validation, "invalid bitrate code " + std::to_string(code) + " (not 0-8)");
  }
  return slcan::encode(descriptor(kCommand), {code});
}

Result<BtrSetupRequest> BtrSetupRequest::from_bitrate(uint32_t bitrate) {
  auto btr = CANProtocol::SLCAN::bitrateToBtr(bitrate);
  if (!btr) {
    return Result<BtrSetupRequest>::failure(
        ErrorCode::Validation, "unsupported bitrate " + std::to_string(bitrate));
  }
  BtrSetupRequest req;
  req.btr = *btr;
  return Result<BtrSetupRequest>::success(req);
}

Result<std::string> BtrSetupRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {btr});
}

Result<std::string> AcceptanceMaskRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {mask});
}

Result<std::string> AcceptanceCodeRequest::encode() const {
  return slcan::encode(descriptor(kCommand), {code});
}

Result<std::string> TransmitRequest::encode() const {
  return CANProtocol::SLCAN::FrameCodec::encode(frame);
}

} // namespace slcan
