#ifndef SLCAN_TRANSPORT_HPP
#define SLCAN_TRANSPORT_HPP

#include "slcan_error.hpp"
#include <termios.h>
#include <chrono>
#include <cstdint>
#include <string>

namespace slcan {

/// Byte channel to the adapter. read() blocks until exactly `count` bytes
/// arrived or the channel failed.
class ISerialPort {
public:
  virtual ~ISerialPort() = default;
  virtual Result<void> write(const std::string& bytes) = 0;
  virtual Result<std::string> read(size_t count) = 0;
};

struct SerialConfig {
  std::string device{"/dev/ttyUSB0"};
  uint32_t baud_rate{19200};
  // 0 blocks forever; otherwise a read that stalls this long fails
  std::chrono::milliseconds read_timeout{0};
};

/// termios serial port in raw 8N1 mode
class SerialPort : public ISerialPort {
public:
  SerialPort() = default;
  ~SerialPort() override;

  // Non-copyable
  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  Result<void> open(const SerialConfig& config);
  void close();
  bool is_open() const { return fd_ >= 0; }

  const SerialConfig& config() const { return config_; }

  Result<void> write(const std::string& bytes) override;
  Result<std::string> read(size_t count) override;

private:
  // Waits until the descriptor is readable; false on timeout
  Result<bool> wait_readable(std::chrono::milliseconds timeout);

  int fd_{-1};
  struct termios orig_termios_{};
  bool termios_saved_{false};
  SerialConfig config_{};
};

} // namespace slcan

#endif // SLCAN_TRANSPORT_HPP
