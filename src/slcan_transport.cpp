#include "slcan_transport.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/select.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace slcan {

namespace {

bool baud_to_speed(uint32_t baud, speed_t& speed) {
  switch (baud) {
    case 9600:   speed = B9600;   return true;
    case 19200:  speed = B19200;  return true;
    case 38400:  speed = B38400;  return true;
    case 57600:  speed = B57600;  return true;
    case 115200: speed = B115200; return true;
    case 230400: speed = B230400; return true;
#ifdef B460800
    case 460800: speed = B460800; return true;
#endif
#ifdef B921600
    case 921600: speed = B921600; return true;
#endif
    default:     return false;
  }
}

std::string errno_message(const std::string& what) {
  return what + ": " + strerror(errno);
}

} // namespace

SerialPort::~SerialPort() {
  close();
}

Result<void> SerialPort::open(const SerialConfig& config) {
  if (fd_ >= 0) {
    return Result<void>::failure(ErrorCode::Transport, "serial port already open");
  }

  speed_t speed;
  if (!baud_to_speed(config.baud_rate, speed)) {
    return Result<void>::failure(ErrorCode::Validation,
                                 "unsupported baud rate " + std::to_string(config.baud_rate));
  }

  fd_ = ::open(config.device.c_str(), O_RDWR | O_NOCTTY);
  if (fd_ < 0) {
    std::string msg = errno_message("Failed to open " + config.device);
    std::cerr << msg << "\n";
    return Result<void>::failure(ErrorCode::Transport, msg);
  }

  // Save original termios
  if (tcgetattr(fd_, &orig_termios_) < 0) {
    std::string msg = errno_message("tcgetattr failed");
    std::cerr << msg << "\n";
    ::close(fd_); fd_ = -1;
    return Result<void>::failure(ErrorCode::Transport, msg);
  }
  termios_saved_ = true;

  // Configure raw mode: 8N1, no parity, no flow control
  struct termios tio = orig_termios_;
  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
  tio.c_cflag |= CS8;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  tio.c_oflag &= ~OPOST;
  tio.c_cc[VMIN] = 1;
  tio.c_cc[VTIME] = 0;

  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(fd_, TCSANOW, &tio) < 0) {
    std::string msg = errno_message("tcsetattr failed");
    std::cerr << msg << "\n";
    close();
    return Result<void>::failure(ErrorCode::Transport, msg);
  }

  tcflush(fd_, TCIOFLUSH);
  config_ = config;
  return Result<void>::success();
}

void SerialPort::close() {
  if (fd_ >= 0) {
    if (termios_saved_) {
      tcsetattr(fd_, TCSANOW, &orig_termios_);
    }
    ::close(fd_);
    fd_ = -1;
    termios_saved_ = false;
  }
}

Result<void> SerialPort::write(const std::string& bytes) {
  if (fd_ < 0) {
    return Result<void>::failure(ErrorCode::Transport, "serial port not open");
  }

  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return Result<void>::failure(ErrorCode::Transport, errno_message("write failed"));
    }
    written += static_cast<size_t>(n);
  }
  return Result<void>::success();
}

Result<bool> SerialPort::wait_readable(std::chrono::milliseconds timeout) {
  fd_set rfds;
  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  FD_ZERO(&rfds);
  FD_SET(fd_, &rfds);

  int ret = select(fd_ + 1, &rfds, nullptr, nullptr, &tv);
  if (ret < 0) {
    if (errno == EINTR) return Result<bool>::success(false);
    return Result<bool>::failure(ErrorCode::Transport, errno_message("select failed"));
  }
  return Result<bool>::success(ret > 0);
}

Result<std::string> SerialPort::read(size_t count) {
  if (fd_ < 0) {
    return Result<std::string>::failure(ErrorCode::Transport, "serial port not open");
  }

  std::string out;
  out.reserve(count);
  auto deadline = std::chrono::steady_clock::now() + config_.read_timeout;

  while (out.size() < count) {
    if (config_.read_timeout.count() > 0) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return Result<std::string>::failure(
            ErrorCode::Transport, "read timed out after " + std::to_string(out.size()) +
                                  " of " + std::to_string(count) + " bytes");
      }
      auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      auto readable = wait_readable(remain);
      if (!readable.ok) return Result<std::string>::failure(readable.error);
      if (!readable.value) continue;
    }

    char buf[64];
    const size_t want = std::min(sizeof(buf), count - out.size());
    ssize_t n = ::read(fd_, buf, want);
    if (n < 0) {
      if (errno == EINTR) continue;
      return Result<std::string>::failure(ErrorCode::Transport, errno_message("read failed"));
    }
    if (n == 0) {
      return Result<std::string>::failure(ErrorCode::Transport, "serial port closed");
    }
    out.append(buf, static_cast<size_t>(n));
  }
  return Result<std::string>::success(out);
}

} // namespace slcan
