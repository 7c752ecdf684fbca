#ifndef SLCAN_ERROR_HPP
#define SLCAN_ERROR_HPP

/**
 * @file slcan_error.hpp
 * @brief Error categories and result container shared by the SLCAN library
 *
 * Every fallible operation returns a Result<T>. Nothing in the library
 * throws; callers inspect `ok` and, on failure, `error.code` / `error.message`.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace slcan {

enum class ErrorCode : uint8_t {
  None = 0,
  Validation,      ///< Parameter out of declared range (before I/O)
  Length,          ///< Frame or payload length out of range (before I/O)
  UnknownCommand,  ///< Command name not in the catalog (before I/O)
  Decode,          ///< Reply shorter than, or not shaped like, its fixed width
  Protocol,        ///< Unexpected tag or missing terminator in the RX stream
  Initialization,  ///< Setup step answered something other than CR
  Transport        ///< Serial port failure, passed through unmodified
};

inline const char* to_string(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;

  std::string describe() const {
    return std::string(to_string(code)) + ": " + message;
  }
};

template <typename T>
struct Result {
  bool ok{false};
  T value{};
  Error error{};

  static Result success(T v) {
    Result r; r.ok = true; r.value = std::move(v); return r;
  }

  static Result failure(const Error& e) {
    Result r; r.ok = false; r.error = e; return r;
  }

  static Result failure(ErrorCode code, std::string message) {
    return failure(Error{code, std::move(message)});
  }
};

template <>
struct Result<void> {
  bool ok{false};
  Error error{};

  static Result success() {
    Result r; r.ok = true; return r;
  }

  static Result failure(const Error& e) {
    Result r; r.ok = false; r.error = e; return r;
  }

  static Result failure(ErrorCode code, std::string message) {
    return failure(Error{code, std::move(message)});
  }
};

inline const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:           return "None";
    case ErrorCode::Validation:     return "ValidationError";
    case ErrorCode::Length:         return "LengthError";
    case ErrorCode::UnknownCommand: return "UnknownCommandError";
    case ErrorCode::Decode:         return "DecodeError";
    case ErrorCode::Protocol:       return "ProtocolError";
    case ErrorCode::Initialization: return "InitializationError";
    case ErrorCode::Transport:      return "TransportError";
  }
  return "Unknown";
}

} // namespace slcan

#endif // SLCAN_ERROR_HPP
