/**
 * @file error.hpp
 * @brief Error codes and exception hierarchy for the tessera authorization core
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace tessera {

/**
 * @brief Error codes for programmatic error handling
 */
enum class ErrorCode : uint32_t {
  SUCCESS = 0,
  DECODE_FAILED = 1000,
  INVALID_BASE64 = 1001,
  INVALID_JSON = 1002,
  INVALID_ARGUMENT = 2000,
  EXPIRY_OUT_OF_RANGE = 2001,
  INVALID_STATE_TRANSITION = 2002,
  CRYPTO_OPERATION_FAILED = 3000,
  MEMORY_ERROR = 6000,
  IO_ERROR = 6001,
  PERMISSION_ERROR = 6002,
  RESOURCE_EXHAUSTED = 6003,
  SYSTEM_CALL_FAILED = 6004
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::SUCCESS:
      return "Success";
    case ErrorCode::DECODE_FAILED:
      return "Decode failure";
    case ErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case ErrorCode::INVALID_JSON:
      return "Invalid JSON document";
    case ErrorCode::INVALID_ARGUMENT:
      return "Invalid argument";
    case ErrorCode::EXPIRY_OUT_OF_RANGE:
      return "Expiry out of encodable range";
    case ErrorCode::INVALID_STATE_TRANSITION:
      return "Invalid state transition";
    case ErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case ErrorCode::MEMORY_ERROR:
      return "Memory allocation error";
    case ErrorCode::IO_ERROR:
      return "Input/output error";
    case ErrorCode::PERMISSION_ERROR:
      return "Permission denied";
    case ErrorCode::RESOURCE_EXHAUSTED:
      return "System resource exhausted";
    case ErrorCode::SYSTEM_CALL_FAILED:
      return "System call failed";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all tessera errors
 */
class TesseraError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit TesseraError(ErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] ErrorCode errorCode() const noexcept { return error_code_; }

 private:
  ErrorCode error_code_;
};

/**
 * @brief Exception for truncated or malformed byte sequences
 *
 * Raised by the byte readers and per-version decoders. The token codecs catch
 * it internally; it never crosses their public API.
 */
class DecodeError : public TesseraError {
 public:
  explicit DecodeError(std::string_view details)
      : TesseraError(ErrorCode::DECODE_FAILED,
                     std::string("Decode failure: ") + std::string(details)) {}
};

class InvalidBase64Error : public TesseraError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : TesseraError(
            ErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

class InvalidJsonError : public TesseraError {
 public:
  explicit InvalidJsonError(std::string_view details)
      : TesseraError(ErrorCode::INVALID_JSON,
                     std::string("Invalid JSON document: ") +
                         std::string(details)) {}
};

/**
 * @brief Exception for caller misuse (missing fields, oversize names, ...)
 */
class InvalidArgumentError : public TesseraError {
 public:
  explicit InvalidArgumentError(std::string_view details)
      : TesseraError(ErrorCode::INVALID_ARGUMENT, details) {}
};

/**
 * @brief Exception for expiry values that do not fit a format's time field
 */
class ExpiryOutOfRangeError : public TesseraError {
 public:
  explicit ExpiryOutOfRangeError(std::string_view details)
      : TesseraError(ErrorCode::EXPIRY_OUT_OF_RANGE, details) {}
};

/**
 * @brief Exception for illegal lifecycle transitions
 */
class InvalidStateTransitionError : public TesseraError {
 public:
  explicit InvalidStateTransitionError(std::string_view details)
      : TesseraError(ErrorCode::INVALID_STATE_TRANSITION, details) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public TesseraError {
 public:
  explicit CryptoError(std::string_view details)
      : TesseraError(ErrorCode::CRYPTO_OPERATION_FAILED,
                     std::string("Cryptographic operation failed: ") +
                         std::string(details)) {}
};

class MemoryError : public TesseraError {
 public:
  explicit MemoryError(std::string_view details)
      : TesseraError(
            ErrorCode::MEMORY_ERROR,
            std::string("Memory allocation error: ") + std::string(details)) {}
};

class IoError : public TesseraError {
 public:
  explicit IoError(std::string_view details)
      : TesseraError(ErrorCode::IO_ERROR,
                     std::string("Input/output error: ") + std::string(details)) {}
};

class PermissionError : public TesseraError {
 public:
  explicit PermissionError(std::string_view details)
      : TesseraError(ErrorCode::PERMISSION_ERROR,
                     std::string("Permission denied: ") + std::string(details)) {}
};

class ResourceExhaustedError : public TesseraError {
 public:
  explicit ResourceExhaustedError(std::string_view details)
      : TesseraError(ErrorCode::RESOURCE_EXHAUSTED,
                     std::string("System resource exhausted: ") +
                         std::string(details)) {}
};

class SystemCallError : public TesseraError {
 public:
  explicit SystemCallError(std::string_view details)
      : TesseraError(ErrorCode::SYSTEM_CALL_FAILED,
                     std::string("System call failed: ") + std::string(details)) {}
};

/**
 * @brief Internal reason a presented token was refused
 *
 * Only visible to the codecs and their tests. Public verify functions collapse
 * every rejection to std::nullopt.
 */
enum class TokenRejection : uint8_t {
  Malformed,
  UnknownVersion,
  BadSignature,
  Expired
};

constexpr std::string_view tokenRejectionToString(TokenRejection r) noexcept {
  switch (r) {
    case TokenRejection::Malformed:
      return "malformed";
    case TokenRejection::UnknownVersion:
      return "unknown version";
    case TokenRejection::BadSignature:
      return "bad signature";
    case TokenRejection::Expired:
      return "expired";
  }
  return "unknown";
}

/**
 * @brief Result type for error handling without exceptions
 * Inspired by Rust's Result and C++23's std::expected
 */
template <typename T, typename E = TesseraError>
class Result {
 public:
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  const T& value() const& {
    if (isError()) {
      throw std::logic_error("Accessing value on failed result");
    }
    return std::get<T>(data_);
  }

  T& value() & {
    if (isError()) {
      throw std::logic_error("Accessing value on failed result");
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::logic_error("Accessing value on failed result");
    }
    return std::move(std::get<T>(data_));
  }

  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

 private:
  std::variant<T, E> data_;
};

/**
 * @brief Helper function to throw appropriate OS exception based on errno
 */
inline void throwOsError(const std::string& operation, int error_code = errno) {
  std::string error_msg = std::strerror(error_code);

  switch (error_code) {
    case EACCES:
    case EPERM:
      throw PermissionError(operation + ": " + error_msg);
    case ENOMEM:
      throw MemoryError(operation + ": " + error_msg);
    case EMFILE:
    case ENFILE:
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
      throw ResourceExhaustedError(operation + ": " + error_msg);
    case EIO:
    case ENOENT:
    case EISDIR:
    case ENOTDIR:
      throw IoError(operation + ": " + error_msg);
    default:
      throw SystemCallError(operation + ": " + error_msg);
  }
}

}  // namespace tessera
