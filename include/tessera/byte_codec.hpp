/**
 * @file byte_codec.hpp
 * @brief Big-endian packing, hex normalization and URL component encoding
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace tessera {

/**
 * @brief Append-only big-endian writer for token payloads
 *
 * Every put* checks the value against the field width and throws
 * InvalidArgumentError rather than truncating.
 */
class ByteWriter {
 public:
  ByteWriter() = default;
  explicit ByteWriter(size_t reserve) { buffer_.reserve(reserve); }

  ByteWriter& putU8(uint32_t value);
  ByteWriter& putU16(uint32_t value);
  ByteWriter& putU24(uint32_t value);
  ByteWriter& putU32(uint64_t value);
  ByteWriter& putBytes(std::span<const uint8_t> bytes);

  /**
   * @brief Write a 1-byte length prefix followed by the UTF-8 bytes
   * @throws InvalidArgumentError if the text exceeds 255 bytes
   */
  ByteWriter& putShortString(std::string_view text);

  const std::vector<uint8_t>& bytes() const& noexcept { return buffer_; }
  std::vector<uint8_t> bytes() && noexcept { return std::move(buffer_); }
  size_t size() const noexcept { return buffer_.size(); }

 private:
  std::vector<uint8_t> buffer_;
};

/**
 * @brief Bounds-checked big-endian reader over a borrowed byte span
 *
 * Reads past the end throw DecodeError.
 */
class ByteReader {
 public:
  explicit ByteReader(std::span<const uint8_t> data) noexcept : data_(data) {}

  uint8_t u8();
  uint16_t u16();
  uint32_t u24();
  uint32_t u32();
  std::span<const uint8_t> take(size_t count);
  std::string takeString(size_t count);
  std::string shortString();

  size_t offset() const noexcept { return offset_; }
  size_t remaining() const noexcept { return data_.size() - offset_; }
  bool atEnd() const noexcept { return offset_ == data_.size(); }

 private:
  void require(size_t count) const;

  std::span<const uint8_t> data_;
  size_t offset_ = 0;
};

/**
 * @brief Lowercase hex encoding
 */
std::string hexEncode(std::span<const uint8_t> bytes);

/**
 * @brief Normalize an identifier to exactly @p width bytes
 *
 * Dashes are removed, then the text is cut or right-padded with '0' to
 * 2*width hex digits before decoding.
 * @throws InvalidArgumentError on non-hex characters
 */
std::vector<uint8_t> hexToFixedBytes(std::string_view text, size_t width);

/**
 * @brief Percent-encode a URL component
 *
 * Leaves A-Z a-z 0-9 and - _ . ! ~ * ' ( ) untouched, everything else is
 * encoded byte by byte as %XX.
 */
std::string urlEncodeComponent(std::string_view text);

inline std::span<const uint8_t> asBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}  // namespace tessera
