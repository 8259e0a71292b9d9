#include "tessera/byte_codec.hpp"

#include <string>

namespace tessera {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

int hexValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool isUnreservedUriChar(unsigned char c) noexcept {
  if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '!':
    case '~':
    case '*':
    case '\'':
    case '(':
    case ')':
      return true;
    default:
      return false;
  }
}

}  // namespace

ByteWriter& ByteWriter::putU8(uint32_t value) {
  if (value > 0xFF) {
    throw InvalidArgumentError("Value does not fit in 1 byte");
  }
  buffer_.push_back(static_cast<uint8_t>(value));
  return *this;
}

ByteWriter& ByteWriter::putU16(uint32_t value) {
  if (value > 0xFFFF) {
    throw InvalidArgumentError("Value does not fit in 2 bytes");
  }
  buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
  return *this;
}

ByteWriter& ByteWriter::putU24(uint32_t value) {
  if (value > 0xFFFFFF) {
    throw InvalidArgumentError("Value does not fit in 3 bytes");
  }
  buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
  return *this;
}

ByteWriter& ByteWriter::putU32(uint64_t value) {
  if (value > 0xFFFFFFFFULL) {
    throw InvalidArgumentError("Value does not fit in 4 bytes");
  }
  for (int shift = 24; shift >= 0; shift -= 8) {
    buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
  return *this;
}

ByteWriter& ByteWriter::putBytes(std::span<const uint8_t> bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  return *this;
}

ByteWriter& ByteWriter::putShortString(std::string_view text) {
  if (text.size() > 0xFF) {
    throw InvalidArgumentError("String exceeds 255 bytes");
  }
  putU8(static_cast<uint32_t>(text.size()));
  return putBytes(asBytes(text));
}

void ByteReader::require(size_t count) const {
  if (count > remaining()) {
    throw DecodeError("need " + std::to_string(count) + " bytes at offset " +
                      std::to_string(offset_) + ", " +
                      std::to_string(remaining()) + " left");
  }
}

uint8_t ByteReader::u8() {
  require(1);
  return data_[offset_++];
}

uint16_t ByteReader::u16() {
  require(2);
  uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) |
                                         data_[offset_ + 1]);
  offset_ += 2;
  return value;
}

uint32_t ByteReader::u24() {
  require(3);
  uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 16) |
                   (static_cast<uint32_t>(data_[offset_ + 1]) << 8) |
                   static_cast<uint32_t>(data_[offset_ + 2]);
  offset_ += 3;
  return value;
}

uint32_t ByteReader::u32() {
  require(4);
  uint32_t value = (static_cast<uint32_t>(data_[offset_]) << 24) |
                   (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                   (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                   static_cast<uint32_t>(data_[offset_ + 3]);
  offset_ += 4;
  return value;
}

std::span<const uint8_t> ByteReader::take(size_t count) {
  require(count);
  auto run = data_.subspan(offset_, count);
  offset_ += count;
  return run;
}

std::string ByteReader::takeString(size_t count) {
  auto run = take(count);
  return std::string(run.begin(), run.end());
}

std::string ByteReader::shortString() {
  return takeString(u8());
}

std::string hexEncode(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(hex_digits[b >> 4]);
    out.push_back(hex_digits[b & 0x0F]);
  }
  return out;
}

std::vector<uint8_t> hexToFixedBytes(std::string_view text, size_t width) {
  std::string digits;
  digits.reserve(width * 2);
  for (char c : text) {
    if (c == '-') continue;
    if (digits.size() == width * 2) break;
    digits.push_back(c);
  }
  digits.resize(width * 2, '0');

  std::vector<uint8_t> out(width);
  for (size_t i = 0; i < width; ++i) {
    int hi = hexValue(digits[i * 2]);
    int lo = hexValue(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      throw InvalidArgumentError("Identifier is not hexadecimal: " +
                                 std::string(text));
    }
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

std::string urlEncodeComponent(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    if (isUnreservedUriChar(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back("0123456789ABCDEF"[c >> 4]);
      out.push_back("0123456789ABCDEF"[c & 0x0F]);
    }
  }
  return out;
}

}  // namespace tessera
