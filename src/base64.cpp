#include "tessera/base64.hpp"

#include <array>

namespace tessera {

namespace {

constexpr std::string_view base64_chars_url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr std::string_view base64_chars_std =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

using DecodeTable = std::array<int8_t, 256>;

DecodeTable makeDecodeTable(std::string_view alphabet) {
  DecodeTable table{};
  table.fill(-1);
  for (size_t i = 0; i < alphabet.size(); ++i) {
    table[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

std::string encodeWith(std::span<const uint8_t> data, std::string_view alphabet,
                       bool pad) {
  std::string result;
  result.reserve(((data.size() + 2) / 3) * 4);

  int val = 0, valb = -6;
  for (uint8_t c : data) {
    val = ((val << 8) + c) & 0xFFFF;
    valb += 8;
    while (valb >= 0) {
      result.push_back(alphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  if (pad) {
    while (result.size() % 4 != 0) result.push_back('=');
  }
  return result;
}

std::vector<uint8_t> decodeWith(std::string_view encoded,
                                const DecodeTable& table) {
  // Trailing padding is optional; a lone leftover sextet is never valid
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.remove_suffix(1);
  }
  if (encoded.size() % 4 == 1) {
    throw InvalidBase64Error("Truncated base64 input");
  }

  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);

  int val = 0, valb = -8;
  for (char c : encoded) {
    int8_t decoded = table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      throw InvalidBase64Error("Invalid character in base64 string");
    }

    val = ((val << 6) + decoded) & 0xFFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

}  // namespace

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  return encodeWith(data, base64_chars_url, false);
}

std::string base64EncodeImpl(std::span<const uint8_t> data) {
  return encodeWith(data, base64_chars_std, true);
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  static const DecodeTable decode_table = makeDecodeTable(base64_chars_url);
  return decodeWith(encoded, decode_table);
}

std::vector<uint8_t> base64Decode(std::string_view encoded) {
  static const DecodeTable decode_table = makeDecodeTable(base64_chars_std);
  return decodeWith(encoded, decode_table);
}

}  // namespace tessera
