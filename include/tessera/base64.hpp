/**
 * @file base64.hpp
 * @brief Base64 (URL-safe and standard) encoding and decoding
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace tessera {

/**
 * @brief Implementation for base64url encoding from span
 * @param data Input byte span
 * @return Base64url string without padding
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Implementation for standard base64 encoding from span
 * @param data Input byte span
 * @return Base64 string with '=' padding
 */
std::string base64EncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for data types suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode data as base64url
 * @param data Input bytes
 * @return Base64url string
 */
template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

inline std::string base64UrlEncode(std::string_view text) {
  return base64UrlEncodeImpl(
      {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

/**
 * @brief Decode base64url string
 * @param data Base64url string, padding optional
 * @return Decoded bytes
 * @throws InvalidBase64Error if invalid characters or length found
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

/**
 * @brief Encode data as standard base64 with padding
 */
template <Base64Data T>
std::string base64Encode(const T& data) {
  return base64EncodeImpl({std::data(data), std::size(data)});
}

inline std::string base64Encode(std::string_view text) {
  return base64EncodeImpl(
      {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

/**
 * @brief Decode standard base64
 * @throws InvalidBase64Error if invalid characters or length found
 */
std::vector<uint8_t> base64Decode(std::string_view data);

}  // namespace tessera
