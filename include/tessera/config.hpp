/**
 * @file config.hpp
 * @brief Runtime settings for issuance defaults and logging
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace tessera {

/**
 * @brief Issuance defaults shared by the stateful token store and
 *        credential creation
 */
class AuthConfig {
 private:
  int64_t statefulTokenTtl_;     ///< Default stateful token lifetime, seconds
  size_t credentialSecretBytes_;  ///< Random bytes per credential secret
  std::string logLevel_;          ///< spdlog level name

 public:
  /**
   * @brief Construct with defaults: 7 day TTL, 32 byte secrets, "info"
   */
  AuthConfig();

  /**
   * @brief Set the default stateful token lifetime
   * @param seconds Lifetime in seconds
   * @return Reference to this config for chaining
   */
  AuthConfig& withStatefulTokenTtl(int64_t seconds);

  /**
   * @brief Set the number of random bytes in a generated secret
   * @param bytes Secret length in bytes
   * @return Reference to this config for chaining
   */
  AuthConfig& withCredentialSecretBytes(size_t bytes);

  AuthConfig& withLogLevel(std::string level);

  int64_t statefulTokenTtl() const noexcept { return statefulTokenTtl_; }
  size_t credentialSecretBytes() const noexcept {
    return credentialSecretBytes_;
  }
  const std::string& logLevel() const noexcept { return logLevel_; }

  /**
   * @brief Reject settings that cannot be honoured
   * @throws InvalidArgumentError for a non-positive TTL, a zero or oversize
   *         secret length, or an unknown log level
   */
  void validate() const;

  /**
   * @brief Push logLevel into the shared logger
   */
  void applyLogging() const;

  nlohmann::json toJson() const;

  /**
   * @brief Read a config object; absent keys keep their defaults
   * @throws InvalidJsonError if a key has the wrong type
   * @throws InvalidArgumentError if the result fails validate()
   */
  static AuthConfig fromJson(const nlohmann::json& j);

  /**
   * @brief Parse a JSON file with fromJson
   * @throws IoError if the file cannot be read
   * @throws InvalidJsonError if it is not valid JSON
   */
  static AuthConfig loadFromFile(const std::string& path);
};

}  // namespace tessera
