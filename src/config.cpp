#include "tessera/config.hpp"

#include <algorithm>
#include <array>
#include <fstream>

#include "tessera/credential.hpp"
#include "tessera/error.hpp"
#include "tessera/logging.hpp"
#include "tessera/stateful_token.hpp"

namespace tessera {

namespace {

constexpr size_t MAX_SECRET_BYTES = 1024;

constexpr std::array<std::string_view, 7> log_levels{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

template <typename T>
T readField(const nlohmann::json& j, const char* key, T fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  try {
    return j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw InvalidJsonError(std::string("field '") + key + "': " + e.what());
  }
}

}  // namespace

AuthConfig::AuthConfig()
    : statefulTokenTtl_(DEFAULT_STATEFUL_TOKEN_TTL_SECONDS),
      credentialSecretBytes_(DEFAULT_SECRET_BYTES),
      logLevel_("info") {}

AuthConfig& AuthConfig::withStatefulTokenTtl(int64_t seconds) {
  statefulTokenTtl_ = seconds;
  return *this;
}

AuthConfig& AuthConfig::withCredentialSecretBytes(size_t bytes) {
  credentialSecretBytes_ = bytes;
  return *this;
}

AuthConfig& AuthConfig::withLogLevel(std::string level) {
  logLevel_ = std::move(level);
  return *this;
}

void AuthConfig::validate() const {
  if (statefulTokenTtl_ <= 0) {
    throw InvalidArgumentError("statefulTokenTtl must be positive");
  }
  if (credentialSecretBytes_ == 0 || credentialSecretBytes_ > MAX_SECRET_BYTES) {
    throw InvalidArgumentError("credentialSecretBytes must be between 1 and " +
                               std::to_string(MAX_SECRET_BYTES));
  }
  if (std::find(log_levels.begin(), log_levels.end(), logLevel_) ==
      log_levels.end()) {
    throw InvalidArgumentError("Unknown log level: " + logLevel_);
  }
}

void AuthConfig::applyLogging() const {
  logging::Logger::getInstance().setLogLevel(logLevel_);
}

nlohmann::json AuthConfig::toJson() const {
  return nlohmann::json{{"statefulTokenTtl", statefulTokenTtl_},
                        {"credentialSecretBytes", credentialSecretBytes_},
                        {"logLevel", logLevel_}};
}

AuthConfig AuthConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw InvalidJsonError("configuration must be a JSON object");
  }
  AuthConfig config;
  config.statefulTokenTtl_ =
      readField<int64_t>(j, "statefulTokenTtl", config.statefulTokenTtl_);
  config.credentialSecretBytes_ = readField<size_t>(
      j, "credentialSecretBytes", config.credentialSecretBytes_);
  config.logLevel_ = readField<std::string>(j, "logLevel", config.logLevel_);
  config.validate();
  return config;
}

AuthConfig AuthConfig::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw IoError("cannot open configuration file " + path);
  }
  auto document = nlohmann::json::parse(in, nullptr, false);
  if (document.is_discarded()) {
    throw InvalidJsonError("configuration file " + path + " is not valid JSON");
  }
  TESSERA_LOG_DEBUG("Loaded configuration from {}", path);
  return fromJson(document);
}

}  // namespace tessera
