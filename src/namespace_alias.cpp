#include "tessera/namespace_alias.hpp"

#include "tessera/base64.hpp"
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include "tessera/logging.hpp"

namespace tessera {

namespace {

constexpr std::string_view ALIAS_KEY_PREFIX = "__NS_ALIAS:";
constexpr std::string_view FULL_KEY_PREFIX = "__NS_FULL:";
constexpr std::string_view FULL_NAMESPACE_PREFIX = "origin_";
constexpr size_t FULL_NAMESPACE_MIN_LENGTH = 41;

constexpr std::string_view base36_digits = "0123456789abcdefghijklmnopqrstuvwxyz";

std::string aliasKey(std::string_view alias) {
  return std::string(ALIAS_KEY_PREFIX) + std::string(alias);
}

std::string fullKey(std::string_view ns) {
  return std::string(FULL_KEY_PREFIX) + std::string(ns);
}

std::string randomBase36(size_t count) {
  std::string out;
  out.reserve(count);
  for (uint8_t byte : randomBytes(count)) {
    out.push_back(base36_digits[byte % base36_digits.size()]);
  }
  return out;
}

}  // namespace

std::string generateAlias(std::string_view ns) {
  std::string encoded = base64UrlEncode(hashSha256(asBytes(ns)));
  return encoded.substr(encoded.size() - NAMESPACE_ALIAS_LENGTH);
}

bool isFullNamespace(std::string_view value) noexcept {
  return value.starts_with(FULL_NAMESPACE_PREFIX) &&
         value.size() >= FULL_NAMESPACE_MIN_LENGTH;
}

std::optional<std::string> resolveNamespace(KeyValueStore& kv,
                                            std::string_view value) {
  if (isFullNamespace(value)) {
    return std::string(value);
  }
  return kv.get(aliasKey(value));
}

std::optional<std::string> getAlias(KeyValueStore& kv, std::string_view ns) {
  return kv.get(fullKey(ns));
}

std::string getOrCreateAlias(KeyValueStore& kv, std::string_view ns) {
  if (auto existing = getAlias(kv, ns)) {
    return *existing;
  }

  std::string alias = generateAlias(ns);
  auto taken = kv.get(aliasKey(alias));
  if (taken && *taken != ns) {
    TESSERA_LOG_WARN("Alias {} already maps to another namespace", alias);
    alias += randomBase36(2);
  }

  kv.put(aliasKey(alias), ns);
  kv.put(fullKey(ns), alias);
  return alias;
}

}  // namespace tessera
