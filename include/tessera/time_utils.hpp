/**
 * @file time_utils.hpp
 * @brief Wall-clock helpers shared by records and token codecs
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tessera {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// 2024-01-01T00:00:00Z, origin of the compact and unified token time fields
constexpr int64_t TOKEN_EPOCH_SECONDS = 1704067200;

inline int64_t toUnixSeconds(Timestamp t) noexcept {
  return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch())
      .count();
}

inline Timestamp fromUnixSeconds(int64_t seconds) noexcept {
  return Timestamp(std::chrono::seconds(seconds));
}

inline int64_t unixNow() noexcept { return toUnixSeconds(Clock::now()); }

/**
 * @brief now + expiresInSeconds in unix seconds
 * @throws ExpiryOutOfRangeError if the sum does not fit in int64_t
 */
int64_t addExpirySeconds(int64_t now, int64_t expiresInSeconds);

/**
 * @brief from + expiresInSeconds as a Timestamp
 * @throws ExpiryOutOfRangeError if the result is not representable by Clock
 */
Timestamp addExpiry(Timestamp from, int64_t expiresInSeconds);

/**
 * @brief Format as ISO-8601 UTC with milliseconds, e.g. 2024-01-01T00:00:00.000Z
 */
std::string toIsoString(Timestamp t);

/**
 * @brief Parse ISO-8601 UTC timestamps
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" followed by an optional fraction and a
 * trailing 'Z'. Returns nullopt on anything else.
 */
std::optional<Timestamp> parseIsoString(std::string_view text);

}  // namespace tessera
