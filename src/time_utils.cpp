#include "tessera/time_utils.hpp"

#include <cstdio>
#include <ctime>
#include <limits>

#include "tessera/error.hpp"

namespace tessera {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool checkedAdd(int64_t a, int64_t b, int64_t& out) noexcept {
  if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
      (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
    return false;
  }
  out = a + b;
  return true;
}

bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

bool readNumber(std::string_view text, size_t pos, size_t width, int& out) {
  if (pos + width > text.size()) return false;
  int value = 0;
  for (size_t i = 0; i < width; ++i) {
    char c = text[pos + i];
    if (!isDigit(c)) return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

}  // namespace

int64_t addExpirySeconds(int64_t now, int64_t expiresInSeconds) {
  int64_t expiresAt = 0;
  if (!checkedAdd(now, expiresInSeconds, expiresAt)) {
    throw ExpiryOutOfRangeError("Expiry duration " +
                                std::to_string(expiresInSeconds) +
                                " overflows the time range");
  }
  return expiresAt;
}

Timestamp addExpiry(Timestamp from, int64_t expiresInSeconds) {
  using std::chrono::duration_cast;
  using std::chrono::seconds;

  // Clock::duration counts sub-second ticks, so its range in whole seconds
  // is far smaller than int64_t
  constexpr int64_t max_seconds =
      duration_cast<seconds>(Clock::duration::max()).count();
  constexpr int64_t min_seconds =
      duration_cast<seconds>(Clock::duration::min()).count();

  const auto whole = duration_cast<seconds>(from.time_since_epoch());
  const auto fraction = from.time_since_epoch() - whole;

  int64_t total = 0;
  if (!checkedAdd(whole.count(), expiresInSeconds, total) ||
      total >= max_seconds || total <= min_seconds) {
    throw ExpiryOutOfRangeError("Expiry duration " +
                                std::to_string(expiresInSeconds) +
                                " overflows the clock range");
  }
  return Timestamp(seconds(total)) + fraction;
}

std::string toIsoString(Timestamp t) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                t.time_since_epoch())
                .count();
  int64_t seconds = ms / 1000;
  int64_t millis = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(millis));
  return buffer;
}

std::optional<Timestamp> parseIsoString(std::string_view text) {
  int year, month, day, hour, minute, second;
  if (!readNumber(text, 0, 4, year) || text.size() < 20 || text[4] != '-' ||
      !readNumber(text, 5, 2, month) || text[7] != '-' ||
      !readNumber(text, 8, 2, day) || text[10] != 'T' ||
      !readNumber(text, 11, 2, hour) || text[13] != ':' ||
      !readNumber(text, 14, 2, minute) || text[16] != ':' ||
      !readNumber(text, 17, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return std::nullopt;
  }

  size_t pos = 19;
  int64_t millis = 0;
  if (text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && isDigit(text[pos])) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (int i = digits; i < 3; ++i) millis *= 10;
  }
  if (pos + 1 != text.size() || text[pos] != 'Z') {
    return std::nullopt;
  }

  int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                               static_cast<unsigned>(day));
  int64_t total_ms =
      ((days * 24 + hour) * 60 + minute) * 60 * 1000 + second * 1000 + millis;
  return Timestamp(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(total_ms)));
}

}  // namespace tessera
