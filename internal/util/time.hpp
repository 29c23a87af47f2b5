#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace rfshared::util {

/*
  Time utilities — single place to control clock source and the ISO-8601
  rendering used by metadata records.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

/*
  Timezone-aware instant.

  `instant` is the UTC point in time; `utc_offset` is the offset the value was
  recorded in. Both take part in equality so a round trip through text keeps
  the original offset.
*/
struct Timestamp {
  TimePoint            instant{};
  std::chrono::minutes utc_offset{0};

  bool operator==(const Timestamp& other) const {
    return instant == other.instant && utc_offset == other.utc_offset;
  }
  bool operator!=(const Timestamp& other) const {
    return !(*this == other);
  }
};

TimePoint Now();

Timestamp NowUtc();

// YYYY-MM-DDTHH:MM:SS.ffffff+HH:MM
std::string FormatIso8601(const Timestamp& ts);

/*
  Parses YYYY-MM-DD[T ]HH:MM[:SS[.f]] followed by Z or +/-HH[:MM].
  Fractions longer than six digits are truncated to microseconds.
  Throws std::invalid_argument on anything else, including a missing offset.
*/
Timestamp ParseIso8601(std::string_view text);

Timestamp FromCivil(int year, unsigned month, unsigned day, unsigned hour, unsigned minute, unsigned second, uint32_t micros,
                    std::chrono::minutes utc_offset = std::chrono::minutes{0});

uint64_t ToUnixMillis(TimePoint tp);

} // namespace rfshared::util
