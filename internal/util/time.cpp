#include "time.hpp"

#include <cstdio>
#include <stdexcept>

namespace rfshared::util {

namespace {

using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

// Proleptic Gregorian calendar conversions (days since 1970-01-01).
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void CivilFromDays(int64_t z, int64_t* y, unsigned* m, unsigned* d) {
  z += 719468;
  const int64_t  era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp  = (5 * doy + 2) / 153;
  *d                 = doy - (153 * mp + 2) / 5 + 1;
  *m                 = mp < 10 ? mp + 3 : mp - 9;
  *y                 = static_cast<int64_t>(yoe) + era * 400 + (*m <= 2);
}

bool IsLeap(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && IsLeap(y) ? 29 : kDays[m - 1];
}

class Cursor {
 public:
  explicit Cursor(std::string_view text) : text_(text) {
  }

  bool Done() const {
    return pos_ >= text_.size();
  }

  char Peek() const {
    return Done() ? '\0' : text_[pos_];
  }

  bool Consume(char c) {
    if (Peek() != c) return false;
    ++pos_;
    return true;
  }

  void Expect(char c) {
    if (!Consume(c)) Fail(std::string("expected '") + c + "'");
  }

  unsigned Digits(size_t count) {
    unsigned value = 0;
    for (size_t i = 0; i < count; ++i) {
      const char c = Peek();
      if (c < '0' || c > '9') Fail("expected digit");
      value = value * 10 + static_cast<unsigned>(c - '0');
      ++pos_;
    }
    return value;
  }

  [[noreturn]] void Fail(const std::string& why) const {
    throw std::invalid_argument("invalid ISO-8601 timestamp '" + std::string(text_) + "': " + why);
  }

 private:
  std::string_view text_;
  size_t           pos_ = 0;
};

} // namespace

TimePoint Now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

Timestamp NowUtc() {
  return Timestamp{Now(), std::chrono::minutes{0}};
}

Timestamp FromCivil(int year, unsigned month, unsigned day, unsigned hour, unsigned minute, unsigned second, uint32_t micros,
                    std::chrono::minutes utc_offset) {
  const auto local = TimePoint{} + Days(DaysFromCivil(year, month, day)) + std::chrono::hours(hour) + std::chrono::minutes(minute) +
                     std::chrono::seconds(second) + std::chrono::microseconds(micros);
  return Timestamp{local - utc_offset, utc_offset};
}

std::string FormatIso8601(const Timestamp& ts) {
  const auto local = ts.instant.time_since_epoch() + ts.utc_offset;

  auto days = std::chrono::floor<Days>(local);
  auto rest = local - days;

  int64_t  year  = 0;
  unsigned month = 0;
  unsigned day   = 0;
  CivilFromDays(days.count(), &year, &month, &day);

  const auto hour   = std::chrono::duration_cast<std::chrono::hours>(rest);
  rest             -= hour;
  const auto minute = std::chrono::duration_cast<std::chrono::minutes>(rest);
  rest             -= minute;
  const auto second = std::chrono::duration_cast<std::chrono::seconds>(rest);
  rest             -= second;
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(rest);

  const auto offset_minutes = ts.utc_offset.count();
  const char sign           = offset_minutes < 0 ? '-' : '+';
  const auto abs_offset     = offset_minutes < 0 ? -offset_minutes : offset_minutes;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02lld.%06lld%c%02lld:%02lld", static_cast<long long>(year), month, day,
                static_cast<int>(hour.count()), static_cast<int>(minute.count()), static_cast<long long>(second.count()),
                static_cast<long long>(micros.count()), sign, static_cast<long long>(abs_offset / 60), static_cast<long long>(abs_offset % 60));
  return buf;
}

Timestamp ParseIso8601(std::string_view text) {
  Cursor cur(text);

  const auto year = static_cast<int>(cur.Digits(4));
  cur.Expect('-');
  const auto month = cur.Digits(2);
  cur.Expect('-');
  const auto day = cur.Digits(2);

  if (month < 1 || month > 12) cur.Fail("month out of range");
  if (day < 1 || day > DaysInMonth(year, month)) cur.Fail("day out of range");

  if (!cur.Consume('T') && !cur.Consume(' ')) cur.Fail("expected 'T' between date and time");

  const auto hour = cur.Digits(2);
  cur.Expect(':');
  const auto minute = cur.Digits(2);
  unsigned   second = 0;
  uint32_t   micros = 0;

  if (cur.Consume(':')) {
    second = cur.Digits(2);
    if (cur.Consume('.') || cur.Consume(',')) {
      size_t digits = 0;
      while (cur.Peek() >= '0' && cur.Peek() <= '9') {
        const auto d = cur.Digits(1);
        if (digits < 6) micros = micros * 10 + d;
        ++digits;
      }
      if (digits == 0) cur.Fail("empty fraction");
      for (size_t i = digits; i < 6; ++i) micros *= 10;
    }
  }

  if (hour > 23 || minute > 59 || second > 59) cur.Fail("time out of range");

  std::chrono::minutes offset{0};
  if (cur.Consume('Z') || cur.Consume('z')) {
    offset = std::chrono::minutes{0};
  } else if (cur.Peek() == '+' || cur.Peek() == '-') {
    const bool negative = cur.Peek() == '-';
    cur.Consume(cur.Peek());
    const auto oh = cur.Digits(2);
    unsigned   om = 0;
    if (cur.Consume(':')) {
      om = cur.Digits(2);
    } else if (!cur.Done()) {
      om = cur.Digits(2);
    }
    if (oh > 23 || om > 59) cur.Fail("offset out of range");
    offset = std::chrono::minutes{static_cast<int>(oh * 60 + om)};
    if (negative) offset = -offset;
  } else {
    cur.Fail("missing UTC offset");
  }

  if (!cur.Done()) cur.Fail("trailing characters");

  return FromCivil(year, month, day, hour, minute, second, micros, offset);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace rfshared::util
