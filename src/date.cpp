#include "vocab/date.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace vocab {
namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

Civil civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return Civil{y + (m <= 2 ? 1 : 0), m, d};
}

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
  std::int64_t q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

int parse_digits(const std::string& text, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("Invalid date: " + text);
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

} // namespace

Date Date::from_ymd(int year, unsigned month, unsigned day) {
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    throw std::invalid_argument("Invalid calendar date");
  }
  return Date{days_from_civil(year, month, day)};
}

Date Date::of(Timestamp ts) {
  return Date{floor_div(to_unix_seconds(ts), kSecondsPerDay)};
}

Date Date::parse(const std::string& iso) {
  if (iso.size() < 10 || iso[4] != '-' || iso[7] != '-') {
    throw std::invalid_argument("Invalid date: " + iso);
  }
  const int year = parse_digits(iso, 0, 4);
  const int month = parse_digits(iso, 5, 2);
  const int day = parse_digits(iso, 8, 2);
  return from_ymd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string Date::to_string() const {
  const Civil civil = civil_from_days(days);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(civil.year),
                civil.month, civil.day);
  return buffer;
}

std::int64_t to_unix_seconds(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_unix_seconds(std::int64_t seconds) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds)));
}

Timestamp start_of(Date date) {
  return from_unix_seconds(date.days * kSecondsPerDay);
}

} // namespace vocab
