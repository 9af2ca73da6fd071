#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vocab {

using Timestamp = std::chrono::system_clock::time_point;

// Calendar day in UTC, stored as days since 1970-01-01.
struct Date {
  std::int64_t days = 0;

  static Date from_ymd(int year, unsigned month, unsigned day);
  static Date of(Timestamp ts);
  // Accepts "YYYY-MM-DD"; anything after the day (a time part) is ignored.
  static Date parse(const std::string& iso);

  std::string to_string() const;

  Date operator+(int offset) const { return Date{days + offset}; }
  Date operator-(int offset) const { return Date{days - offset}; }
};

inline bool operator==(Date a, Date b) { return a.days == b.days; }
inline bool operator!=(Date a, Date b) { return a.days != b.days; }
inline bool operator<(Date a, Date b) { return a.days < b.days; }
inline bool operator<=(Date a, Date b) { return a.days <= b.days; }
inline bool operator>(Date a, Date b) { return a.days > b.days; }
inline bool operator>=(Date a, Date b) { return a.days >= b.days; }

std::int64_t to_unix_seconds(Timestamp ts);
Timestamp from_unix_seconds(std::int64_t seconds);
Timestamp start_of(Date date);

class Clock {
public:
  virtual ~Clock() = default;

  virtual Timestamp now() const = 0;

  Date today() const { return Date::of(now()); }
};

class SystemClock : public Clock {
public:
  Timestamp now() const override { return std::chrono::system_clock::now(); }
};

// Manually driven clock for tests and replay tooling.
class FixedClock : public Clock {
public:
  explicit FixedClock(Timestamp start) : now_(start) {}
  explicit FixedClock(Date day) : now_(start_of(day) + std::chrono::hours(9)) {}

  Timestamp now() const override { return now_; }

  void set(Timestamp ts) { now_ = ts; }
  void advance_days(int days) { now_ += std::chrono::hours(24 * days); }

private:
  Timestamp now_;
};

} // namespace vocab
