#pragma once

#include "vocab/types.hpp"

#include <optional>

namespace vocab::scheduling {

constexpr int kDefaultMaxIntervalDays = 32;

struct ReviewOutcome {
  int score = 0;
  int check_interval = 0;
  Date next_check_date;
};

// Interval after one judgment. Any hint use counts as a miss: score 0 and
// one day, whatever was submitted. A known word doubles its interval
// (1 on first success) up to max_interval_days.
int next_interval(int previous_interval, int score, bool hint_used,
                  int max_interval_days = kDefaultMaxIntervalDays);

// A word already known and not yet due keeps its interval and check date
// when it is known again, so early reviews cannot inflate the interval.
ReviewOutcome advance(const std::optional<ProgressRecord>& previous, int score, bool hint_used,
                      Date today, int max_interval_days = kDefaultMaxIntervalDays);

ProgressPatch to_patch(const ReviewOutcome& outcome);

} // namespace vocab::scheduling
