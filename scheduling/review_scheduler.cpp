#include "review_scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vocab::scheduling {

int next_interval(int previous_interval, int score, bool hint_used, int max_interval_days) {
  if (max_interval_days < 1) {
    throw std::invalid_argument("max_interval_days must be at least 1");
  }
  if (score != 0 && score != 1) {
    throw std::invalid_argument("score must be 0 or 1, got " + std::to_string(score));
  }
  if (hint_used || score == 0) {
    return 1;
  }
  if (previous_interval <= 0) {
    return 1;
  }
  // Clamp before doubling so stale oversized intervals cannot overflow.
  const int base = std::min(previous_interval, max_interval_days);
  return std::min(base * 2, max_interval_days);
}

ReviewOutcome advance(const std::optional<ProgressRecord>& previous, int score, bool hint_used,
                      Date today, int max_interval_days) {
  const int previous_interval = previous.has_value() ? previous->check_interval : 0;
  const int interval = next_interval(previous_interval, score, hint_used, max_interval_days);

  ReviewOutcome outcome;
  outcome.score = hint_used ? 0 : score;
  if (outcome.score == 1 && previous.has_value() && previous->score == 1 &&
      previous->next_check_date.has_value() && *previous->next_check_date > today) {
    // Known again before it is due: the schedule stands.
    outcome.check_interval = std::clamp(previous_interval, 1, max_interval_days);
    outcome.next_check_date = *previous->next_check_date;
    return outcome;
  }
  outcome.check_interval = interval;
  outcome.next_check_date = today + outcome.check_interval;
  return outcome;
}

ProgressPatch to_patch(const ReviewOutcome& outcome) {
  ProgressPatch patch;
  patch.score = outcome.score;
  patch.check_interval = outcome.check_interval;
  patch.next_check_date = outcome.next_check_date;
  return patch;
}

} // namespace vocab::scheduling
