#pragma once

#include "review_scheduler.hpp"
#include "vocab/progress_store.hpp"

#include <string>

namespace vocab::scheduling {

// Applies one recall judgment to the progress store as a single upsert.
// Store errors propagate unchanged; nothing is retried.
class ScoreUpdater {
public:
  explicit ScoreUpdater(ProgressStore& store, int max_interval_days = kDefaultMaxIntervalDays);

  ProgressRecord apply(const std::string& user_id, const Word& word, int score, bool hint_used,
                       Timestamp now);

  int max_interval_days() const noexcept { return max_interval_days_; }

private:
  ProgressStore& store_;
  int max_interval_days_;
};

} // namespace vocab::scheduling
