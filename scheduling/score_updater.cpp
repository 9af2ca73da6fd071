#include "score_updater.hpp"

#include "../src/log.hpp"

#include <stdexcept>

namespace vocab::scheduling {

ScoreUpdater::ScoreUpdater(ProgressStore& store, int max_interval_days)
    : store_(store), max_interval_days_(max_interval_days) {
  if (max_interval_days_ < 1) {
    throw std::invalid_argument("max_interval_days must be at least 1");
  }
}

ProgressRecord ScoreUpdater::apply(const std::string& user_id, const Word& word, int score,
                                   bool hint_used, Timestamp now) {
  const auto previous = store_.get(user_id, word.id);
  const auto outcome = advance(previous, score, hint_used, Date::of(now), max_interval_days_);

  logging::logger()->debug(
      "score user={} word={} (#{}) submitted={} hint_used={} -> score={} interval={}d next={}",
      user_id, word.id, word.word_number, score, hint_used, outcome.score,
      outcome.check_interval, outcome.next_check_date.to_string());

  return store_.upsert(user_id, word.id, word.language_id, to_patch(outcome), now);
}

} // namespace vocab::scheduling
