#include "vocab/progress_store.hpp"

namespace vocab {

std::unordered_map<std::string, ProgressRecord> ProgressStore::get_many(
    const std::string& user_id, const std::vector<std::string>& word_ids) const {
  std::unordered_map<std::string, ProgressRecord> found;
  for (const auto& word_id : word_ids) {
    if (auto record = get(user_id, word_id)) {
      found.emplace(word_id, std::move(*record));
    }
  }
  return found;
}

ProgressRecord make_default_record(const std::string& user_id, const std::string& word_id,
                                   const std::string& language_id, Timestamp now) {
  ProgressRecord record;
  record.user_id = user_id;
  record.word_id = word_id;
  record.language_id = language_id;
  record.score = 0;
  record.is_skipped = false;
  record.check_interval = 0;
  record.next_check_date = std::nullopt;
  record.created_at = now;
  record.updated_at = now;
  return record;
}

void apply_patch(ProgressRecord& record, const ProgressPatch& patch, Timestamp now) {
  if (patch.score) {
    record.score = *patch.score;
  }
  if (patch.is_skipped) {
    record.is_skipped = *patch.is_skipped;
  }
  if (patch.check_interval) {
    record.check_interval = *patch.check_interval;
  }
  if (patch.next_check_date) {
    record.next_check_date = patch.next_check_date;
  }
  for (const auto& [type, text] : patch.hints) {
    if (text.empty()) {
      record.hint(type).reset();
    } else {
      record.hint(type) = text;
    }
  }
  record.updated_at = now;
}

} // namespace vocab
