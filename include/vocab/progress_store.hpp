#pragma once

#include "types.hpp"

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace vocab {

// Per (user, word) learning progress. Exactly one record per key; records
// are created lazily by upsert.
class ProgressStore {
public:
  virtual ~ProgressStore() = default;

  virtual std::optional<ProgressRecord> get(const std::string& user_id,
                                            const std::string& word_id) const = 0;

  // Records present for the given words, keyed by word id.
  virtual std::unordered_map<std::string, ProgressRecord> get_many(
      const std::string& user_id, const std::vector<std::string>& word_ids) const;

  // Creates the record with defaults when absent, merges the patch and
  // stamps updated_at. One atomic write.
  virtual ProgressRecord upsert(const std::string& user_id, const std::string& word_id,
                                const std::string& language_id, const ProgressPatch& patch,
                                Timestamp now) = 0;

  // Words with a record whose next_check_date is on or before as_of.
  virtual std::set<std::string> due_word_ids(const std::string& user_id,
                                             const std::string& language_id,
                                             Date as_of) const = 0;

  virtual std::vector<ProgressRecord> records_for(const std::string& user_id,
                                                  const std::string& language_id) const = 0;
};

ProgressRecord make_default_record(const std::string& user_id, const std::string& word_id,
                                   const std::string& language_id, Timestamp now);

void apply_patch(ProgressRecord& record, const ProgressPatch& patch, Timestamp now);

} // namespace vocab
