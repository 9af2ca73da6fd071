#pragma once

#include "vocab/progress_store.hpp"
#include "vocab/word_catalog.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace vocab::selection {

struct Candidate {
  Word word;
  std::optional<ProgressRecord> progress;
};

// Filtering rule for one word, given its record (absent means a new word).
bool is_eligible(const std::optional<ProgressRecord>& record,
                 const UserLanguageSettings& settings, Date today);

// Ascending-word_number stream of due words. Pages through the catalog and
// looks progress up per page, so the store is read as the stream advances.
class CandidateStream {
public:
  CandidateStream(const WordCatalog& catalog, const ProgressStore& progress,
                  std::string user_id, UserLanguageSettings settings, Date today,
                  std::size_t page_size);

  std::optional<Candidate> next();

  void resume_after(int word_number);
  void restart();

  std::size_t examined() const noexcept { return examined_; }

private:
  bool fill();

  const ProgressStore& progress_;
  std::string user_id_;
  UserLanguageSettings settings_;
  Date today_;
  WordSequence words_;
  std::deque<Candidate> buffer_;
  std::size_t examined_ = 0;
};

class WordSelector {
public:
  WordSelector(const WordCatalog& catalog, const ProgressStore& progress,
               std::size_t page_size = 100);

  // Settings are validated first; SettingsInvalid is thrown before any
  // store access. Unknown languages raise NotFound.
  CandidateStream next_candidates(const std::string& user_id, const std::string& language_id,
                                  const UserLanguageSettings& settings, Date today) const;

private:
  const WordCatalog& catalog_;
  const ProgressStore& progress_;
  std::size_t page_size_;
};

} // namespace vocab::selection
