#pragma once

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vocab {

// Read-only access to the words of each language, ordered by word_number.
// Every method naming an unknown language throws NotFound.
class WordCatalog {
public:
  virtual ~WordCatalog() = default;

  // One page of words with word_number >= start_number, ascending.
  virtual std::vector<Word> words_from(const std::string& language_id, int start_number,
                                       std::size_t limit) const = 0;

  virtual std::optional<Word> find(const std::string& word_id) const = 0;

  virtual std::size_t count(const std::string& language_id) const = 0;

  virtual bool has_language(const std::string& language_id) const = 0;
};

// Lazy walk over a language starting at a word number, fetching pages on demand.
class WordSequence {
public:
  WordSequence(const WordCatalog& catalog, std::string language_id, int start_number,
               std::size_t page_size);

  std::optional<Word> next();

  // Remaining words of the buffered page, or the next page when it is used up.
  // Empty once the catalog is exhausted.
  std::vector<Word> next_page();

  void restart();
  void resume_after(int word_number);

  int start_number() const { return start_number_; }

private:
  bool fill();

  const WordCatalog& catalog_;
  std::string language_id_;
  int start_number_;
  std::size_t page_size_;
  int next_number_;
  std::vector<Word> page_;
  std::size_t index_ = 0;
  bool exhausted_ = false;
};

} // namespace vocab
