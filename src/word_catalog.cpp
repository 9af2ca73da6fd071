#include "vocab/word_catalog.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vocab {

WordSequence::WordSequence(const WordCatalog& catalog, std::string language_id, int start_number,
                           std::size_t page_size)
    : catalog_(catalog),
      language_id_(std::move(language_id)),
      start_number_(start_number),
      page_size_(page_size),
      next_number_(start_number) {
  if (page_size_ == 0) {
    throw std::invalid_argument("WordSequence: page size must be positive");
  }
}

bool WordSequence::fill() {
  if (index_ < page_.size()) {
    return true;
  }
  if (exhausted_) {
    return false;
  }
  page_ = catalog_.words_from(language_id_, next_number_, page_size_);
  index_ = 0;
  if (page_.size() < page_size_) {
    exhausted_ = true;
  }
  return !page_.empty();
}

std::optional<Word> WordSequence::next() {
  if (!fill()) {
    return std::nullopt;
  }
  Word word = page_[index_++];
  next_number_ = word.word_number + 1;
  return word;
}

std::vector<Word> WordSequence::next_page() {
  if (!fill()) {
    return {};
  }
  std::vector<Word> rest(page_.begin() + static_cast<std::ptrdiff_t>(index_), page_.end());
  index_ = page_.size();
  next_number_ = rest.back().word_number + 1;
  return rest;
}

void WordSequence::restart() {
  resume_after(start_number_ - 1);
}

void WordSequence::resume_after(int word_number) {
  next_number_ = std::max(start_number_, word_number + 1);
  page_.clear();
  index_ = 0;
  exhausted_ = false;
}

} // namespace vocab
