#include "word_selector.hpp"

#include "../src/log.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace vocab::selection {

bool is_eligible(const std::optional<ProgressRecord>& record,
                 const UserLanguageSettings& settings, Date today) {
  if (!record.has_value()) {
    return true;
  }
  if (settings.skip_marked && record->is_skipped) {
    return false;
  }
  if (!settings.use_check_date) {
    return true;
  }
  // A record that was never scored has no date yet and stays due.
  if (!record->next_check_date.has_value()) {
    return true;
  }
  return *record->next_check_date <= today;
}

CandidateStream::CandidateStream(const WordCatalog& catalog, const ProgressStore& progress,
                                 std::string user_id, UserLanguageSettings settings, Date today,
                                 std::size_t page_size)
    : progress_(progress),
      user_id_(std::move(user_id)),
      settings_(std::move(settings)),
      today_(today),
      words_(catalog, settings_.language_id, settings_.start_word, page_size) {}

bool CandidateStream::fill() {
  while (buffer_.empty()) {
    auto page = words_.next_page();
    if (page.empty()) {
      return false;
    }
    std::vector<std::string> ids;
    ids.reserve(page.size());
    for (const auto& word : page) {
      ids.push_back(word.id);
    }
    auto records = progress_.get_many(user_id_, ids);
    for (auto& word : page) {
      ++examined_;
      std::optional<ProgressRecord> record;
      auto it = records.find(word.id);
      if (it != records.end()) {
        record = std::move(it->second);
      }
      if (!is_eligible(record, settings_, today_)) {
        logging::logger()->trace("skip word #{} ({}) for user {}", word.word_number, word.id,
                                 user_id_);
        continue;
      }
      buffer_.push_back(Candidate{std::move(word), std::move(record)});
    }
  }
  return true;
}

std::optional<Candidate> CandidateStream::next() {
  if (!fill()) {
    return std::nullopt;
  }
  Candidate candidate = std::move(buffer_.front());
  buffer_.pop_front();
  return candidate;
}

void CandidateStream::resume_after(int word_number) {
  buffer_.clear();
  words_.resume_after(word_number);
}

void CandidateStream::restart() {
  buffer_.clear();
  examined_ = 0;
  words_.restart();
}

WordSelector::WordSelector(const WordCatalog& catalog, const ProgressStore& progress,
                           std::size_t page_size)
    : catalog_(catalog), progress_(progress), page_size_(page_size) {
  if (page_size_ == 0) {
    throw std::invalid_argument("WordSelector: page size must be positive");
  }
}

CandidateStream WordSelector::next_candidates(const std::string& user_id,
                                              const std::string& language_id,
                                              const UserLanguageSettings& settings,
                                              Date today) const {
  settings.validate();
  if (!catalog_.has_language(language_id)) {
    throw NotFound("Unknown language id: " + language_id);
  }
  UserLanguageSettings scoped = settings;
  scoped.user_id = user_id;
  scoped.language_id = language_id;
  return CandidateStream(catalog_, progress_, user_id, std::move(scoped), today, page_size_);
}

} // namespace vocab::selection
