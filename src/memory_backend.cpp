#include "vocab/memory_backend.hpp"

#include <stdexcept>

namespace vocab {

void MemoryWordCatalog::add_language(const std::string& language_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  languages_.try_emplace(language_id);
}

void MemoryWordCatalog::add_word(const Word& word) {
  if (word.id.empty()) {
    throw std::invalid_argument("Word id must not be empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (word_index_.count(word.id) != 0) {
    throw std::invalid_argument("Duplicate word id: " + word.id);
  }
  auto& words = languages_[word.language_id];
  if (!words.emplace(word.word_number, word).second) {
    throw std::invalid_argument("Duplicate word number " + std::to_string(word.word_number) +
                                " in language " + word.language_id);
  }
  word_index_.emplace(word.id, std::make_pair(word.language_id, word.word_number));
}

const std::map<int, Word>& MemoryWordCatalog::language_words(
    const std::string& language_id) const {
  auto it = languages_.find(language_id);
  if (it == languages_.end()) {
    throw NotFound("Unknown language id: " + language_id);
  }
  return it->second;
}

std::vector<Word> MemoryWordCatalog::words_from(const std::string& language_id, int start_number,
                                                std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& words = language_words(language_id);
  std::vector<Word> page;
  for (auto it = words.lower_bound(start_number); it != words.end() && page.size() < limit;
       ++it) {
    page.push_back(it->second);
  }
  return page;
}

std::optional<Word> MemoryWordCatalog::find(const std::string& word_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = word_index_.find(word_id);
  if (it == word_index_.end()) {
    return std::nullopt;
  }
  const auto& words = languages_.at(it->second.first);
  return words.at(it->second.second);
}

std::size_t MemoryWordCatalog::count(const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return language_words(language_id).size();
}

bool MemoryWordCatalog::has_language(const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return languages_.count(language_id) != 0;
}

std::optional<ProgressRecord> MemoryProgressStore::get(const std::string& user_id,
                                                       const std::string& word_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find({user_id, word_id});
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ProgressRecord MemoryProgressStore::upsert(const std::string& user_id, const std::string& word_id,
                                           const std::string& language_id,
                                           const ProgressPatch& patch, Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto key = std::make_pair(user_id, word_id);
  auto it = records_.find(key);
  if (it == records_.end()) {
    it = records_.emplace(key, make_default_record(user_id, word_id, language_id, now)).first;
  }
  apply_patch(it->second, patch, now);
  return it->second;
}

std::set<std::string> MemoryProgressStore::due_word_ids(const std::string& user_id,
                                                        const std::string& language_id,
                                                        Date as_of) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> due;
  for (const auto& [key, record] : records_) {
    if (key.first != user_id || record.language_id != language_id) {
      continue;
    }
    if (record.next_check_date.has_value() && *record.next_check_date <= as_of) {
      due.insert(record.word_id);
    }
  }
  return due;
}

std::vector<ProgressRecord> MemoryProgressStore::records_for(const std::string& user_id,
                                                             const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProgressRecord> out;
  for (const auto& [key, record] : records_) {
    if (key.first == user_id && record.language_id == language_id) {
      out.push_back(record);
    }
  }
  return out;
}

std::size_t MemoryProgressStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

UserLanguageSettings MemorySettingsProvider::get(const std::string& user_id,
                                                 const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = settings_.find({user_id, language_id});
  if (it != settings_.end()) {
    return it->second;
  }
  UserLanguageSettings defaults;
  defaults.user_id = user_id;
  defaults.language_id = language_id;
  return defaults;
}

void MemorySettingsProvider::put(const UserLanguageSettings& settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  settings_[{settings.user_id, settings.language_id}] = settings;
}

} // namespace vocab
