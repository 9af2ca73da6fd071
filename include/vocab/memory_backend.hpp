#pragma once

#include "progress_store.hpp"
#include "settings_provider.hpp"
#include "word_catalog.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace vocab {

class MemoryWordCatalog : public WordCatalog {
public:
  void add_language(const std::string& language_id);
  // Adds the language when missing. Duplicate ids or word numbers throw
  // std::invalid_argument.
  void add_word(const Word& word);

  std::vector<Word> words_from(const std::string& language_id, int start_number,
                               std::size_t limit) const override;
  std::optional<Word> find(const std::string& word_id) const override;
  std::size_t count(const std::string& language_id) const override;
  bool has_language(const std::string& language_id) const override;

private:
  const std::map<int, Word>& language_words(const std::string& language_id) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::map<int, Word>> languages_;
  std::unordered_map<std::string, std::pair<std::string, int>> word_index_;
};

class MemoryProgressStore : public ProgressStore {
public:
  std::optional<ProgressRecord> get(const std::string& user_id,
                                    const std::string& word_id) const override;
  ProgressRecord upsert(const std::string& user_id, const std::string& word_id,
                        const std::string& language_id, const ProgressPatch& patch,
                        Timestamp now) override;
  std::set<std::string> due_word_ids(const std::string& user_id, const std::string& language_id,
                                     Date as_of) const override;
  std::vector<ProgressRecord> records_for(const std::string& user_id,
                                          const std::string& language_id) const override;

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, ProgressRecord> records_;
};

class MemorySettingsProvider : public SettingsProvider {
public:
  UserLanguageSettings get(const std::string& user_id,
                           const std::string& language_id) const override;

  void put(const UserLanguageSettings& settings);

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, UserLanguageSettings> settings_;
};

} // namespace vocab
