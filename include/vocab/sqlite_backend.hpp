#pragma once

#include "progress_store.hpp"
#include "settings_provider.hpp"
#include "word_catalog.hpp"

#include <mutex>
#include <string>

struct sqlite3;

namespace vocab {

// One SQLite connection shared by the catalog, progress and settings
// adapters. Every statement runs under the connection mutex. Open, prepare
// and step failures raise StoreUnavailable.
class SqliteDatabase {
public:
  // ":memory:" opens a private in-memory database.
  explicit SqliteDatabase(const std::string& path);
  ~SqliteDatabase();

  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  sqlite3* handle() const { return db_; }
  std::mutex& mutex() const { return mutex_; }
  const std::string& path() const { return path_; }

  // Runs one or more statements without results.
  void execute(const std::string& sql);

private:
  void create_schema();

  std::string path_;
  sqlite3* db_ = nullptr;
  mutable std::mutex mutex_;
};

class SqliteWordCatalog : public WordCatalog {
public:
  explicit SqliteWordCatalog(SqliteDatabase& db) : db_(db) {}

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
  void require_language(const std::string& language_id) const;

  SqliteDatabase& db_;
};

class SqliteProgressStore : public ProgressStore {
public:
  explicit SqliteProgressStore(SqliteDatabase& db) : db_(db) {}

  std::optional<ProgressRecord> get(const std::string& user_id,
                                    const std::string& word_id) const override;
  std::unordered_map<std::string, ProgressRecord> get_many(
      const std::string& user_id, const std::vector<std::string>& word_ids) const override;
  // Single INSERT ... ON CONFLICT DO UPDATE; last write wins.
  ProgressRecord upsert(const std::string& user_id, const std::string& word_id,
                        const std::string& language_id, const ProgressPatch& patch,
                        Timestamp now) override;
  std::set<std::string> due_word_ids(const std::string& user_id, const std::string& language_id,
                                     Date as_of) const override;
  std::vector<ProgressRecord> records_for(const std::string& user_id,
                                          const std::string& language_id) const override;

private:
  SqliteDatabase& db_;
};

class SqliteSettingsProvider : public SettingsProvider {
public:
  explicit SqliteSettingsProvider(SqliteDatabase& db) : db_(db) {}

  UserLanguageSettings get(const std::string& user_id,
                           const std::string& language_id) const override;

  void put(const UserLanguageSettings& settings);

private:
  SqliteDatabase& db_;
};

} // namespace vocab
