#include "vocab/sqlite_backend.hpp"

#include "log.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace vocab {
namespace sql {

constexpr const char* kCreateSchema = R"(
CREATE TABLE IF NOT EXISTS languages (
    id TEXT PRIMARY KEY
);
CREATE TABLE IF NOT EXISTS words (
    id TEXT PRIMARY KEY,
    language_id TEXT NOT NULL REFERENCES languages(id),
    word_foreign TEXT NOT NULL DEFAULT '',
    translation TEXT NOT NULL DEFAULT '',
    transcription TEXT NOT NULL DEFAULT '',
    word_number INTEGER NOT NULL,
    sound_file_path TEXT,
    UNIQUE(language_id, word_number)
);
CREATE TABLE IF NOT EXISTS user_progress (
    user_id TEXT NOT NULL,
    word_id TEXT NOT NULL,
    language_id TEXT NOT NULL,
    score INTEGER NOT NULL DEFAULT 0,
    is_skipped INTEGER NOT NULL DEFAULT 0,
    check_interval INTEGER NOT NULL DEFAULT 0,
    next_check_date TEXT,
    hint_meaning TEXT,
    hint_phoneticsound TEXT,
    hint_phoneticassociation TEXT,
    hint_writing TEXT,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (user_id, word_id)
);
CREATE INDEX IF NOT EXISTS idx_user_progress_due
ON user_progress(user_id, language_id, next_check_date);
CREATE TABLE IF NOT EXISTS user_language_settings (
    user_id TEXT NOT NULL,
    language_id TEXT NOT NULL,
    start_word INTEGER NOT NULL DEFAULT 1,
    skip_marked INTEGER NOT NULL DEFAULT 0,
    use_check_date INTEGER NOT NULL DEFAULT 1,
    show_hint_meaning INTEGER NOT NULL DEFAULT 1,
    show_hint_phoneticsound INTEGER NOT NULL DEFAULT 1,
    show_hint_phoneticassociation INTEGER NOT NULL DEFAULT 1,
    show_hint_writing INTEGER NOT NULL DEFAULT 1,
    show_debug INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (user_id, language_id)
);
)";

constexpr const char* kWordColumns =
    "id, language_id, word_foreign, translation, transcription, word_number, sound_file_path";

constexpr const char* kProgressColumns =
    "user_id, word_id, language_id, score, is_skipped, check_interval, next_check_date, "
    "hint_meaning, hint_phoneticsound, hint_phoneticassociation, hint_writing, "
    "created_at, updated_at";

// ?4..?7 are NULL when the patch leaves the field alone. Each hint has a
// set flag followed by its text; an empty text stores NULL.
constexpr const char* kUpsertProgress = R"(
INSERT INTO user_progress (
    user_id, word_id, language_id, score, is_skipped, check_interval, next_check_date,
    hint_meaning, hint_phoneticsound, hint_phoneticassociation, hint_writing,
    created_at, updated_at)
VALUES (
    ?1, ?2, ?3, COALESCE(?4, 0), COALESCE(?5, 0), COALESCE(?6, 0), ?7,
    CASE WHEN ?8 THEN NULLIF(?9, '') END,
    CASE WHEN ?10 THEN NULLIF(?11, '') END,
    CASE WHEN ?12 THEN NULLIF(?13, '') END,
    CASE WHEN ?14 THEN NULLIF(?15, '') END,
    ?16, ?16)
ON CONFLICT(user_id, word_id) DO UPDATE SET
    score = COALESCE(?4, score),
    is_skipped = COALESCE(?5, is_skipped),
    check_interval = COALESCE(?6, check_interval),
    next_check_date = COALESCE(?7, next_check_date),
    hint_meaning = CASE WHEN ?8 THEN NULLIF(?9, '') ELSE hint_meaning END,
    hint_phoneticsound = CASE WHEN ?10 THEN NULLIF(?11, '') ELSE hint_phoneticsound END,
    hint_phoneticassociation = CASE WHEN ?12 THEN NULLIF(?13, '') ELSE hint_phoneticassociation END,
    hint_writing = CASE WHEN ?14 THEN NULLIF(?15, '') ELSE hint_writing END,
    updated_at = ?16
)";

constexpr const char* kUpsertSettings = R"(
INSERT INTO user_language_settings (
    user_id, language_id, start_word, skip_marked, use_check_date,
    show_hint_meaning, show_hint_phoneticsound, show_hint_phoneticassociation,
    show_hint_writing, show_debug)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
ON CONFLICT(user_id, language_id) DO UPDATE SET
    start_word = excluded.start_word,
    skip_marked = excluded.skip_marked,
    use_check_date = excluded.use_check_date,
    show_hint_meaning = excluded.show_hint_meaning,
    show_hint_phoneticsound = excluded.show_hint_phoneticsound,
    show_hint_phoneticassociation = excluded.show_hint_phoneticassociation,
    show_hint_writing = excluded.show_hint_writing,
    show_debug = excluded.show_debug
)";

} // namespace sql

namespace {

[[noreturn]] void raise(sqlite3* db, int rc, const std::string& context) {
  std::string message = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    throw std::invalid_argument(message);
  }
  logging::logger()->error("sqlite failure ({}): {}", rc, message);
  throw StoreUnavailable(message);
}

class Statement {
public:
  Statement(sqlite3* db, const std::string& text) : db_(db) {
    const int rc = sqlite3_prepare_v2(db_, text.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
      raise(db_, rc, "prepare");
    }
  }

  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT));
  }

  void bind(int index, std::int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }

  void bind(int index, int value) { check(sqlite3_bind_int(stmt_, index, value)); }

  void bind(int index, bool value) { check(sqlite3_bind_int(stmt_, index, value ? 1 : 0)); }

  void bind_null(int index) { check(sqlite3_bind_null(stmt_, index)); }

  template <typename T>
  void bind(int index, const std::optional<T>& value) {
    if (value.has_value()) {
      bind(index, *value);
    } else {
      bind_null(index);
    }
  }

  // True while rows are produced.
  bool step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    raise(db_, rc, "step");
  }

  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  bool is_null(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

  std::string text(int column) const {
    const auto* raw = sqlite3_column_text(stmt_, column);
    if (!raw) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(raw),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
  }

  std::optional<std::string> optional_text(int column) const {
    if (is_null(column)) {
      return std::nullopt;
    }
    return text(column);
  }

  std::int64_t int64(int column) const { return sqlite3_column_int64(stmt_, column); }

  int integer(int column) const { return sqlite3_column_int(stmt_, column); }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      raise(db_, rc, "bind");
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

Word read_word(const Statement& stmt) {
  Word word;
  word.id = stmt.text(0);
  word.language_id = stmt.text(1);
  word.word_foreign = stmt.text(2);
  word.translation = stmt.text(3);
  word.transcription = stmt.text(4);
  word.word_number = stmt.integer(5);
  word.sound_file_path = stmt.optional_text(6);
  return word;
}

ProgressRecord read_progress(const Statement& stmt) {
  ProgressRecord record;
  record.user_id = stmt.text(0);
  record.word_id = stmt.text(1);
  record.language_id = stmt.text(2);
  record.score = stmt.integer(3);
  record.is_skipped = stmt.integer(4) != 0;
  record.check_interval = stmt.integer(5);
  if (auto date = stmt.optional_text(6)) {
    record.next_check_date = Date::parse(*date);
  }
  record.hint_meaning = stmt.optional_text(7);
  record.hint_phoneticsound = stmt.optional_text(8);
  record.hint_phoneticassociation = stmt.optional_text(9);
  record.hint_writing = stmt.optional_text(10);
  record.created_at = from_unix_seconds(stmt.int64(11));
  record.updated_at = from_unix_seconds(stmt.int64(12));
  return record;
}

std::optional<ProgressRecord> select_progress(sqlite3* db, const std::string& user_id,
                                              const std::string& word_id) {
  Statement stmt(db, std::string("SELECT ") + sql::kProgressColumns +
                         " FROM user_progress WHERE user_id = ?1 AND word_id = ?2");
  stmt.bind(1, user_id);
  stmt.bind(2, word_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_progress(stmt);
}

} // namespace

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = "open " + path_ + ": " +
                          (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreUnavailable(message);
  }
  sqlite3_busy_timeout(db_, 2000);
  try {
    execute("PRAGMA foreign_keys = ON;");
    create_schema();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  logging::logger()->debug("opened sqlite database {}", path_);
}

SqliteDatabase::~SqliteDatabase() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteDatabase::execute(const std::string& sql) {
  char* error = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    std::string message = error ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    logging::logger()->error("sqlite exec failed ({}): {}", rc, message);
    throw StoreUnavailable("exec: " + message);
  }
}

void SqliteDatabase::create_schema() {
  execute(sql::kCreateSchema);
}

void SqliteWordCatalog::add_language(const std::string& language_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(), "INSERT OR IGNORE INTO languages (id) VALUES (?1)");
  stmt.bind(1, language_id);
  stmt.step();
}

void SqliteWordCatalog::add_word(const Word& word) {
  if (word.id.empty()) {
    throw std::invalid_argument("Word id must not be empty");
  }
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement language(db_.handle(), "INSERT OR IGNORE INTO languages (id) VALUES (?1)");
  language.bind(1, word.language_id);
  language.step();

  Statement stmt(db_.handle(), std::string("INSERT INTO words (") + sql::kWordColumns +
                                   ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
  stmt.bind(1, word.id);
  stmt.bind(2, word.language_id);
  stmt.bind(3, word.word_foreign);
  stmt.bind(4, word.translation);
  stmt.bind(5, word.transcription);
  stmt.bind(6, word.word_number);
  stmt.bind(7, word.sound_file_path);
  stmt.step();
}

void SqliteWordCatalog::require_language(const std::string& language_id) const {
  Statement stmt(db_.handle(), "SELECT 1 FROM languages WHERE id = ?1");
  stmt.bind(1, language_id);
  if (!stmt.step()) {
    throw NotFound("Unknown language id: " + language_id);
  }
}

std::vector<Word> SqliteWordCatalog::words_from(const std::string& language_id,
                                                int start_number, std::size_t limit) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  require_language(language_id);
  Statement stmt(db_.handle(), std::string("SELECT ") + sql::kWordColumns +
                                   " FROM words WHERE language_id = ?1 AND word_number >= ?2"
                                   " ORDER BY word_number LIMIT ?3");
  stmt.bind(1, language_id);
  stmt.bind(2, start_number);
  stmt.bind(3, static_cast<std::int64_t>(limit));
  std::vector<Word> page;
  while (stmt.step()) {
    page.push_back(read_word(stmt));
  }
  return page;
}

std::optional<Word> SqliteWordCatalog::find(const std::string& word_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(),
                 std::string("SELECT ") + sql::kWordColumns + " FROM words WHERE id = ?1");
  stmt.bind(1, word_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_word(stmt);
}

std::size_t SqliteWordCatalog::count(const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  require_language(language_id);
  Statement stmt(db_.handle(), "SELECT COUNT(*) FROM words WHERE language_id = ?1");
  stmt.bind(1, language_id);
  stmt.step();
  return static_cast<std::size_t>(stmt.int64(0));
}

bool SqliteWordCatalog::has_language(const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(), "SELECT 1 FROM languages WHERE id = ?1");
  stmt.bind(1, language_id);
  return stmt.step();
}

std::optional<ProgressRecord> SqliteProgressStore::get(const std::string& user_id,
                                                       const std::string& word_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  return select_progress(db_.handle(), user_id, word_id);
}

std::unordered_map<std::string, ProgressRecord> SqliteProgressStore::get_many(
    const std::string& user_id, const std::vector<std::string>& word_ids) const {
  std::unordered_map<std::string, ProgressRecord> found;
  if (word_ids.empty()) {
    return found;
  }
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(), std::string("SELECT ") + sql::kProgressColumns +
                                   " FROM user_progress WHERE user_id = ?1 AND word_id = ?2");
  for (const auto& word_id : word_ids) {
    stmt.reset();
    stmt.bind(1, user_id);
    stmt.bind(2, word_id);
    if (stmt.step()) {
      found.emplace(word_id, read_progress(stmt));
    }
  }
  return found;
}

ProgressRecord SqliteProgressStore::upsert(const std::string& user_id, const std::string& word_id,
                                           const std::string& language_id,
                                           const ProgressPatch& patch, Timestamp now) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(), sql::kUpsertProgress);
  stmt.bind(1, user_id);
  stmt.bind(2, word_id);
  stmt.bind(3, language_id);
  stmt.bind(4, patch.score);
  stmt.bind(5, patch.is_skipped);
  stmt.bind(6, patch.check_interval);
  if (patch.next_check_date.has_value()) {
    stmt.bind(7, patch.next_check_date->to_string());
  } else {
    stmt.bind_null(7);
  }
  const HintType order[] = {HintType::Meaning, HintType::PhoneticSound,
                            HintType::PhoneticAssociation, HintType::Writing};
  int index = 8;
  for (HintType type : order) {
    auto it = patch.hints.find(type);
    const bool set = it != patch.hints.end();
    stmt.bind(index, set);
    stmt.bind(index + 1, set ? it->second : std::string());
    index += 2;
  }
  stmt.bind(16, to_unix_seconds(now));
  stmt.step();

  auto record = select_progress(db_.handle(), user_id, word_id);
  if (!record.has_value()) {
    throw StoreUnavailable("upsert of " + user_id + "/" + word_id + " left no row");
  }
  return std::move(*record);
}

std::set<std::string> SqliteProgressStore::due_word_ids(const std::string& user_id,
                                                        const std::string& language_id,
                                                        Date as_of) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(),
                 "SELECT word_id FROM user_progress WHERE user_id = ?1 AND language_id = ?2"
                 " AND next_check_date IS NOT NULL AND next_check_date <= ?3");
  stmt.bind(1, user_id);
  stmt.bind(2, language_id);
  stmt.bind(3, as_of.to_string());
  std::set<std::string> due;
  while (stmt.step()) {
    due.insert(stmt.text(0));
  }
  return due;
}

std::vector<ProgressRecord> SqliteProgressStore::records_for(const std::string& user_id,
                                                             const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(), std::string("SELECT ") + sql::kProgressColumns +
                                   " FROM user_progress WHERE user_id = ?1 AND language_id = ?2");
  stmt.bind(1, user_id);
  stmt.bind(2, language_id);
  std::vector<ProgressRecord> records;
  while (stmt.step()) {
    records.push_back(read_progress(stmt));
  }
  return records;
}

UserLanguageSettings SqliteSettingsProvider::get(const std::string& user_id,
                                                 const std::string& language_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(),
                 "SELECT start_word, skip_marked, use_check_date, show_hint_meaning,"
                 " show_hint_phoneticsound, show_hint_phoneticassociation, show_hint_writing,"
                 " show_debug FROM user_language_settings WHERE user_id = ?1 AND language_id = ?2");
  stmt.bind(1, user_id);
  stmt.bind(2, language_id);

  UserLanguageSettings settings;
  settings.user_id = user_id;
  settings.language_id = language_id;
  if (stmt.step()) {
    settings.start_word = stmt.integer(0);
    settings.skip_marked = stmt.integer(1) != 0;
    settings.use_check_date = stmt.integer(2) != 0;
    settings.show_hint_meaning = stmt.integer(3) != 0;
    settings.show_hint_phoneticsound = stmt.integer(4) != 0;
    settings.show_hint_phoneticassociation = stmt.integer(5) != 0;
    settings.show_hint_writing = stmt.integer(6) != 0;
    settings.show_debug = stmt.integer(7) != 0;
  }
  return settings;
}

void SqliteSettingsProvider::put(const UserLanguageSettings& settings) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  Statement stmt(db_.handle(), sql::kUpsertSettings);
  stmt.bind(1, settings.user_id);
  stmt.bind(2, settings.language_id);
  stmt.bind(3, settings.start_word);
  stmt.bind(4, settings.skip_marked);
  stmt.bind(5, settings.use_check_date);
  stmt.bind(6, settings.show_hint_meaning);
  stmt.bind(7, settings.show_hint_phoneticsound);
  stmt.bind(8, settings.show_hint_phoneticassociation);
  stmt.bind(9, settings.show_hint_writing);
  stmt.bind(10, settings.show_debug);
  stmt.step();
}

} // namespace vocab
