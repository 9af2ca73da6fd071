#pragma once

#include "config.hpp"
#include "date.hpp"
#include "progress_store.hpp"
#include "session_state.hpp"
#include "settings_provider.hpp"
#include "types.hpp"
#include "word_catalog.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vocab {

// What the bot renders for the current word.
struct StudyCard {
  std::string session_id;
  Word word;
  std::optional<ProgressRecord> progress;
  SessionPhase phase = SessionPhase::Studying;
  bool word_shown = false;
  std::vector<HintType> used_hints;
  std::vector<HintType> available_hints;
  std::optional<HintType> hint_target;
  bool show_debug = false;
};

struct SessionCompleted {
  std::string session_id;
  std::string user_id;
  std::string language_id;
  int words_answered = 0;
  int words_known = 0;
  int answers_with_hints = 0;
};

class SessionEngine {
public:
  virtual ~SessionEngine() = default;

  // Replaces any session the user already has.
  virtual std::string begin_session(const std::string& user_id,
                                    const std::string& language_id) = 0;

  using Current = std::variant<StudyCard, SessionCompleted>;

  virtual Current current_word(const std::string& session_id) = 0;

  virtual Current reveal(const std::string& session_id) = 0;

  virtual Current record_answer(const std::string& session_id, int score) = 0;

  virtual Current record_hint_use(const std::string& session_id, HintType type) = 0;

  virtual Current begin_hint(const std::string& session_id, HintType type) = 0;

  virtual Current submit_hint(const std::string& session_id, const std::string& text) = 0;

  virtual Current cancel_hint(const std::string& session_id) = 0;

  virtual Current toggle_skip(const std::string& session_id) = 0;

  virtual SessionCompleted end_session(const std::string& session_id) = 0;

  virtual std::optional<std::string> session_for_user(const std::string& user_id) const = 0;

  virtual ProgressSummary progress_summary(const std::string& user_id,
                                           const std::string& language_id) const = 0;

  virtual nlohmann::json debug_state(const std::string& session_id) = 0;
};

struct EngineDeps {
  const WordCatalog& catalog;
  ProgressStore& progress;
  const SettingsProvider& settings;
  SessionStateStore& sessions;
  const Clock& clock;
};

// The engine keeps references to every dependency; they must outlive it.
std::unique_ptr<SessionEngine> make_engine(EngineDeps deps, EngineConfig config = {});

} // namespace vocab
