#pragma once

#include "types.hpp"

#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace vocab {

enum class SessionPhase {
  Studying,
  ViewingWordDetails,
  CreatingHint,
  EditingHint,
  Completed
};

inline std::string to_string(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::Studying: return "studying";
    case SessionPhase::ViewingWordDetails: return "viewing_word_details";
    case SessionPhase::CreatingHint: return "creating_hint";
    case SessionPhase::EditingHint: return "editing_hint";
    case SessionPhase::Completed: return "completed";
  }
  return "studying";
}

inline SessionPhase session_phase_from_string(const std::string& value) {
  if (value == "studying") {
    return SessionPhase::Studying;
  }
  if (value == "viewing_word_details") {
    return SessionPhase::ViewingWordDetails;
  }
  if (value == "creating_hint") {
    return SessionPhase::CreatingHint;
  }
  if (value == "editing_hint") {
    return SessionPhase::EditingHint;
  }
  if (value == "completed") {
    return SessionPhase::Completed;
  }
  throw std::invalid_argument("Unknown session phase: " + value);
}

// Everything one conversation needs to resume its study session. Plain value;
// serialized through the JSON bridge when kept outside the process.
struct SessionState {
  std::string session_id;
  std::string user_id;
  std::string language_id;
  UserLanguageSettings settings;
  SessionPhase phase = SessionPhase::Studying;
  std::optional<Word> current_word;
  bool word_shown = false;
  std::set<HintType> used_hints;
  // word_number of the current word; the candidate stream resumes after it.
  std::optional<int> cursor;
  std::optional<HintType> hint_target;
  std::optional<SessionPhase> hint_return_phase;
  int words_answered = 0;
  int words_known = 0;
  int answers_with_hints = 0;
};

class SessionStateStore {
public:
  virtual ~SessionStateStore() = default;

  virtual std::optional<SessionState> load(const std::string& session_id) const = 0;
  virtual std::optional<SessionState> find_for_user(const std::string& user_id) const = 0;
  virtual void save(const SessionState& state) = 0;
  virtual void erase(const std::string& session_id) = 0;
};

class MemorySessionStateStore : public SessionStateStore {
public:
  std::optional<SessionState> load(const std::string& session_id) const override;
  std::optional<SessionState> find_for_user(const std::string& user_id) const override;
  void save(const SessionState& state) override;
  void erase(const std::string& session_id) override;

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionState> sessions_;
};

} // namespace vocab
