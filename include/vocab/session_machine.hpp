#pragma once

#include "../../scheduling/score_updater.hpp"
#include "../../selection/word_selector.hpp"
#include "config.hpp"
#include "date.hpp"
#include "session_state.hpp"
#include "settings_provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vocab {

enum class SessionAction {
  Reveal,
  Answer,
  UseHint,
  BeginHint,
  SubmitHint,
  CancelHint,
  ToggleSkip
};

std::string to_string(SessionAction action);

bool transition_allowed(SessionPhase from, SessionAction action);

// Throws InvalidSessionState when the action is not allowed from the
// current phase.
void require_transition(const SessionState& state, SessionAction action);

// Drives one study session. Operates on a SessionState value owned by the
// caller; on exception the caller's copy must be discarded.
class SessionMachine {
public:
  SessionMachine(const WordCatalog& catalog, ProgressStore& progress,
                 const SettingsProvider& settings, const Clock& clock,
                 const EngineConfig& config = {});

  SessionState start(std::string session_id, const std::string& user_id,
                     const std::string& language_id);

  void reveal(SessionState& state) const;

  ProgressRecord answer(SessionState& state, int score);

  void use_hint(SessionState& state, HintType type) const;

  void begin_hint(SessionState& state, HintType type) const;

  ProgressRecord submit_hint(SessionState& state, const std::string& text);

  void cancel_hint(SessionState& state) const;

  ProgressRecord toggle_skip(SessionState& state);

  std::optional<ProgressRecord> current_progress(const SessionState& state) const;

  // Hint types enabled in the session settings, in display order.
  std::vector<HintType> available_hints(const SessionState& state) const;

private:
  std::optional<selection::Candidate> pick_next(const SessionState& state) const;
  void move_to(SessionState& state, std::optional<selection::Candidate> candidate) const;

  const WordCatalog& catalog_;
  ProgressStore& progress_;
  const SettingsProvider& settings_;
  const Clock& clock_;
  selection::WordSelector selector_;
  scheduling::ScoreUpdater scorer_;
};

} // namespace vocab
