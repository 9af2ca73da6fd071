#include "vocab/session_machine.hpp"

#include "../src/log.hpp"

#include <array>
#include <utility>

namespace vocab {

namespace {

struct Transition {
  SessionAction action;
  std::array<bool, 5> from;  // indexed by SessionPhase
};

// Columns: Studying, ViewingWordDetails, CreatingHint, EditingHint, Completed.
constexpr std::array<Transition, 7> kTransitions = {{
    {SessionAction::Reveal, {true, true, false, false, false}},
    {SessionAction::Answer, {false, true, false, false, false}},
    {SessionAction::UseHint, {true, true, false, false, false}},
    {SessionAction::BeginHint, {true, true, false, false, false}},
    {SessionAction::SubmitHint, {false, false, true, true, false}},
    {SessionAction::CancelHint, {false, false, true, true, false}},
    {SessionAction::ToggleSkip, {true, true, true, true, false}},
}};

const Word& require_word(const SessionState& state) {
  if (!state.current_word.has_value()) {
    throw InvalidSessionState("Session " + state.session_id + " has no current word");
  }
  return *state.current_word;
}

void require_visible(const SessionState& state, HintType type) {
  if (!state.settings.hint_visible(type)) {
    throw InvalidSessionState("Hint type " + to_string(type) + " is disabled for user " +
                              state.user_id);
  }
}

void clear_word(SessionState& state) {
  state.word_shown = false;
  state.used_hints.clear();
  state.hint_target.reset();
  state.hint_return_phase.reset();
}

} // namespace

std::string to_string(SessionAction action) {
  switch (action) {
    case SessionAction::Reveal: return "reveal";
    case SessionAction::Answer: return "answer";
    case SessionAction::UseHint: return "use_hint";
    case SessionAction::BeginHint: return "begin_hint";
    case SessionAction::SubmitHint: return "submit_hint";
    case SessionAction::CancelHint: return "cancel_hint";
    case SessionAction::ToggleSkip: return "toggle_skip";
  }
  return "reveal";
}

bool transition_allowed(SessionPhase from, SessionAction action) {
  for (const auto& transition : kTransitions) {
    if (transition.action == action) {
      return transition.from[static_cast<std::size_t>(from)];
    }
  }
  return false;
}

void require_transition(const SessionState& state, SessionAction action) {
  if (!transition_allowed(state.phase, action)) {
    throw InvalidSessionState("Cannot " + to_string(action) + " while session " +
                              state.session_id + " is " + to_string(state.phase));
  }
}

SessionMachine::SessionMachine(const WordCatalog& catalog, ProgressStore& progress,
                               const SettingsProvider& settings, const Clock& clock,
                               const EngineConfig& config)
    : catalog_(catalog),
      progress_(progress),
      settings_(settings),
      clock_(clock),
      selector_(catalog, progress, config.page_size),
      scorer_(progress, config.max_interval_days) {}

SessionState SessionMachine::start(std::string session_id, const std::string& user_id,
                                   const std::string& language_id) {
  auto settings = settings_.get(user_id, language_id);
  settings.user_id = user_id;
  settings.language_id = language_id;
  settings.validate();
  if (!catalog_.has_language(language_id)) {
    throw NotFound("Unknown language id: " + language_id);
  }

  SessionState state;
  state.session_id = std::move(session_id);
  state.user_id = user_id;
  state.language_id = language_id;
  state.settings = std::move(settings);
  move_to(state, pick_next(state));

  logging::logger()->info("session {} started for user {} language {} at word #{}",
                          state.session_id, user_id, language_id,
                          state.cursor.has_value() ? *state.cursor : 0);
  return state;
}

std::optional<selection::Candidate> SessionMachine::pick_next(const SessionState& state) const {
  auto stream = selector_.next_candidates(state.user_id, state.language_id, state.settings,
                                          clock_.today());
  if (state.cursor.has_value()) {
    stream.resume_after(*state.cursor);
  }
  auto candidate = stream.next();
  if (candidate.has_value() && logging::debug_session_enabled()) {
    logging::logger()->debug("session {} next word #{} ({}) after examining {} words",
                             state.session_id, candidate->word.word_number, candidate->word.id,
                             stream.examined());
  }
  return candidate;
}

void SessionMachine::move_to(SessionState& state,
                             std::optional<selection::Candidate> candidate) const {
  clear_word(state);
  if (!candidate.has_value()) {
    state.current_word.reset();
    state.phase = SessionPhase::Completed;
    logging::logger()->info("session {} completed: answered={} known={}", state.session_id,
                            state.words_answered, state.words_known);
    return;
  }
  state.cursor = candidate->word.word_number;
  state.current_word = std::move(candidate->word);
  state.phase = SessionPhase::Studying;
}

void SessionMachine::reveal(SessionState& state) const {
  require_transition(state, SessionAction::Reveal);
  require_word(state);
  state.word_shown = true;
  state.phase = SessionPhase::ViewingWordDetails;
}

ProgressRecord SessionMachine::answer(SessionState& state, int score) {
  require_transition(state, SessionAction::Answer);
  const Word word = require_word(state);
  const bool hint_used = !state.used_hints.empty();

  // Next word is chosen before the score is written; it lies past the
  // cursor, so the write cannot change the choice.
  auto next = pick_next(state);
  auto record = scorer_.apply(state.user_id, word, score, hint_used, clock_.now());

  ++state.words_answered;
  if (record.score == 1) {
    ++state.words_known;
  }
  if (hint_used) {
    ++state.answers_with_hints;
  }
  move_to(state, std::move(next));
  return record;
}

void SessionMachine::use_hint(SessionState& state, HintType type) const {
  require_transition(state, SessionAction::UseHint);
  require_word(state);
  require_visible(state, type);
  state.used_hints.insert(type);
}

void SessionMachine::begin_hint(SessionState& state, HintType type) const {
  require_transition(state, SessionAction::BeginHint);
  const auto& word = require_word(state);
  require_visible(state, type);

  const auto record = progress_.get(state.user_id, word.id);
  const bool has_text = record.has_value() && record->has_hint(type);
  state.hint_return_phase = state.phase;
  state.hint_target = type;
  state.phase = has_text ? SessionPhase::EditingHint : SessionPhase::CreatingHint;
}

ProgressRecord SessionMachine::submit_hint(SessionState& state, const std::string& text) {
  require_transition(state, SessionAction::SubmitHint);
  const auto& word = require_word(state);
  if (!state.hint_target.has_value()) {
    throw InvalidSessionState("Session " + state.session_id + " has no hint being edited");
  }
  const HintType type = *state.hint_target;

  ProgressPatch patch;
  patch.hints[type] = text;
  auto record = progress_.upsert(state.user_id, word.id, word.language_id, patch, clock_.now());

  if (!text.empty()) {
    state.used_hints.insert(type);
  }
  state.phase = state.hint_return_phase.value_or(SessionPhase::Studying);
  state.hint_target.reset();
  state.hint_return_phase.reset();
  return record;
}

void SessionMachine::cancel_hint(SessionState& state) const {
  require_transition(state, SessionAction::CancelHint);
  state.phase = state.hint_return_phase.value_or(SessionPhase::Studying);
  state.hint_target.reset();
  state.hint_return_phase.reset();
}

ProgressRecord SessionMachine::toggle_skip(SessionState& state) {
  require_transition(state, SessionAction::ToggleSkip);
  const auto& word = require_word(state);

  const auto previous = progress_.get(state.user_id, word.id);
  ProgressPatch patch;
  patch.is_skipped = !(previous.has_value() && previous->is_skipped);
  auto record = progress_.upsert(state.user_id, word.id, word.language_id, patch, clock_.now());
  logging::logger()->debug("session {} word {} skipped={}", state.session_id, word.id,
                           record.is_skipped);
  return record;
}

std::optional<ProgressRecord> SessionMachine::current_progress(const SessionState& state) const {
  if (!state.current_word.has_value()) {
    return std::nullopt;
  }
  return progress_.get(state.user_id, state.current_word->id);
}

std::vector<HintType> SessionMachine::available_hints(const SessionState& state) const {
  std::vector<HintType> hints;
  for (HintType type : all_hint_types()) {
    if (state.settings.hint_visible(type)) {
      hints.push_back(type);
    }
  }
  return hints;
}

} // namespace vocab
