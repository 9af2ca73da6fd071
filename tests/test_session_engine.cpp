#include "../include/vocab/memory_backend.hpp"
#include "../include/vocab/session_engine.hpp"
#include "../include/vocab/session_machine.hpp"

#include "../src/json_bridge.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace {

using vocab_test::TestSuite;

const vocab::Date kDayOne = vocab::Date::from_ymd(2024, 4, 1);

// Memory store that raises StoreUnavailable on demand.
class FailingProgressStore : public vocab::ProgressStore {
public:
  bool fail_get_many = false;
  bool fail_upsert = false;

  std::optional<vocab::ProgressRecord> get(const std::string& user_id,
                                           const std::string& word_id) const override {
    return inner.get(user_id, word_id);
  }

  std::unordered_map<std::string, vocab::ProgressRecord> get_many(
      const std::string& user_id, const std::vector<std::string>& word_ids) const override {
    if (fail_get_many) {
      throw vocab::StoreUnavailable("progress read failed");
    }
    return inner.get_many(user_id, word_ids);
  }

  vocab::ProgressRecord upsert(const std::string& user_id, const std::string& word_id,
                               const std::string& language_id, const vocab::ProgressPatch& patch,
                               vocab::Timestamp now) override {
    if (fail_upsert) {
      throw vocab::StoreUnavailable("progress write failed");
    }
    return inner.upsert(user_id, word_id, language_id, patch, now);
  }

  std::set<std::string> due_word_ids(const std::string& user_id, const std::string& language_id,
                                     vocab::Date as_of) const override {
    return inner.due_word_ids(user_id, language_id, as_of);
  }

  std::vector<vocab::ProgressRecord> records_for(const std::string& user_id,
                                                 const std::string& language_id) const override {
    return inner.records_for(user_id, language_id);
  }

  vocab::MemoryProgressStore inner;
};

template <typename Store = vocab::MemoryProgressStore>
struct BasicFixture {
  vocab::MemoryWordCatalog catalog;
  Store progress;
  vocab::MemorySettingsProvider settings;
  vocab::MemorySessionStateStore sessions;
  vocab::FixedClock clock{kDayOne};
  std::unique_ptr<vocab::SessionEngine> engine;

  explicit BasicFixture(int words, vocab::EngineConfig config = {}) {
    vocab_test::seed_words(catalog, "en", 1, words);
    engine = vocab::make_engine(vocab::EngineDeps{catalog, progress, settings, sessions, clock},
                                config);
  }
};

using Fixture = BasicFixture<>;

const vocab::StudyCard* card_of(const vocab::SessionEngine::Current& current) {
  return std::get_if<vocab::StudyCard>(&current);
}

bool has_hint(const std::vector<vocab::HintType>& hints, vocab::HintType type) {
  return std::find(hints.begin(), hints.end(), type) != hints.end();
}

void test_transition_table(TestSuite& suite) {
  using vocab::SessionAction;
  using vocab::SessionPhase;
  suite.require(vocab::transition_allowed(SessionPhase::Studying, SessionAction::Reveal),
                "reveal allowed while studying");
  suite.require(!vocab::transition_allowed(SessionPhase::Studying, SessionAction::Answer),
                "answer not allowed before reveal");
  suite.require(vocab::transition_allowed(SessionPhase::ViewingWordDetails, SessionAction::Answer),
                "answer allowed while viewing details");
  suite.require(!vocab::transition_allowed(SessionPhase::CreatingHint, SessionAction::Answer),
                "answer not allowed while writing a hint");
  suite.require(vocab::transition_allowed(SessionPhase::EditingHint, SessionAction::SubmitHint),
                "submit allowed while editing");
  suite.require(!vocab::transition_allowed(SessionPhase::Studying, SessionAction::CancelHint),
                "cancel needs a hint in progress");
  suite.require(!vocab::transition_allowed(SessionPhase::Completed, SessionAction::ToggleSkip),
                "nothing allowed once completed");
}

void test_study_loop(TestSuite& suite) {
  Fixture fx(3);
  auto session = fx.engine->begin_session("u1", "en");
  auto current = fx.engine->current_word(session);
  const auto* card = card_of(current);
  suite.require(card != nullptr, "first call returns a study card");
  if (!card) {
    return;
  }
  suite.require(card->word.word_number == 1, "session starts at word 1");
  suite.require(card->phase == vocab::SessionPhase::Studying && !card->word_shown,
                "word starts hidden in Studying");
  suite.require(!card->progress.has_value(), "new word has no progress record");
  suite.require(card->available_hints.size() == 4, "all hint types visible by default");

  suite.require_throws<vocab::InvalidSessionState>(
      [&] { fx.engine->record_answer(session, 1); }, "answer before reveal rejected");

  current = fx.engine->reveal(session);
  card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::ViewingWordDetails && card->word_shown,
                "reveal shows the word");
  suite.require(!fx.progress.get("u1", "en-w1").has_value(), "reveal writes nothing");
  current = fx.engine->reveal(session);
  card = card_of(current);
  suite.require(card && card->word.word_number == 1 &&
                    card->phase == vocab::SessionPhase::ViewingWordDetails,
                "second reveal is a no-op");

  suite.require_throws<std::invalid_argument>([&] { fx.engine->record_answer(session, 7); },
                                              "score outside 0/1 rejected");
  current = fx.engine->current_word(session);
  card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::ViewingWordDetails,
                "failed answer leaves the session unchanged");

  current = fx.engine->record_answer(session, 1);
  card = card_of(current);
  suite.require(card && card->word.word_number == 2 && !card->word_shown &&
                    card->phase == vocab::SessionPhase::Studying,
                "answer advances to the next word");
  auto record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->score == 1 && record->check_interval == 1 &&
                    record->next_check_date == kDayOne + 1,
                "known answer schedules tomorrow");

  fx.engine->reveal(session);
  current = fx.engine->record_answer(session, 0);
  card = card_of(current);
  suite.require(card && card->word.word_number == 3, "unknown answer still advances");

  fx.engine->reveal(session);
  current = fx.engine->record_answer(session, 1);
  const auto* done = std::get_if<vocab::SessionCompleted>(&current);
  suite.require(done != nullptr, "last answer completes the session");
  if (done) {
    suite.require(done->words_answered == 3 && done->words_known == 2,
                  "completion carries counters");
  }
  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->reveal(session); },
                                                   "no reveal once completed");
  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->toggle_skip(session); },
                                                   "no skip once completed");

  auto ended = fx.engine->end_session(session);
  suite.require(ended.words_answered == 3, "end_session returns counters");
  suite.require(fx.sessions.size() == 0, "end_session drops the state");
  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->current_word(session); },
                                                   "ended handle is unknown");

  auto next_day = fx.engine->begin_session("u1", "en");
  current = fx.engine->current_word(next_day);
  suite.require(std::holds_alternative<vocab::SessionCompleted>(current),
                "nothing is due again on the same day");
  fx.clock.advance_days(1);
  auto tomorrow = fx.engine->begin_session("u1", "en");
  current = fx.engine->current_word(tomorrow);
  card = card_of(current);
  suite.require(card && card->word.word_number == 1 && card->progress.has_value(),
                "reviewed word comes back on its check date");
}

void test_hint_penalty_scenario(TestSuite& suite) {
  Fixture fx(2);
  auto session = fx.engine->begin_session("u1", "en");
  fx.engine->reveal(session);
  fx.engine->record_answer(session, 1);
  auto record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->score == 1 && record->check_interval == 1,
                "day one: known answer gives interval 1");

  fx.clock.advance_days(1);
  session = fx.engine->begin_session("u1", "en");
  auto current = fx.engine->record_hint_use(session, vocab::HintType::Meaning);
  const auto* card = card_of(current);
  suite.require(card && card->word.word_number == 1 &&
                    has_hint(card->used_hints, vocab::HintType::Meaning),
                "day two: hint use is recorded on the card");
  suite.require(fx.progress.get("u1", "en-w1")->score == 1, "hint use alone writes nothing");

  fx.engine->reveal(session);
  current = fx.engine->record_answer(session, 1);
  record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->score == 0 && record->check_interval == 1 &&
                    record->next_check_date == kDayOne + 2,
                "day two: answer after a hint scores 0 with interval 1");
  card = card_of(current);
  suite.require(card && card->used_hints.empty(), "used hints reset on the next word");

  auto ended = fx.engine->end_session(session);
  suite.require(ended.answers_with_hints == 1 && ended.words_known == 0,
                "hinted answer counted, not known");
}

void test_same_day_repeats(TestSuite& suite) {
  Fixture fx(1);
  vocab::UserLanguageSettings settings;
  settings.user_id = "u1";
  settings.language_id = "en";
  settings.use_check_date = false;
  fx.settings.put(settings);

  for (int i = 0; i < 6; ++i) {
    auto session = fx.engine->begin_session("u1", "en");
    fx.engine->reveal(session);
    fx.engine->record_answer(session, 1);
  }
  auto record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->check_interval == 1 && record->next_check_date == kDayOne + 1,
                "known answers repeated on one day keep the first schedule");

  fx.clock.advance_days(1);
  auto session = fx.engine->begin_session("u1", "en");
  fx.engine->reveal(session);
  fx.engine->record_answer(session, 1);
  record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->check_interval == 2 && record->next_check_date == kDayOne + 3,
                "answer on the check date doubles the interval");
}

vocab::SessionPhase phase_of(const vocab::MemorySessionStateStore& sessions,
                             const std::string& session_id) {
  auto state = sessions.load(session_id);
  return state ? state->phase : vocab::SessionPhase::Completed;
}

void test_answer_with_failing_reads(TestSuite& suite) {
  BasicFixture<FailingProgressStore> fx(2);
  auto session = fx.engine->begin_session("u1", "en");
  fx.engine->reveal(session);

  fx.progress.fail_get_many = true;
  suite.require_throws<vocab::StoreUnavailable>([&] { fx.engine->record_answer(session, 1); },
                                                "answer reports the failed read");
  suite.require(!fx.progress.inner.get("u1", "en-w1").has_value(),
                "failed answer stores no score");
  auto state = fx.sessions.load(session);
  suite.require(state && state->phase == vocab::SessionPhase::ViewingWordDetails &&
                    state->current_word && state->current_word->id == "en-w1" &&
                    state->words_answered == 0,
                "failed answer leaves the saved session on the same word");

  fx.progress.fail_get_many = false;
  auto current = fx.engine->record_answer(session, 1);
  const auto* card = card_of(current);
  suite.require(card && card->word.word_number == 2, "retried answer advances");
  auto record = fx.progress.inner.get("u1", "en-w1");
  suite.require(record && record->check_interval == 1 && record->next_check_date == kDayOne + 1,
                "retried answer is scored once");
}

void test_failed_writes(TestSuite& suite) {
  BasicFixture<FailingProgressStore> fx(2);
  auto session = fx.engine->begin_session("u1", "en");
  fx.engine->reveal(session);

  fx.progress.fail_upsert = true;
  suite.require_throws<vocab::StoreUnavailable>([&] { fx.engine->record_answer(session, 1); },
                                                "answer reports the failed write");
  auto state = fx.sessions.load(session);
  suite.require(state && state->phase == vocab::SessionPhase::ViewingWordDetails &&
                    state->current_word && state->current_word->id == "en-w1" &&
                    state->words_answered == 0 && state->words_known == 0,
                "failed answer write keeps the session");

  suite.require_throws<vocab::StoreUnavailable>([&] { fx.engine->toggle_skip(session); },
                                                "toggle_skip reports the failed write");
  suite.require(phase_of(fx.sessions, session) == vocab::SessionPhase::ViewingWordDetails,
                "failed toggle_skip keeps the phase");

  fx.progress.fail_upsert = false;
  fx.engine->begin_hint(session, vocab::HintType::Meaning);
  fx.progress.fail_upsert = true;
  suite.require_throws<vocab::StoreUnavailable>(
      [&] { fx.engine->submit_hint(session, "a small moon"); },
      "submit_hint reports the failed write");
  state = fx.sessions.load(session);
  suite.require(state && state->phase == vocab::SessionPhase::CreatingHint &&
                    state->hint_target == vocab::HintType::Meaning && state->used_hints.empty(),
                "failed submit keeps the hint open and unused");
  suite.require(!fx.progress.inner.get("u1", "en-w1").has_value(),
                "failed writes leave no record");

  fx.progress.fail_upsert = false;
  auto current = fx.engine->submit_hint(session, "a small moon");
  const auto* card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::ViewingWordDetails &&
                    has_hint(card->used_hints, vocab::HintType::Meaning),
                "submit succeeds once the store recovers");
  current = fx.engine->record_answer(session, 1);
  card = card_of(current);
  auto record = fx.progress.inner.get("u1", "en-w1");
  suite.require(card && card->word.word_number == 2 && record && record->score == 0 &&
                    record->check_interval == 1 && !record->is_skipped,
                "answer after recovery is scored once with the hint penalty");
}

void test_hint_editing(TestSuite& suite) {
  Fixture fx(2);
  auto session = fx.engine->begin_session("u1", "en");

  auto current = fx.engine->begin_hint(session, vocab::HintType::PhoneticSound);
  const auto* card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::CreatingHint &&
                    card->hint_target == vocab::HintType::PhoneticSound,
                "begin_hint without text enters CreatingHint");
  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->reveal(session); },
                                                   "reveal blocked while creating a hint");

  current = fx.engine->submit_hint(session, "rhymes with 'one'");
  card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::Studying && !card->hint_target,
                "submit returns to the phase the hint began from");
  suite.require(card && has_hint(card->used_hints, vocab::HintType::PhoneticSound),
                "submitted hint counts as used");
  auto record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->hint_phoneticsound == std::optional<std::string>("rhymes with 'one'"),
                "hint text written to progress");
  suite.require(record && !record->next_check_date.has_value(),
                "writing a hint does not schedule the word");

  fx.engine->reveal(session);
  current = fx.engine->begin_hint(session, vocab::HintType::PhoneticSound);
  card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::EditingHint,
                "existing text enters EditingHint");
  current = fx.engine->cancel_hint(session);
  card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::ViewingWordDetails,
                "cancel returns to ViewingWordDetails");
  record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->hint_phoneticsound.has_value(), "cancel writes nothing");

  fx.engine->begin_hint(session, vocab::HintType::PhoneticSound);
  fx.engine->submit_hint(session, "");
  record = fx.progress.get("u1", "en-w1");
  suite.require(record && !record->hint_phoneticsound.has_value(), "empty submit clears the hint");

  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->cancel_hint(session); },
                                                   "cancel without a hint in progress");
}

void test_hidden_hints(TestSuite& suite) {
  Fixture fx(2);
  vocab::UserLanguageSettings settings;
  settings.user_id = "u1";
  settings.language_id = "en";
  settings.show_hint_writing = false;
  fx.settings.put(settings);

  auto session = fx.engine->begin_session("u1", "en");
  auto current = fx.engine->current_word(session);
  const auto* card = card_of(current);
  suite.require(card && card->available_hints.size() == 3 &&
                    !has_hint(card->available_hints, vocab::HintType::Writing),
                "hidden hint type not offered");
  suite.require_throws<vocab::InvalidSessionState>(
      [&] { fx.engine->record_hint_use(session, vocab::HintType::Writing); },
      "hidden hint type rejected");
  suite.require_throws<vocab::InvalidSessionState>(
      [&] { fx.engine->begin_hint(session, vocab::HintType::Writing); },
      "hidden hint type cannot be edited");
}

void test_toggle_skip(TestSuite& suite) {
  Fixture fx(3);
  vocab::UserLanguageSettings settings;
  settings.user_id = "u1";
  settings.language_id = "en";
  settings.skip_marked = true;
  fx.settings.put(settings);

  auto session = fx.engine->begin_session("u1", "en");
  auto current = fx.engine->toggle_skip(session);
  const auto* card = card_of(current);
  suite.require(card && card->word.word_number == 1 && card->progress &&
                    card->progress->is_skipped,
                "toggle_skip marks the current word");
  auto record = fx.progress.get("u1", "en-w1");
  suite.require(record && record->score == 0 && record->check_interval == 0 &&
                    !record->next_check_date.has_value(),
                "skipping leaves score and schedule alone");

  auto fresh = fx.engine->begin_session("u1", "en");
  current = fx.engine->current_word(fresh);
  card = card_of(current);
  suite.require(card && card->word.word_number == 2, "skipped word excluded by skip_marked");

  fx.engine->reveal(fresh);
  fx.engine->record_answer(fresh, 1);
  fx.engine->reveal(fresh);
  current = fx.engine->toggle_skip(fresh);
  card = card_of(current);
  suite.require(card && card->phase == vocab::SessionPhase::ViewingWordDetails,
                "toggle_skip keeps the phase");
  current = fx.engine->toggle_skip(fresh);
  card = card_of(current);
  suite.require(card && card->progress && !card->progress->is_skipped,
                "second toggle clears the flag");
}

void test_sessions_and_errors(TestSuite& suite) {
  Fixture fx(2);
  auto first = fx.engine->begin_session("u1", "en");
  auto second = fx.engine->begin_session("u1", "en");
  suite.require(first != second, "each session gets a new handle");
  suite.require(first.rfind("sess-u1-", 0) == 0, "handle names the user");

  vocab::MemorySessionStateStore shared;
  auto engine_a = vocab::make_engine(
      vocab::EngineDeps{fx.catalog, fx.progress, fx.settings, shared, fx.clock});
  auto stale = engine_a->begin_session("u9", "en");
  engine_a->end_session(stale);
  auto engine_b = vocab::make_engine(
      vocab::EngineDeps{fx.catalog, fx.progress, fx.settings, shared, fx.clock});
  auto fresh = engine_b->begin_session("u9", "en");
  suite.require(fresh != stale, "a new engine never reissues an earlier handle");
  suite.require_throws<vocab::InvalidSessionState>([&] { engine_b->current_word(stale); },
                                                   "earlier handle does not reach the new session");
  suite.require(fx.engine->session_for_user("u1") == second, "latest session belongs to user");
  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->current_word(first); },
                                                   "replaced session is gone");
  suite.require_throws<vocab::InvalidSessionState>([&] { fx.engine->reveal("sess-nope"); },
                                                   "unknown handle rejected");
  suite.require(!fx.engine->session_for_user("u2").has_value(), "no session for other users");

  suite.require_throws<vocab::NotFound>([&] { fx.engine->begin_session("u1", "xx"); },
                                        "unknown language rejected");

  vocab::UserLanguageSettings bad;
  bad.user_id = "u3";
  bad.language_id = "en";
  bad.start_word = 0;
  fx.settings.put(bad);
  suite.require_throws<vocab::SettingsInvalid>([&] { fx.engine->begin_session("u3", "en"); },
                                               "start_word 0 rejected");

  vocab::UserLanguageSettings late;
  late.user_id = "u4";
  late.language_id = "en";
  late.start_word = 2;
  fx.settings.put(late);
  auto session = fx.engine->begin_session("u4", "en");
  auto current = fx.engine->current_word(session);
  const auto* card = card_of(current);
  suite.require(card && card->word.word_number == 2, "session honours start_word");

  vocab::EngineConfig bad_config;
  bad_config.page_size = 0;
  suite.require_throws<std::invalid_argument>(
      [&] {
        vocab::make_engine(vocab::EngineDeps{fx.catalog, fx.progress, fx.settings, fx.sessions,
                                             fx.clock},
                           bad_config);
      },
      "invalid config rejected");
}

void test_state_json_and_debug(TestSuite& suite) {
  vocab::EngineConfig config;
  config.page_size = 1;
  Fixture fx(4, config);
  auto session = fx.engine->begin_session("u1", "en");
  fx.engine->reveal(session);
  fx.engine->record_answer(session, 1);
  fx.engine->record_hint_use(session, vocab::HintType::Writing);
  fx.engine->reveal(session);
  fx.engine->begin_hint(session, vocab::HintType::Meaning);

  auto state = fx.sessions.load(session);
  suite.require(state.has_value(), "state stored under its handle");
  if (!state) {
    return;
  }
  auto restored = vocab::bridge::session_state_from_json(vocab::bridge::to_json(*state));
  suite.require(restored.session_id == state->session_id && restored.phase == state->phase &&
                    restored.cursor == state->cursor && restored.used_hints == state->used_hints &&
                    restored.hint_target == state->hint_target &&
                    restored.hint_return_phase == state->hint_return_phase &&
                    restored.words_answered == 1 && restored.current_word &&
                    restored.current_word->id == "en-w2",
                "session state survives a JSON round trip");

  auto info = fx.engine->debug_state(session);
  suite.require(info["session"]["phase"] == "creating_hint", "debug state shows the phase");
  suite.require(info["page_size"] == 1 && info["today"] == kDayOne.to_string(),
                "debug state shows config and day");

  auto summary = fx.engine->progress_summary("u1", "en");
  suite.require(summary.total == 4 && summary.studied == 1 && summary.known == 1 &&
                    summary.percentage == 25.0,
                "engine exposes the progress summary");
}

} // namespace

int main() {
  TestSuite suite;
  test_transition_table(suite);
  test_study_loop(suite);
  test_hint_penalty_scenario(suite);
  test_same_day_repeats(suite);
  test_answer_with_failing_reads(suite);
  test_failed_writes(suite);
  test_hint_editing(suite);
  test_hidden_hints(suite);
  test_toggle_skip(suite);
  test_sessions_and_errors(suite);
  test_state_json_and_debug(suite);
  if (!suite.ok) {
    return 1;
  }
  std::cout << "session engine tests passed" << std::endl;
  return 0;
}
